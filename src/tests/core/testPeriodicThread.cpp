#include <atomic>
#include <chrono>
#include <iostream>
#include <thread>

#include <core/PeriodicThread.hpp>
#include <core/TestHelpers.hpp>


using namespace rapidflash;


void
testPeriodicCalls()
{
    std::atomic<size_t> callCount{ 0 };
    {
        PeriodicThread thread( [&callCount] () { ++callCount; }, std::chrono::milliseconds( 10 ) );
        std::this_thread::sleep_for( std::chrono::milliseconds( 200 ) );
    }
    /* The exact number depends on the scheduler, but it must have been called repeatedly. */
    REQUIRE( callCount >= 3 );
}


void
testStopIsImmediate()
{
    std::atomic<size_t> callCount{ 0 };
    const auto t0 = std::chrono::steady_clock::now();
    {
        PeriodicThread thread( [&callCount] () { ++callCount; }, std::chrono::hours( 1 ) );
        thread.stop();
        /* Stopping twice is fine. */
        thread.stop();
    }
    const auto elapsed = std::chrono::steady_clock::now() - t0;
    REQUIRE( elapsed < std::chrono::seconds( 10 ) );

    /* Once at the start and once after stopping. */
    REQUIRE_EQUAL( callCount.load(), size_t( 2 ) );
}


int
main()
{
    testPeriodicCalls();
    testStopIsImmediate();

    std::cout << "Tests successful: " << ( gnTests - gnTestErrors ) << " / " << gnTests << "\n";

    return gnTestErrors == 0 ? 0 : 1;
}
