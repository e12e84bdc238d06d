#include <atomic>
#include <chrono>
#include <iostream>
#include <thread>
#include <vector>

#include <core/TestHelpers.hpp>
#include <rapidflash/ProgressTracker.hpp>


using namespace rapidflash;


void
testFraction()
{
    ProgressTracker progress;
    REQUIRE_EQUAL( progress.fractionComplete(), 0.0 );
    progress.recordWritten( 100 );
    /* Unknown total */
    REQUIRE_EQUAL( progress.fractionComplete(), 0.0 );

    progress.setTotal( 400 );
    REQUIRE_EQUAL( progress.fractionComplete(), 0.25 );

    progress.recordWritten( 300 );
    REQUIRE_EQUAL( progress.fractionComplete(), 1.0 );

    /* Clamped when more was written than expected. */
    progress.recordWritten( 1000 );
    REQUIRE_EQUAL( progress.fractionComplete(), 1.0 );
    REQUIRE_EQUAL( progress.bytesWritten(), uint64_t( 1400 ) );

    progress.setTotal( 2800 );
    REQUIRE_EQUAL( progress.fractionComplete(), 0.5 );
    REQUIRE_EQUAL( progress.totalBytes(), uint64_t( 2800 ) );

    ProgressTracker withTotal( 1000 );
    REQUIRE_EQUAL( withTotal.totalBytes(), uint64_t( 1000 ) );
    REQUIRE_EQUAL( withTotal.fractionComplete(), 0.0 );
}


void
testTiming()
{
    ProgressTracker progress( 10_Mi );
    REQUIRE( progress.elapsed() >= 0 );

    std::this_thread::sleep_for( std::chrono::milliseconds( 50 ) );
    progress.recordWritten( 1_Mi );

    const auto elapsed = progress.elapsed();
    REQUIRE( elapsed >= 0.04 );
    const auto throughput = progress.throughput();
    REQUIRE( throughput > 0 );
    /* The elapsed time can only have grown since it was queried. */
    REQUIRE( throughput <= 1_Mi / elapsed );

    const auto snapshot = progress.snapshot();
    REQUIRE_EQUAL( snapshot.bytesWritten, uint64_t( 1_Mi ) );
    REQUIRE_EQUAL( snapshot.totalBytes, uint64_t( 10_Mi ) );
    REQUIRE_EQUAL( snapshot.fractionComplete, 0.1 );
    REQUIRE( snapshot.elapsedSeconds >= elapsed );
    REQUIRE( snapshot.throughputBytesPerSecond > 0 );
}


void
testReset()
{
    ProgressTracker progress( 1000 );
    progress.recordWritten( 500 );
    std::this_thread::sleep_for( std::chrono::milliseconds( 100 ) );
    REQUIRE( progress.elapsed() >= 0.09 );

    progress.reset();
    REQUIRE_EQUAL( progress.bytesWritten(), uint64_t( 0 ) );
    REQUIRE_EQUAL( progress.totalBytes(), uint64_t( 0 ) );
    REQUIRE_EQUAL( progress.fractionComplete(), 0.0 );
    REQUIRE( progress.elapsed() < 0.09 );
}


void
testConcurrentObservers()
{
    constexpr uint64_t TOTAL = 100'000;
    ProgressTracker progress( TOTAL );

    std::atomic<bool> finished{ false };
    std::atomic<size_t> inconsistentSnapshots{ 0 };
    std::vector<std::thread> observers;
    for ( size_t i = 0; i < 4; ++i ) {
        observers.emplace_back( [&] () {
            uint64_t lastWritten{ 0 };
            while ( !finished ) {
                const auto snapshot = progress.snapshot();
                if ( ( snapshot.fractionComplete < 0 ) || ( snapshot.fractionComplete > 1 )
                     || ( snapshot.bytesWritten < lastWritten ) || ( snapshot.bytesWritten > snapshot.totalBytes ) ) {
                    ++inconsistentSnapshots;
                }
                lastWritten = snapshot.bytesWritten;
            }
        } );
    }

    for ( uint64_t i = 0; i < TOTAL; ++i ) {
        progress.recordWritten( 1 );
    }
    finished = true;

    for ( auto& observer : observers ) {
        observer.join();
    }

    REQUIRE_EQUAL( inconsistentSnapshots.load(), size_t( 0 ) );
    REQUIRE_EQUAL( progress.bytesWritten(), TOTAL );
    REQUIRE_EQUAL( progress.fractionComplete(), 1.0 );
}


int
main()
{
    testFraction();
    testTiming();
    testReset();
    testConcurrentObservers();

    std::cout << "Tests successful: " << ( gnTests - gnTestErrors ) << " / " << gnTests << "\n";

    return gnTestErrors == 0 ? 0 : 1;
}
