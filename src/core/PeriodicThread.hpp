#pragma once

#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <thread>
#include <utility>


namespace rapidflash
{
/**
 * Calls the given functor every @p interval on a separate thread until @ref stop is called or the object is
 * destroyed. The thread is joined in the destructor. Stopping wakes up the thread
 * immediately instead of waiting for the rest of the interval. The functor is called once right after starting
 * and one last time after stopping so that observers can print the final state.
 */
class PeriodicThread
{
public:
    PeriodicThread( std::function<void()>     functor,
                    std::chrono::milliseconds interval ) :
        m_functor( std::move( functor ) ),
        m_interval( interval ),
        m_thread( [this] () { loop(); } )
    {}

    PeriodicThread( PeriodicThread&& ) = delete;

    PeriodicThread( const PeriodicThread& ) = delete;

    PeriodicThread&
    operator=( PeriodicThread&& ) = delete;

    PeriodicThread&
    operator=( const PeriodicThread& ) = delete;

    ~PeriodicThread()
    {
        stop();
    }

    void
    stop()
    {
        {
            const std::scoped_lock lock( m_mutex );
            m_stopRequested = true;
        }
        m_stopChanged.notify_all();

        if ( m_thread.joinable() ) {
            m_thread.join();
        }
    }

private:
    void
    loop()
    {
        while ( true ) {
            m_functor();

            std::unique_lock lock( m_mutex );
            m_stopChanged.wait_for( lock, m_interval, [this] () { return m_stopRequested; } );
            if ( m_stopRequested ) {
                break;
            }
        }
        m_functor();
    }

private:
    const std::function<void()> m_functor;
    const std::chrono::milliseconds m_interval;

    std::mutex m_mutex;
    std::condition_variable m_stopChanged;
    bool m_stopRequested{ false };

    /* Must be initialized last because it starts accessing the other members immediately. */
    std::thread m_thread;
};
}  // namespace rapidflash
