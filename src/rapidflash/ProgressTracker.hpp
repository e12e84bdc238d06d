#pragma once

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <mutex>

#include <core/common.hpp>


namespace rapidflash
{
struct ProgressSnapshot
{
    double elapsedSeconds{ 0 };
    /** In [0, 1]. */
    double fractionComplete{ 0 };
    double throughputBytesPerSecond{ 0 };
    uint64_t bytesWritten{ 0 };
    uint64_t totalBytes{ 0 };
};


/**
 * Progress of one flash operation. Written by the flashing thread and read by any number of observer
 * threads, e.g., for printing a progress line. The lock is only held for copying or changing the members.
 */
class ProgressTracker
{
public:
    using Clock = std::chrono::steady_clock;

public:
    explicit
    ProgressTracker( uint64_t totalBytes = 0 ) :
        m_totalBytes( totalBytes )
    {}

    void
    recordWritten( uint64_t nBytes )
    {
        const std::scoped_lock lock( m_mutex );
        m_bytesWritten = saturatingAddition( m_bytesWritten, nBytes );
    }

    void
    setTotal( uint64_t totalBytes )
    {
        const std::scoped_lock lock( m_mutex );
        m_totalBytes = totalBytes;
    }

    /**
     * Returns to the initial state with a new start time. Used to clear the progress after a failed operation.
     */
    void
    reset()
    {
        const std::scoped_lock lock( m_mutex );
        m_bytesWritten = 0;
        m_totalBytes = 0;
        m_startTime = Clock::now();
    }

    [[nodiscard]] double
    elapsed() const
    {
        const std::scoped_lock lock( m_mutex );
        return duration( m_startTime, Clock::now() );
    }

    [[nodiscard]] double
    fractionComplete() const
    {
        const std::scoped_lock lock( m_mutex );
        return computeFraction( m_bytesWritten, m_totalBytes );
    }

    [[nodiscard]] double
    throughput() const
    {
        const std::scoped_lock lock( m_mutex );
        return computeThroughput( m_bytesWritten, duration( m_startTime, Clock::now() ) );
    }

    [[nodiscard]] uint64_t
    bytesWritten() const
    {
        const std::scoped_lock lock( m_mutex );
        return m_bytesWritten;
    }

    [[nodiscard]] uint64_t
    totalBytes() const
    {
        const std::scoped_lock lock( m_mutex );
        return m_totalBytes;
    }

    /**
     * @return All values consistently computed from the same state.
     */
    [[nodiscard]] ProgressSnapshot
    snapshot() const
    {
        uint64_t bytesWritten{ 0 };
        uint64_t totalBytes{ 0 };
        double elapsedSeconds{ 0 };
        {
            const std::scoped_lock lock( m_mutex );
            bytesWritten = m_bytesWritten;
            totalBytes = m_totalBytes;
            elapsedSeconds = duration( m_startTime, Clock::now() );
        }

        ProgressSnapshot result;
        result.elapsedSeconds = elapsedSeconds;
        result.fractionComplete = computeFraction( bytesWritten, totalBytes );
        result.throughputBytesPerSecond = computeThroughput( bytesWritten, elapsedSeconds );
        result.bytesWritten = bytesWritten;
        result.totalBytes = totalBytes;
        return result;
    }

private:
    [[nodiscard]] static double
    computeFraction( uint64_t bytesWritten,
                     uint64_t totalBytes ) noexcept
    {
        if ( totalBytes == 0 ) {
            return 0;
        }
        return std::clamp( static_cast<double>( bytesWritten ) / static_cast<double>( totalBytes ), 0.0, 1.0 );
    }

    [[nodiscard]] static double
    computeThroughput( uint64_t bytesWritten,
                       double   elapsedSeconds ) noexcept
    {
        return elapsedSeconds > 0 ? static_cast<double>( bytesWritten ) / elapsedSeconds : 0.0;
    }

private:
    mutable std::mutex m_mutex;
    uint64_t m_bytesWritten{ 0 };
    uint64_t m_totalBytes{ 0 };
    Clock::time_point m_startTime{ Clock::now() };
};
}  // namespace rapidflash
