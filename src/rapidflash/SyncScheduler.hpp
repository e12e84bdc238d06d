#pragma once

#include <cstdint>
#include <stdexcept>

#include <core/common.hpp>

#include "SparseMultiWriter.hpp"


namespace rapidflash
{
/**
 * Bounds the amount of written data that has not reached the storage devices yet.
 */
class SyncScheduler
{
public:
    static constexpr uint64_t DEFAULT_SYNC_INTERVAL = 16_Mi;
    static constexpr uint64_t DEFAULT_MULTI_DESTINATION_SYNC_INTERVAL = 32_Mi;

public:
    SyncScheduler( SparseMultiWriter& writer,
                   uint64_t           syncInterval ) :
        m_writer( writer ),
        m_syncInterval( syncInterval )
    {
        if ( m_syncInterval == 0 ) {
            throw std::invalid_argument( "The sync interval must be larger than 0!" );
        }
    }

    [[nodiscard]] static constexpr uint64_t
    defaultSyncInterval( size_t destinationCount ) noexcept
    {
        return destinationCount > 1 ? DEFAULT_MULTI_DESTINATION_SYNC_INTERVAL : DEFAULT_SYNC_INTERVAL;
    }

    /**
     * @return true if the data was synced.
     */
    bool
    recordWritten( uint64_t nBytes )
    {
        m_unsyncedBytes += nBytes;
        if ( m_unsyncedBytes < m_syncInterval ) {
            return false;
        }

        m_writer.flush();
        m_writer.syncData();
        m_unsyncedBytes = 0;
        ++m_syncCount;
        return true;
    }

    /**
     * Flushes and syncs data and metadata on all destinations. May only be called once.
     */
    void
    finalize()
    {
        if ( m_finalized ) {
            throw std::logic_error( "The final sync may only be done once!" );
        }
        m_finalized = true;

        m_writer.flush();
        m_writer.syncAll();
        m_unsyncedBytes = 0;
    }

    [[nodiscard]] uint64_t
    syncInterval() const noexcept
    {
        return m_syncInterval;
    }

    [[nodiscard]] uint64_t
    unsyncedBytes() const noexcept
    {
        return m_unsyncedBytes;
    }

    [[nodiscard]] size_t
    syncCount() const noexcept
    {
        return m_syncCount;
    }

private:
    SparseMultiWriter& m_writer;
    const uint64_t m_syncInterval;
    uint64_t m_unsyncedBytes{ 0 };
    size_t m_syncCount{ 0 };
    bool m_finalized{ false };
};
}  // namespace rapidflash
