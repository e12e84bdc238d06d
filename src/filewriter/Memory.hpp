#pragma once

#include <algorithm>
#include <cstring>
#include <optional>
#include <stdexcept>
#include <vector>

#include <core/common.hpp>

#include "FileWriter.hpp"


namespace rapidflash
{
/**
 * Destination backed by a vector, behaving like a freshly truncated regular file: skipped regions read
 * back as zeros and the size only grows on write or flush. It counts all calls, which makes it useful
 * for checking the flush and sync behavior of the flasher. The first write reaching @ref failAtOffset
 * throws, like a device that was unplugged or is full.
 */
class MemoryFileWriter :
    public FileWriter
{
public:
    struct Statistics
    {
        size_t writeCalls{ 0 };
        size_t seekCalls{ 0 };
        size_t flushCalls{ 0 };
        size_t syncDataCalls{ 0 };
        size_t syncAllCalls{ 0 };
    };

public:
    MemoryFileWriter() = default;

    explicit
    MemoryFileWriter( size_t failAtOffset ) :
        m_failAtOffset( failAtOffset )
    {}

    void
    close() override
    {
        m_closed = true;
    }

    [[nodiscard]] bool
    closed() const override
    {
        return m_closed;
    }

    void
    write( const char* buffer,
           size_t      size ) override
    {
        checkOpen();
        ++m_statistics.writeCalls;

        if ( m_failAtOffset && ( m_position + size > *m_failAtOffset ) ) {
            throw std::runtime_error( "No space left on device" );
        }

        if ( m_data.size() < m_position + size ) {
            m_data.resize( m_position + size, 0 );
        }
        std::memcpy( m_data.data() + m_position, buffer, size );
        m_position += size;
    }

    size_t
    seek( long long int offset,
          int           origin = SEEK_SET ) override
    {
        checkOpen();
        ++m_statistics.seekCalls;

        long long int newPosition = offset;
        switch ( origin )
        {
        case SEEK_SET:
            break;
        case SEEK_CUR:
            newPosition = saturatingAddition( static_cast<long long int>( m_position ), offset );
            break;
        case SEEK_END:
            newPosition = saturatingAddition( static_cast<long long int>( m_data.size() ), offset );
            break;
        default:
            throw std::invalid_argument( "Invalid seek origin!" );
        }

        if ( newPosition < 0 ) {
            throw std::invalid_argument( "Cannot seek before the start of the file!" );
        }
        m_position = static_cast<size_t>( newPosition );
        return m_position;
    }

    [[nodiscard]] size_t
    tell() const override
    {
        return m_position;
    }

    void
    flush() override
    {
        checkOpen();
        ++m_statistics.flushCalls;
        if ( m_data.size() < m_position ) {
            m_data.resize( m_position, 0 );
        }
    }

    void
    syncData() override
    {
        flush();
        ++m_statistics.syncDataCalls;
    }

    void
    syncAll() override
    {
        flush();
        ++m_statistics.syncAllCalls;
    }

    [[nodiscard]] const std::vector<char>&
    data() const noexcept
    {
        return m_data;
    }

    [[nodiscard]] const Statistics&
    statistics() const noexcept
    {
        return m_statistics;
    }

private:
    void
    checkOpen() const
    {
        if ( m_closed ) {
            throw std::invalid_argument( "Cannot write to closed file!" );
        }
    }

private:
    const std::optional<size_t> m_failAtOffset;
    bool m_closed{ false };
    std::vector<char> m_data;
    size_t m_position{ 0 };
    Statistics m_statistics;
};
}  // namespace rapidflash
