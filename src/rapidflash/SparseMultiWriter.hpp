#pragma once

#include <cstdint>
#include <cstring>
#include <stdexcept>
#include <utility>
#include <vector>

#include <filewriter/FileWriter.hpp>


namespace rapidflash
{
/**
 * Checks eight bytes at a time. memcmp against a zero buffer would need a zero buffer of the chunk size.
 */
[[nodiscard]] inline bool
isAllZero( const char* data,
           size_t      size ) noexcept
{
    size_t i = 0;
    for ( ; i + sizeof( uint64_t ) <= size; i += sizeof( uint64_t ) ) {
        uint64_t word{ 0 };
        std::memcpy( &word, data + i, sizeof( word ) );
        if ( word != 0 ) {
            return false;
        }
    }
    for ( ; i < size; ++i ) {
        if ( data[i] != 0 ) {
            return false;
        }
    }
    return true;
}


/**
 * Writes the same data to all destinations in order. Chunks consisting only of zeros are skipped by
 * seeking, which keeps pre-erased media untouched and leaves holes in regular files.
 * The first failing destination aborts the whole write with its exception.
 */
class SparseMultiWriter
{
public:
    explicit
    SparseMultiWriter( std::vector<UniqueFileWriter> destinations,
                       bool                          sparse = true ) :
        m_destinations( std::move( destinations ) ),
        m_sparse( sparse )
    {
        if ( m_destinations.empty() ) {
            throw std::invalid_argument( "At least one destination is required!" );
        }
        for ( const auto& destination : m_destinations ) {
            if ( !destination ) {
                throw std::invalid_argument( "Destinations must not be null!" );
            }
        }
    }

    /**
     * @return true if the chunk was skipped because it only contained zeros.
     */
    bool
    write( const char* data,
           size_t      size )
    {
        if ( size == 0 ) {
            return false;
        }

        if ( m_sparse && isAllZero( data, size ) ) {
            for ( auto& destination : m_destinations ) {
                destination->seek( static_cast<long long int>( size ), SEEK_CUR );
                destination->flush();
            }
            m_skippedBytes += size;
            return true;
        }

        for ( auto& destination : m_destinations ) {
            destination->write( data, size );
        }
        return false;
    }

    void
    flush()
    {
        for ( auto& destination : m_destinations ) {
            destination->flush();
        }
    }

    void
    syncData()
    {
        for ( auto& destination : m_destinations ) {
            destination->syncData();
        }
    }

    void
    syncAll()
    {
        for ( auto& destination : m_destinations ) {
            destination->syncAll();
        }
    }

    void
    close()
    {
        for ( auto& destination : m_destinations ) {
            destination->close();
        }
    }

    [[nodiscard]] size_t
    size() const noexcept
    {
        return m_destinations.size();
    }

    [[nodiscard]] uint64_t
    skippedBytes() const noexcept
    {
        return m_skippedBytes;
    }

private:
    std::vector<UniqueFileWriter> m_destinations;
    const bool m_sparse;
    uint64_t m_skippedBytes{ 0 };
};
}  // namespace rapidflash
