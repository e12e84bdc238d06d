#pragma once

#include <algorithm>
#include <cstddef>
#include <cstdio>
#include <limits>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>

#include <core/common.hpp>


namespace rapidflash
{
class FileReader;

using UniqueFileReader = std::unique_ptr<FileReader>;


/**
 * Read-only, Python-IOBase-like file interface. It is implemented by the image sources (files, in-memory buffers)
 * as well as by the decoders, which wrap a source and themselves act as a source of decoded bytes. Decoders are
 * forward-only and return false for @ref seekable.
 */
class FileReader
{
public:
    FileReader() = default;

    virtual
    ~FileReader() = default;

    /* Delete copy constructors and assignments to avoid slicing. */

    FileReader( const FileReader& ) = delete;

    FileReader&
    operator=( const FileReader& ) = delete;

    FileReader( FileReader&& ) = default;

    FileReader&
    operator=( FileReader&& ) = delete;

    virtual void
    close() = 0;

    [[nodiscard]] virtual bool
    closed() const = 0;

    [[nodiscard]] virtual bool
    eof() const = 0;

    [[nodiscard]] virtual bool
    seekable() const = 0;

    /**
     * @return The number of bytes read, which may be smaller than requested. 0 signals the end of the stream.
     */
    [[nodiscard]] virtual size_t
    read( char*  buffer,
          size_t nMaxBytesToRead ) = 0;

    virtual size_t
    seek( long long int offset,
          int           origin = SEEK_SET ) = 0;

    size_t
    seekTo( uint64_t offset )
    {
        if ( offset > static_cast<uint64_t>( std::numeric_limits<long long int>::max() ) ) {
            throw std::invalid_argument( "Value " + std::to_string( offset ) + " out of range of long long int!" );
        }
        return seek( static_cast<long long int>( offset ) );
    }

    /**
     * @return The size in bytes if known. Decoders do not know their decoded size before the end is reached.
     */
    [[nodiscard]] virtual std::optional<size_t>
    size() const = 0;

    [[nodiscard]] virtual size_t
    tell() const = 0;

protected:
    [[nodiscard]] size_t
    effectiveOffset( long long int offset,
                     int           origin ) const
    {
        offset = [&] () {
            switch ( origin )
            {
            case SEEK_CUR:
                return saturatingAddition( static_cast<long long int>( tell() ), offset );
            case SEEK_SET:
                return offset;
            case SEEK_END:
                if ( const auto fileSize = size(); fileSize.has_value() ) {
                    return saturatingAddition( static_cast<long long int>( *fileSize ), offset );
                }
                throw std::logic_error( "File size is not available to seek from end!" );
            default:
                break;
            }
            throw std::invalid_argument( "Invalid seek origin supplied: " + std::to_string( origin ) );
        } ();

        const auto positiveOffset = static_cast<size_t>( std::max( offset, 0LL ) );
        const auto fileSize = size();
        return fileSize.has_value() ? std::min( positiveOffset, *fileSize ) : positiveOffset;
    }
};


/**
 * Reads until @p nBytesToRead bytes have been read or the end of the stream is reached. Decoders may return
 * short reads in the middle of the stream, e.g., at the end of a gzip member, so a single read call does not
 * suffice to fill a chunk.
 */
[[nodiscard]] inline size_t
readFull( FileReader& reader,
          char*       buffer,
          size_t      nBytesToRead )
{
    size_t nBytesRead{ 0 };
    while ( nBytesRead < nBytesToRead ) {
        const auto nBytesReadPerCall = reader.read( buffer + nBytesRead, nBytesToRead - nBytesRead );
        if ( nBytesReadPerCall == 0 ) {
            break;
        }
        nBytesRead += nBytesReadPerCall;
    }
    return nBytesRead;
}
}  // namespace rapidflash
