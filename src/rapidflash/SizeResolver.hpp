#pragma once

#include <algorithm>
#include <array>
#include <cstdint>
#include <memory>
#include <optional>
#include <ostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include <core/common.hpp>
#include <filereader/FileReader.hpp>
#include <filereader/Standard.hpp>

#include "DecodingReader.hpp"
#include "format.hpp"
#include "PartitionTable.hpp"


namespace rapidflash
{
/**
 * The decoded image size as far as it is known. An exact size is known before streaming starts. An adaptive
 * size is a lower bound that is raised while streaming and becomes exact once the stream ends.
 */
struct SizeEstimate
{
    enum class Kind
    {
        EXACT,
        ADAPTIVE,
    };

    [[nodiscard]] static SizeEstimate
    exact( uint64_t size )
    {
        return { Kind::EXACT, size };
    }

    [[nodiscard]] static SizeEstimate
    adaptive( uint64_t lowerBound = 0 )
    {
        return { Kind::ADAPTIVE, lowerBound };
    }

    [[nodiscard]] bool
    isExact() const noexcept
    {
        return kind == Kind::EXACT;
    }

    [[nodiscard]] bool
    operator==( const SizeEstimate& other ) const noexcept
    {
        return ( kind == other.kind ) && ( bytes == other.bytes );
    }

    [[nodiscard]] bool
    operator!=( const SizeEstimate& other ) const noexcept
    {
        return !( *this == other );
    }

    Kind kind{ Kind::ADAPTIVE };
    uint64_t bytes{ 0 };
};


inline std::ostream&
operator<<( std::ostream&       out,
            const SizeEstimate& estimate )
{
    out << ( estimate.isExact() ? "Exact(" : "Adaptive(" ) << estimate.bytes << ")";
    return out;
}


namespace gzip
{
/** 10 B header, at least 2 B for an empty deflate stream, 8 B footer. */
static constexpr size_t MIN_MEMBER_SIZE = 18;
}  // namespace gzip


/**
 * Reads ISIZE from the gzip footer, i.e., the decoded size of the last member modulo 2^32.
 * Images of 4 GiB or larger therefore yield a wrapped value, which is only a lower bound for the real size.
 * The reader position is restored afterwards.
 */
[[nodiscard]] inline uint64_t
readGzipTrailerSize( FileReader& file )
{
    const auto fileSize = file.size();
    if ( !file.seekable() || !fileSize ) {
        throw std::invalid_argument( "The gzip footer can only be read from seekable files with known size!" );
    }

    if ( *fileSize < gzip::MIN_MEMBER_SIZE ) {
        std::stringstream message;
        message << "File is too small (" << *fileSize << " B) to be a valid gzip file!";
        throw std::runtime_error( std::move( message ).str() );
    }

    const auto oldPosition = file.tell();
    file.seekTo( *fileSize - sizeof( uint32_t ) );
    std::array<char, sizeof( uint32_t )> footer{};
    const auto nBytesRead = readFull( file, footer.data(), footer.size() );
    file.seekTo( oldPosition );

    if ( nBytesRead != footer.size() ) {
        throw std::runtime_error( "Failed to read the gzip footer!" );
    }

    return loadLittleEndian<uint32_t>( footer.data() );
}


/**
 * Determines the decoded image size before streaming. Raw images use the file size and gzip images the footer.
 * Zstd images are decoded once completely because the frame content size is optional and is not summed up
 * over concatenated frames. The image has to be a file that can be read twice, i.e., not a pipe.
 */
[[nodiscard]] inline SizeEstimate
resolveExactSize( const std::string& imagePath,
                  FileType           fileType )
{
    auto file = std::make_unique<StandardFileReader>( imagePath );
    if ( !file->seekable() || !file->size() ) {
        throw std::invalid_argument( "The size of '" + imagePath + "' can only be resolved for seekable files!" );
    }

    switch ( fileType )
    {
    case FileType::RAW:
        return SizeEstimate::exact( *file->size() );
    case FileType::GZIP:
        return SizeEstimate::exact( readGzipTrailerSize( *file ) );
    case FileType::ZSTD:
    {
        const auto decoder = openDecodingReader( std::move( file ), fileType );
        return SizeEstimate::exact( countDecodedBytes( *decoder ) );
    }
    }

    throw std::invalid_argument( "Unknown file type!" );
}


/**
 * Estimate that stays strictly larger than the bytes written so far so that the progress does not
 * report completion prematurely.
 */
[[nodiscard]] constexpr uint64_t
adaptiveTotalBytes( uint64_t bytesWritten ) noexcept
{
    return std::max<uint64_t>( saturatingAddition( bytesWritten, bytesWritten / 4U ), 1_Mi );
}


/**
 * Collects the start of the decoded stream and tries to infer the image size from a partition table in it.
 * Inference is attempted with every appended chunk as soon as enough bytes for the MBR and GPT headers are
 * available until either a size is found or the header budget is exhausted.
 */
class HeaderSizeInferrer
{
public:
    static constexpr size_t MIN_HEADER_SIZE = 2 * SECTOR_SIZE;
    static constexpr size_t MAX_HEADER_SIZE = 64_Ki;

public:
    /**
     * @return The inferred size if it was found with this call or an earlier one.
     */
    std::optional<uint64_t>
    append( const char* data,
            size_t      size )
    {
        if ( m_inferredSize || exhausted() ) {
            return m_inferredSize;
        }

        const auto nBytesToAppend = std::min( size, MAX_HEADER_SIZE - m_header.size() );
        m_header.insert( m_header.end(), data, data + nBytesToAppend );

        if ( m_header.size() >= MIN_HEADER_SIZE ) {
            m_inferredSize = inferSizeFromPartitionTable( m_header.data(), m_header.size() );
            /* Not needed anymore after the budget has been used up. */
            if ( m_inferredSize || ( m_header.size() >= MAX_HEADER_SIZE ) ) {
                m_exhausted = true;
                m_header.clear();
                m_header.shrink_to_fit();
            }
        }

        return m_inferredSize;
    }

    [[nodiscard]] bool
    exhausted() const noexcept
    {
        return m_exhausted;
    }

    [[nodiscard]] std::optional<uint64_t>
    inferredSize() const noexcept
    {
        return m_inferredSize;
    }

private:
    std::vector<char> m_header;
    std::optional<uint64_t> m_inferredSize;
    bool m_exhausted{ false };
};
}  // namespace rapidflash
