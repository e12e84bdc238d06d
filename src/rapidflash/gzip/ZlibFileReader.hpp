#pragma once

#include <algorithm>
#include <limits>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <zlib.h>

#include <core/common.hpp>
#include <filereader/FileReader.hpp>


namespace rapidflash
{
/**
 * Compresses the given data into a single gzip member. Used for creating test images.
 */
template<typename ResultContainer = std::vector<char>,
         typename InputContainer = std::vector<char> >
[[nodiscard]] ResultContainer
compressWithZlib( const InputContainer& toCompress )
{
    ResultContainer output;
    output.reserve( toCompress.size() / 2 );

    z_stream stream;
    stream.zalloc = Z_NULL;
    stream.zfree = Z_NULL;
    stream.opaque = Z_NULL;
    stream.avail_in = static_cast<uInt>( toCompress.size() );
    stream.next_in = const_cast<Bytef*>( reinterpret_cast<const Bytef*>( toCompress.data() ) );
    stream.avail_out = 0;
    stream.next_out = nullptr;

    /* > Add 16 to windowBits to write a simple gzip header and trailer around the
     * > compressed data instead of a zlib wrapper. */
    if ( deflateInit2( &stream, Z_DEFAULT_COMPRESSION, Z_DEFLATED, MAX_WBITS + 16, /* memLevel */ 8,
                       Z_DEFAULT_STRATEGY ) != Z_OK ) {
        throw std::runtime_error( "Failed to initialize zlib deflate stream!" );
    }

    auto status = Z_OK;
    constexpr auto CHUNK_SIZE = 1_Mi;
    while ( status == Z_OK ) {
        output.resize( output.size() + CHUNK_SIZE );
        stream.next_out = reinterpret_cast<Bytef*>( output.data() + output.size() - CHUNK_SIZE );
        stream.avail_out = CHUNK_SIZE;
        status = ::deflate( &stream, Z_FINISH );
    }

    deflateEnd( &stream );

    output.resize( stream.total_out );
    output.shrink_to_fit();

    return output;
}


/**
 * Streaming gzip decoder on top of zlib's inflate. Concatenated gzip members are decoded one after another
 * like gzip -d does. Trailing zero padding after the last member, as produced by some tape and image tools,
 * is ignored.
 */
class ZlibFileReader :
    public FileReader
{
public:
    static constexpr size_t INPUT_BUFFER_SIZE = 128_Ki;

public:
    explicit
    ZlibFileReader( UniqueFileReader encodedFile ) :
        m_encodedFile( std::move( encodedFile ) )
    {
        if ( !m_encodedFile ) {
            throw std::invalid_argument( "ZlibFileReader requires a valid file reader!" );
        }

        m_stream.zalloc = Z_NULL;
        m_stream.zfree = Z_NULL;
        m_stream.opaque = Z_NULL;
        m_stream.avail_in = 0;
        m_stream.next_in = Z_NULL;

        /* > windowBits can also be greater than 15 for optional gzip decoding.
         * > Add 32 to windowBits to enable zlib and gzip decoding with automatic header detection,
         * > or add 16 to decode only the gzip format. */
        if ( inflateInit2( &m_stream, MAX_WBITS + 16 ) != Z_OK ) {
            throw std::runtime_error( std::string( "Failed to initialize zlib inflate stream: " )
                                      + ( m_stream.msg == nullptr ? "" : m_stream.msg ) );
        }
    }

    ~ZlibFileReader() override
    {
        inflateEnd( &m_stream );
    }

    void
    close() override
    {
        if ( m_encodedFile ) {
            m_encodedFile->close();
        }
    }

    [[nodiscard]] bool
    closed() const override
    {
        return m_encodedFile->closed();
    }

    [[nodiscard]] bool
    eof() const override
    {
        return m_eof;
    }

    [[nodiscard]] bool
    seekable() const override
    {
        return false;
    }

    [[nodiscard]] size_t
    read( char*  buffer,
          size_t nMaxBytesToRead ) override
    {
        size_t nBytesDecoded{ 0 };
        while ( !m_eof && ( nBytesDecoded < nMaxBytesToRead ) ) {
            if ( m_stream.avail_in == 0 ) {
                refillBuffer();
                if ( m_stream.avail_in == 0 ) {
                    if ( m_memberFinished ) {
                        m_eof = true;
                        break;
                    }
                    std::stringstream message;
                    message << "Unexpected end of gzip data after " << m_encodedFile->tell() << " B of input "
                            << "and " << m_decodedBytes << " B of output!";
                    throw std::runtime_error( std::move( message ).str() );
                }
            }

            if ( m_memberFinished ) {
                if ( !startNextMember() ) {
                    continue;
                }
            }

            const auto nBytesToDecode = std::min<size_t>( nMaxBytesToRead - nBytesDecoded,
                                                          std::numeric_limits<uInt>::max() );
            m_stream.next_out = reinterpret_cast<Bytef*>( buffer + nBytesDecoded );
            m_stream.avail_out = static_cast<uInt>( nBytesToDecode );

            const auto errorCode = ::inflate( &m_stream, Z_NO_FLUSH );
            const auto nBytesDecodedPerCall = nBytesToDecode - m_stream.avail_out;
            nBytesDecoded += nBytesDecodedPerCall;
            m_decodedBytes += nBytesDecodedPerCall;

            if ( errorCode == Z_STREAM_END ) {
                m_memberFinished = true;
            } else if ( ( errorCode != Z_OK ) && ( errorCode != Z_BUF_ERROR ) ) {
                std::stringstream message;
                message << "[ZlibFileReader] Decoding failed with error code " << errorCode << " "
                        << ( m_stream.msg == nullptr ? "" : m_stream.msg ) << " after " << m_decodedBytes
                        << " B of output!";
                throw std::runtime_error( std::move( message ).str() );
            }
        }

        return nBytesDecoded;
    }

    size_t
    seek( long long int /* offset */,
          int           /* origin */ = SEEK_SET ) override
    {
        throw std::logic_error( "Seeking is not supported for gzip-compressed streams!" );
    }

    [[nodiscard]] std::optional<size_t>
    size() const override
    {
        return m_eof ? std::make_optional( m_decodedBytes ) : std::nullopt;
    }

    [[nodiscard]] size_t
    tell() const override
    {
        return m_decodedBytes;
    }

private:
    void
    refillBuffer()
    {
        m_inputBuffer.resize( INPUT_BUFFER_SIZE );
        const auto nBytesRead = readFull( *m_encodedFile, m_inputBuffer.data(), m_inputBuffer.size() );
        m_inputBuffer.resize( nBytesRead );
        m_stream.next_in = reinterpret_cast<Bytef*>( m_inputBuffer.data() );
        m_stream.avail_in = static_cast<uInt>( m_inputBuffer.size() );
    }

    /**
     * @return false if the remaining input does not start a new gzip member but is zero padding.
     */
    [[nodiscard]] bool
    startNextMember()
    {
        const auto* const begin = reinterpret_cast<const char*>( m_stream.next_in );
        const auto* const end = begin + m_stream.avail_in;
        const auto* const firstNonZero = std::find_if( begin, end, [] ( char c ) { return c != 0; } );
        m_stream.avail_in -= static_cast<uInt>( firstNonZero - begin );
        m_stream.next_in += firstNonZero - begin;

        if ( m_stream.avail_in == 0 ) {
            return false;
        }

        if ( inflateReset( &m_stream ) != Z_OK ) {
            throw std::runtime_error( "Failed to reset zlib inflate stream for the next gzip member!" );
        }
        m_memberFinished = false;
        return true;
    }

private:
    const UniqueFileReader m_encodedFile;
    z_stream m_stream{};
    std::vector<char> m_inputBuffer;

    bool m_memberFinished{ false };
    bool m_eof{ false };
    size_t m_decodedBytes{ 0 };
};
}  // namespace rapidflash
