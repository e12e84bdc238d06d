#pragma once

#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <zstd.h>

#include <core/common.hpp>
#include <filereader/FileReader.hpp>


namespace rapidflash
{
/**
 * Compresses the given data into a single zstd frame. Used for creating test images.
 */
template<typename ResultContainer = std::vector<char>,
         typename InputContainer = std::vector<char> >
[[nodiscard]] ResultContainer
compressWithZstd( const InputContainer& toCompress,
                  const int             compressionLevel = ZSTD_CLEVEL_DEFAULT )
{
    ResultContainer output( ZSTD_compressBound( toCompress.size() ) );
    const auto compressedSize = ZSTD_compress( output.data(), output.size(),
                                               toCompress.data(), toCompress.size(), compressionLevel );
    if ( ZSTD_isError( compressedSize ) ) {
        throw std::runtime_error( std::string( "ZSTD_compress failed: " ) + ZSTD_getErrorName( compressedSize ) );
    }
    output.resize( compressedSize );
    return output;
}


/**
 * Streaming zstd decoder. Concatenated frames and skippable frames are handled by libzstd itself.
 */
class ZstdFileReader :
    public FileReader
{
public:
    explicit
    ZstdFileReader( UniqueFileReader encodedFile ) :
        m_encodedFile( std::move( encodedFile ) ),
        m_inputBuffer( ZSTD_DStreamInSize() )
    {
        if ( !m_encodedFile ) {
            throw std::invalid_argument( "ZstdFileReader requires a valid file reader!" );
        }
        if ( !m_stream ) {
            throw std::runtime_error( "Failed to create zstd decompression stream!" );
        }
        const auto result = ZSTD_initDStream( m_stream.get() );
        if ( ZSTD_isError( result ) ) {
            throw std::runtime_error( std::string( "Failed to initialize zstd decompression stream: " )
                                      + ZSTD_getErrorName( result ) );
        }
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
            if ( ( m_input.pos >= m_input.size ) && !m_encodedEof ) {
                refillBuffer();
            }

            const auto inputExhausted = ( m_input.pos >= m_input.size ) && m_encodedEof;
            if ( inputExhausted && m_frameFinished ) {
                m_eof = true;
                break;
            }

            ZSTD_outBuffer output{ buffer + nBytesDecoded, nMaxBytesToRead - nBytesDecoded, 0 };
            const auto result = ZSTD_decompressStream( m_stream.get(), &output, &m_input );
            if ( ZSTD_isError( result ) ) {
                std::stringstream message;
                message << "[ZstdFileReader] Decoding failed: " << ZSTD_getErrorName( result ) << " after "
                        << m_decodedBytes + nBytesDecoded + output.pos << " B of output!";
                throw std::runtime_error( std::move( message ).str() );
            }

            nBytesDecoded += output.pos;
            m_decodedBytes += output.pos;
            m_frameFinished = result == 0;

            /* A return value larger than 0 means that the frame is incomplete or that data is still buffered
             * internally. Without further input and without further output, the frame was truncated. */
            if ( inputExhausted && ( output.pos == 0 ) && !m_frameFinished ) {
                std::stringstream message;
                message << "Unexpected end of zstd data after " << m_encodedFile->tell() << " B of input "
                        << "and " << m_decodedBytes << " B of output!";
                throw std::runtime_error( std::move( message ).str() );
            }
        }

        return nBytesDecoded;
    }

    size_t
    seek( long long int /* offset */,
          int           /* origin */ = SEEK_SET ) override
    {
        throw std::logic_error( "Seeking is not supported for zstd-compressed streams!" );
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
        const auto nBytesRead = readFull( *m_encodedFile, m_inputBuffer.data(), m_inputBuffer.size() );
        m_encodedEof = nBytesRead == 0;
        m_input = ZSTD_inBuffer{ m_inputBuffer.data(), nBytesRead, 0 };
    }

private:
    struct DStreamDeleter
    {
        void
        operator()( ZSTD_DStream* stream ) const
        {
            ZSTD_freeDStream( stream );
        }
    };

    const UniqueFileReader m_encodedFile;
    const std::unique_ptr<ZSTD_DStream, DStreamDeleter> m_stream{ ZSTD_createDStream() };
    std::vector<char> m_inputBuffer;
    ZSTD_inBuffer m_input{ nullptr, 0, 0 };

    bool m_encodedEof{ false };
    bool m_frameFinished{ false };
    bool m_eof{ false };
    size_t m_decodedBytes{ 0 };
};
}  // namespace rapidflash
