#pragma once

#include <memory>
#include <stdexcept>
#include <utility>
#include <vector>

#include <core/common.hpp>
#include <filereader/FileReader.hpp>

#include "format.hpp"
#include "gzip/ZlibFileReader.hpp"
#include "zstd/ZstdFileReader.hpp"


namespace rapidflash
{
/**
 * Wraps the encoded image into the decoder for its format. Raw images are returned as they are.
 * The decision is made once here so that the chunk loop only sees a FileReader.
 */
[[nodiscard]] inline UniqueFileReader
openDecodingReader( UniqueFileReader encodedFile,
                    FileType         fileType )
{
    if ( !encodedFile ) {
        throw std::invalid_argument( "A valid file reader is required for decoding!" );
    }

    switch ( fileType )
    {
    case FileType::RAW:
        return encodedFile;
    case FileType::GZIP:
        return std::make_unique<ZlibFileReader>( std::move( encodedFile ) );
    case FileType::ZSTD:
        return std::make_unique<ZstdFileReader>( std::move( encodedFile ) );
    }

    throw std::invalid_argument( "Unknown file type!" );
}


/**
 * Decodes the whole stream and discards the result.
 * @return The number of decoded bytes.
 */
[[nodiscard]] inline size_t
countDecodedBytes( FileReader& reader,
                   size_t      bufferSize = 1_Mi )
{
    std::vector<char> buffer( bufferSize );
    size_t nBytesDecoded{ 0 };
    while ( true ) {
        const auto nBytesRead = reader.read( buffer.data(), buffer.size() );
        if ( nBytesRead == 0 ) {
            break;
        }
        nBytesDecoded += nBytesRead;
    }
    return nBytesDecoded;
}
}  // namespace rapidflash
