#pragma once

#include <array>
#include <cstdint>
#include <ostream>

#include <filereader/FileReader.hpp>


namespace rapidflash
{
enum class FileType
{
    RAW,
    GZIP,
    ZSTD,
};


[[nodiscard]] inline const char*
toString( FileType fileType )
{
    switch ( fileType )
    {
    case FileType::RAW:
        return "Raw";
    case FileType::GZIP:
        return "GZIP";
    case FileType::ZSTD:
        return "ZSTD";
    }
    return "";
}


inline std::ostream&
operator<<( std::ostream& out,
            FileType      fileType )
{
    out << toString( fileType );
    return out;
}


namespace gzip
{
static constexpr uint8_t MAGIC_ID1 = 0x1FU;
static constexpr uint8_t MAGIC_ID2 = 0x8BU;
}  // namespace gzip


namespace zstd
{
static constexpr std::array<uint8_t, 4> MAGIC_NUMBER = { 0x28U, 0xB5U, 0x2FU, 0xFDU };
}  // namespace zstd


/**
 * Classifies the image by its magic bytes. Anything not recognized, including files shorter than the
 * magic bytes, is treated as a raw image. The reader position is restored afterwards, so it must be
 * seekable unless nothing has been read from it yet and it is not reused.
 */
[[nodiscard]] inline FileType
determineFileType( FileReader& fileReader )
{
    const auto oldPosition = fileReader.tell();

    std::array<uint8_t, 4> magicBytes{};
    const auto nBytesRead = readFull( fileReader, reinterpret_cast<char*>( magicBytes.data() ), magicBytes.size() );

    if ( fileReader.seekable() ) {
        fileReader.seekTo( oldPosition );
    }

    if ( ( nBytesRead >= 2 ) && ( magicBytes[0] == gzip::MAGIC_ID1 ) && ( magicBytes[1] == gzip::MAGIC_ID2 ) ) {
        return FileType::GZIP;
    }

    if ( ( nBytesRead >= zstd::MAGIC_NUMBER.size() ) && ( magicBytes == zstd::MAGIC_NUMBER ) ) {
        return FileType::ZSTD;
    }

    return FileType::RAW;
}
}  // namespace rapidflash
