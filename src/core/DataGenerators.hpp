#pragma once

#include <algorithm>
#include <array>
#include <cstdint>
#include <cstring>
#include <fstream>
#include <random>
#include <string>
#include <vector>

#include "common.hpp"


namespace rapidflash
{
inline void
fillWithRandomData( void* const  data,
                    const size_t size,
                    const uint64_t seed = 0 )
{
    std::mt19937_64 randomEngine( seed );
    std::array<uint64_t, 1_Ki> buffer{};  // 8 KiB of buffer
    for ( size_t nBytesWritten = 0; nBytesWritten < size; ) {
        for ( auto& x : buffer ) {
            x = randomEngine();
        }
        const auto nBytesToWrite = std::min<uint64_t>( buffer.size() * sizeof( buffer[0] ), size - nBytesWritten );
        std::memcpy( reinterpret_cast<char*>( data ) + nBytesWritten, buffer.data(), nBytesToWrite );
        nBytesWritten += nBytesToWrite;
    }
}


[[nodiscard]] inline std::vector<char>
createRandomData( const size_t   size,
                  const uint64_t seed = 0 )
{
    std::vector<char> result( size );
    fillWithRandomData( result.data(), result.size(), seed );
    return result;
}


/**
 * Creates something resembling a disk image: blocks of random data alternating with runs of zeros,
 * which exercise the sparse write path. The first block is never zero so that format detection sees
 * random (raw) bytes.
 */
[[nodiscard]] inline std::vector<char>
createSparseImage( const size_t size,
                   const size_t blockSize = 1_Mi )
{
    auto result = createRandomData( size );
    std::mt19937_64 randomEngine( size );
    for ( size_t offset = blockSize; offset < size; offset += blockSize ) {
        if ( randomEngine() % 2 == 0 ) {
            std::fill( result.begin() + offset, result.begin() + std::min( size, offset + blockSize ), 0 );
        }
    }
    return result;
}


inline void
writeFile( const std::string&       path,
           const std::vector<char>& contents )
{
    std::ofstream file( path, std::ios_base::out | std::ios_base::binary | std::ios_base::trunc );
    file.write( contents.data(), static_cast<std::streamsize>( contents.size() ) );
}


template<typename T>
void
storeLittleEndian( char* const data,
                   T           value )
{
    for ( size_t i = 0; i < sizeof( T ); ++i ) {
        data[i] = static_cast<char>( static_cast<uint8_t>( value & 0xFFU ) );
        value >>= 8U;
    }
}


struct MbrPartitionEntry
{
    uint32_t lbaStart{ 0 };
    uint32_t sectorCount{ 0 };
};


/**
 * Writes a DOS partition table into the first sector of @p image, which must be at least 512 B large.
 */
inline void
writeMbr( std::vector<char>&                    image,
          const std::vector<MbrPartitionEntry>& entries )
{
    std::memset( image.data() + 446U, 0, 4U * 16U );
    for ( size_t i = 0; i < std::min<size_t>( entries.size(), 4U ); ++i ) {
        auto* const entry = image.data() + 446U + 16U * i;
        entry[4] = static_cast<char>( 0x83 );  // Linux partition type
        storeLittleEndian( entry + 8, entries[i].lbaStart );
        storeLittleEndian( entry + 12, entries[i].sectorCount );
    }
    image[510] = static_cast<char>( 0x55 );
    image[511] = static_cast<char>( 0xAA );
}


/**
 * Writes the fields of a GPT header that are relevant for size inference into the second sector of @p image,
 * which must be at least 1024 B large.
 */
inline void
writeGptHeader( std::vector<char>& image,
                const uint64_t     backupLba )
{
    std::memcpy( image.data() + 512, "EFI PART", 8 );
    storeLittleEndian( image.data() + 512 + 8, uint32_t( 0x00010000 ) );  // revision 1.0
    storeLittleEndian( image.data() + 512 + 12, uint32_t( 92 ) );  // header size
    storeLittleEndian( image.data() + 512 + 24, uint64_t( 1 ) );  // current LBA
    storeLittleEndian( image.data() + 512 + 32, backupLba );
}
}  // namespace rapidflash
