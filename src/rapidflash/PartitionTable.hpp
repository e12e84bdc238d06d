#pragma once

#include <algorithm>
#include <cstdint>
#include <cstring>
#include <limits>
#include <optional>

#include <core/common.hpp>


namespace rapidflash
{
static constexpr size_t SECTOR_SIZE = 512;


namespace mbr
{
static constexpr size_t PARTITION_TABLE_OFFSET = 446;
static constexpr size_t PARTITION_ENTRY_SIZE = 16;
static constexpr size_t PARTITION_ENTRY_COUNT = 4;
static constexpr size_t SIGNATURE_OFFSET = 510;
}  // namespace mbr


namespace gpt
{
static constexpr size_t HEADER_OFFSET = SECTOR_SIZE;
static constexpr char SIGNATURE[] = "EFI PART";
static constexpr size_t SIGNATURE_SIZE = sizeof( SIGNATURE ) - 1;
/** Absolute offset of the backup header LBA inside the image. */
static constexpr size_t BACKUP_LBA_OFFSET = HEADER_OFFSET + 32;
}  // namespace gpt


/**
 * The image size is the end of the partition reaching farthest in the DOS partition table.
 * Unused entries, i.e., those with zero start or zero length, are ignored.
 */
[[nodiscard]] inline std::optional<uint64_t>
inferSizeFromMbr( const char* data,
                  size_t      size )
{
    if ( ( size < SECTOR_SIZE )
         || ( static_cast<uint8_t>( data[mbr::SIGNATURE_OFFSET] ) != 0x55U )
         || ( static_cast<uint8_t>( data[mbr::SIGNATURE_OFFSET + 1] ) != 0xAAU ) ) {
        return std::nullopt;
    }

    uint64_t maxEndSector{ 0 };
    for ( size_t i = 0; i < mbr::PARTITION_ENTRY_COUNT; ++i ) {
        const auto* const entry = data + mbr::PARTITION_TABLE_OFFSET + i * mbr::PARTITION_ENTRY_SIZE;
        const auto lbaStart = loadLittleEndian<uint32_t>( entry + 8 );
        const auto sectorCount = loadLittleEndian<uint32_t>( entry + 12 );
        if ( ( lbaStart > 0 ) && ( sectorCount > 0 ) ) {
            maxEndSector = std::max( maxEndSector, uint64_t( lbaStart ) + sectorCount );
        }
    }

    if ( maxEndSector == 0 ) {
        return std::nullopt;
    }
    return maxEndSector * SECTOR_SIZE;
}


/**
 * The backup GPT header resides in the very last sector of the disk, so its LBA determines the image size.
 */
[[nodiscard]] inline std::optional<uint64_t>
inferSizeFromGpt( const char* data,
                  size_t      size )
{
    if ( ( size < gpt::BACKUP_LBA_OFFSET + sizeof( uint64_t ) )
         || ( std::memcmp( data + gpt::HEADER_OFFSET, gpt::SIGNATURE, gpt::SIGNATURE_SIZE ) != 0 ) ) {
        return std::nullopt;
    }

    const auto backupLba = loadLittleEndian<uint64_t>( data + gpt::BACKUP_LBA_OFFSET );
    if ( ( backupLba == 0 ) || ( backupLba >= std::numeric_limits<uint64_t>::max() / SECTOR_SIZE ) ) {
        return std::nullopt;
    }
    return ( backupLba + 1 ) * SECTOR_SIZE;
}


/**
 * GPT is checked first because GPT disks also carry a protective MBR, whose single entry only
 * approximately describes the disk.
 */
[[nodiscard]] inline std::optional<uint64_t>
inferSizeFromPartitionTable( const char* data,
                             size_t      size )
{
    if ( const auto gptSize = inferSizeFromGpt( data, size ); gptSize ) {
        return gptSize;
    }
    return inferSizeFromMbr( data, size );
}
}  // namespace rapidflash
