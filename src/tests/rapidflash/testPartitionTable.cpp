#include <cstdint>
#include <iostream>
#include <optional>
#include <ostream>
#include <vector>

namespace rapidflash
{
std::ostream&
operator<<( std::ostream&                  out,
            const std::optional<uint64_t>& value )
{
    if ( value ) {
        out << *value;
    } else {
        out << "nullopt";
    }
    return out;
}
}  // namespace rapidflash

#include <core/DataGenerators.hpp>
#include <core/TestHelpers.hpp>
#include <rapidflash/PartitionTable.hpp>


using namespace rapidflash;


void
testMbr()
{
    std::vector<char> header( 1024, 0 );
    REQUIRE_EQUAL( inferSizeFromMbr( header.data(), header.size() ), std::optional<uint64_t>() );

    /* Signature without valid entries */
    writeMbr( header, {} );
    REQUIRE_EQUAL( inferSizeFromMbr( header.data(), header.size() ), std::optional<uint64_t>() );

    writeMbr( header, { MbrPartitionEntry{ 2048, 204800 } } );
    REQUIRE_EQUAL( inferSizeFromMbr( header.data(), header.size() ), std::optional<uint64_t>( 105'906'176 ) );
    REQUIRE_EQUAL( inferSizeFromPartitionTable( header.data(), header.size() ),
                   std::optional<uint64_t>( 105'906'176 ) );

    /* The partition reaching farthest determines the size, not the last one. */
    writeMbr( header, { MbrPartitionEntry{ 2048, 1000 }, MbrPartitionEntry{ 10000, 50000 },
                        MbrPartitionEntry{ 0, 1000 }, MbrPartitionEntry{ 5000, 1000 } } );
    REQUIRE_EQUAL( inferSizeFromMbr( header.data(), header.size() ), std::optional<uint64_t>( 60000ULL * 512U ) );

    /* Entries with zero start or zero length are ignored. */
    writeMbr( header, { MbrPartitionEntry{ 0, 1000 }, MbrPartitionEntry{ 2048, 0 } } );
    REQUIRE_EQUAL( inferSizeFromMbr( header.data(), header.size() ), std::optional<uint64_t>() );

    /* No overflow for the largest possible values. */
    writeMbr( header, { MbrPartitionEntry{ 0xFFFF'FFFFU, 0xFFFF'FFFFU } } );
    REQUIRE_EQUAL( inferSizeFromMbr( header.data(), header.size() ),
                   std::optional<uint64_t>( 2ULL * 0xFFFF'FFFFULL * 512U ) );

    /* Wrong signature */
    writeMbr( header, { MbrPartitionEntry{ 2048, 204800 } } );
    header[511] = 0;
    REQUIRE_EQUAL( inferSizeFromMbr( header.data(), header.size() ), std::optional<uint64_t>() );

    /* Too short */
    writeMbr( header, { MbrPartitionEntry{ 2048, 204800 } } );
    REQUIRE_EQUAL( inferSizeFromMbr( header.data(), 511 ), std::optional<uint64_t>() );
}


void
testGpt()
{
    std::vector<char> header( 1024, 0 );
    REQUIRE_EQUAL( inferSizeFromGpt( header.data(), header.size() ), std::optional<uint64_t>() );

    writeGptHeader( header, 1000 );
    REQUIRE_EQUAL( inferSizeFromGpt( header.data(), header.size() ), std::optional<uint64_t>( 512'512 ) );

    writeGptHeader( header, 0 );
    REQUIRE_EQUAL( inferSizeFromGpt( header.data(), header.size() ), std::optional<uint64_t>() );

    /* Too short to contain the backup LBA. */
    writeGptHeader( header, 1000 );
    REQUIRE_EQUAL( inferSizeFromGpt( header.data(), 550 ), std::optional<uint64_t>() );

    header[512] = 'X';
    REQUIRE_EQUAL( inferSizeFromGpt( header.data(), header.size() ), std::optional<uint64_t>() );
}


void
testGptTakesPrecedence()
{
    std::vector<char> header( 1024, 0 );
    /* Protective MBR with a single entry spanning the disk except for the first sector. */
    writeMbr( header, { MbrPartitionEntry{ 1, 999 } } );
    writeGptHeader( header, 2047 );
    REQUIRE_EQUAL( inferSizeFromPartitionTable( header.data(), header.size() ),
                   std::optional<uint64_t>( 2048ULL * 512U ) );

    /* Falls back to the MBR if the GPT header is unusable. */
    writeGptHeader( header, 0 );
    REQUIRE_EQUAL( inferSizeFromPartitionTable( header.data(), header.size() ),
                   std::optional<uint64_t>( 1000ULL * 512U ) );
}


int
main()
{
    testMbr();
    testGpt();
    testGptTakesPrecedence();

    std::cout << "Tests successful: " << ( gnTests - gnTestErrors ) << " / " << gnTests << "\n";

    return gnTestErrors == 0 ? 0 : 1;
}
