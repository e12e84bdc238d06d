#include <iostream>
#include <vector>

#include <core/DataGenerators.hpp>
#include <core/TestHelpers.hpp>
#include <filereader/BufferView.hpp>
#include <rapidflash/format.hpp>
#include <rapidflash/gzip/ZlibFileReader.hpp>
#include <rapidflash/zstd/ZstdFileReader.hpp>


using namespace rapidflash;


[[nodiscard]] FileType
detect( const std::vector<char>& data )
{
    BufferViewFileReader reader( data );
    const auto fileType = determineFileType( reader );
    REQUIRE_EQUAL( reader.tell(), size_t( 0 ) );
    return fileType;
}


void
testMagicBytes()
{
    REQUIRE_EQUAL( detect( { '\x1F', '\x8B' } ), FileType::GZIP );
    REQUIRE_EQUAL( detect( { '\x1F', '\x8B', '\x08', '\x00', '\x00' } ), FileType::GZIP );
    REQUIRE_EQUAL( detect( { '\x28', '\xB5', '\x2F', '\xFD' } ), FileType::ZSTD );
    REQUIRE_EQUAL( detect( { '\x28', '\xB5', '\x2F', '\xFD', '\x00', '\x00' } ), FileType::ZSTD );

    /* Too short for the magic bytes. */
    REQUIRE_EQUAL( detect( {} ), FileType::RAW );
    REQUIRE_EQUAL( detect( { '\x1F' } ), FileType::RAW );
    REQUIRE_EQUAL( detect( { '\x28', '\xB5', '\x2F' } ), FileType::RAW );

    /* Similar but wrong magic bytes. */
    REQUIRE_EQUAL( detect( { '\x8B', '\x1F', '\x00', '\x00' } ), FileType::RAW );
    REQUIRE_EQUAL( detect( { '\x28', '\xB5', '\x2F', '\xFE' } ), FileType::RAW );
    REQUIRE_EQUAL( detect( std::vector<char>( 1024, 0 ) ), FileType::RAW );
}


void
testCompressedData()
{
    const auto data = createRandomData( 64_Ki );
    REQUIRE_EQUAL( detect( data ), FileType::RAW );
    REQUIRE_EQUAL( detect( compressWithZlib( data ) ), FileType::GZIP );
    REQUIRE_EQUAL( detect( compressWithZstd( data ) ), FileType::ZSTD );
}


void
testPositionIsRestored()
{
    const std::vector<char> data = { 'a', 'b', '\x1F', '\x8B', 'c', 'd' };
    BufferViewFileReader reader( data );
    reader.seekTo( 2 );
    REQUIRE_EQUAL( determineFileType( reader ), FileType::GZIP );
    REQUIRE_EQUAL( reader.tell(), size_t( 2 ) );
}


int
main()
{
    testMagicBytes();
    testCompressedData();
    testPositionIsRestored();

    REQUIRE_EQUAL( std::string( toString( FileType::RAW ) ), std::string( "Raw" ) );
    REQUIRE_EQUAL( std::string( toString( FileType::GZIP ) ), std::string( "GZIP" ) );
    REQUIRE_EQUAL( std::string( toString( FileType::ZSTD ) ), std::string( "ZSTD" ) );

    std::cout << "Tests successful: " << ( gnTests - gnTestErrors ) << " / " << gnTests << "\n";

    return gnTestErrors == 0 ? 0 : 1;
}
