#include <algorithm>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include <core/common.hpp>
#include <core/DataGenerators.hpp>
#include <core/FileUtils.hpp>
#include <core/TestHelpers.hpp>
#include <filewriter/FileWriter.hpp>
#include <filewriter/Memory.hpp>
#include <filewriter/Standard.hpp>


using namespace rapidflash;


void
testStandardFileWriter( const std::filesystem::path& folder )
{
    const auto filePath = folder / "written";
    const auto data = createRandomData( 100_Ki, /* seed */ 123 );

    {
        /* Use a small buffer to test writes spanning the buffer and bypassing it. */
        StandardFileWriter writer( filePath, /* buffer size */ 4_Ki );
        REQUIRE( !writer.closed() );

        writer.write( data.data(), 1000 );
        REQUIRE_EQUAL( writer.tell(), size_t( 1000 ) );
        writer.write( data.data() + 1000, 10000 );
        REQUIRE_EQUAL( writer.tell(), size_t( 11000 ) );
        writer.write( data.data() + 11000, 1 );
        writer.write( data.data() + 11001, data.size() - 11001 );
        REQUIRE_EQUAL( writer.tell(), data.size() );

        writer.syncData();
        REQUIRE_EQUAL( fileSize( filePath.string() ), data.size() );

        writer.close();
        REQUIRE( writer.closed() );
        REQUIRE_THROWS( writer.write( data.data(), 1 ) );
    }
    REQUIRE( readFile<std::vector<char> >( filePath ) == data );

    /* Reopening truncates the old contents. */
    {
        StandardFileWriter writer( filePath );
        writer.write( data.data(), 10 );
        writer.close();
    }
    REQUIRE_EQUAL( fileSize( filePath.string() ), size_t( 10 ) );
}


void
testTrailingSeekExtendsFile( const std::filesystem::path& folder )
{
    const auto filePath = folder / "sparse";
    const auto data = createRandomData( 4_Ki, /* seed */ 7 );

    StandardFileWriter writer( filePath );
    writer.write( data.data(), data.size() );
    writer.seek( 1_Mi, SEEK_CUR );
    REQUIRE_EQUAL( writer.tell(), size_t( 4_Ki + 1_Mi ) );
    writer.flush();
    REQUIRE_EQUAL( fileSize( filePath.string() ), size_t( 4_Ki + 1_Mi ) );
    writer.syncAll();
    writer.close();

    const auto contents = readFile<std::vector<char> >( filePath );
    REQUIRE_EQUAL( contents.size(), size_t( 4_Ki + 1_Mi ) );
    REQUIRE( std::equal( data.begin(), data.end(), contents.begin() ) );
    REQUIRE( std::all_of( contents.begin() + data.size(), contents.end(), [] ( char c ) { return c == 0; } ) );
}


void
testOpenFailure( const std::filesystem::path& folder )
{
    REQUIRE_THROWS( StandardFileWriter( folder / "does-not-exist" / "file" ) );
}


void
testMemoryFileWriter()
{
    MemoryFileWriter writer;
    writer.write( "abc", 3 );
    writer.seek( 2, SEEK_CUR );
    REQUIRE_EQUAL( writer.tell(), size_t( 5 ) );
    REQUIRE_EQUAL( writer.data().size(), size_t( 3 ) );

    writer.flush();
    REQUIRE_EQUAL( writer.data().size(), size_t( 5 ) );

    writer.write( "d", 1 );
    writer.syncData();
    writer.syncAll();

    const std::vector<char> expected = { 'a', 'b', 'c', 0, 0, 'd' };
    REQUIRE( writer.data() == expected );
    REQUIRE_EQUAL( writer.statistics().writeCalls, size_t( 2 ) );
    REQUIRE_EQUAL( writer.statistics().seekCalls, size_t( 1 ) );
    REQUIRE_EQUAL( writer.statistics().flushCalls, size_t( 3 ) );
    REQUIRE_EQUAL( writer.statistics().syncDataCalls, size_t( 1 ) );
    REQUIRE_EQUAL( writer.statistics().syncAllCalls, size_t( 1 ) );

    MemoryFileWriter failingWriter( /* fail at offset */ 4 );
    failingWriter.write( "abc", 3 );
    REQUIRE_THROWS( failingWriter.write( "de", 2 ) );
}


int
main()
{
    const auto tmpFolder = createTemporaryDirectory( "rapidflash.testFileWriter" );

    testStandardFileWriter( tmpFolder );
    testTrailingSeekExtendsFile( tmpFolder );
    testOpenFailure( tmpFolder );
    testMemoryFileWriter();

    std::cout << "Tests successful: " << ( gnTests - gnTestErrors ) << " / " << gnTests << "\n";

    return gnTestErrors == 0 ? 0 : 1;
}
