#include <algorithm>
#include <iostream>
#include <memory>
#include <utility>
#include <vector>

#include <core/DataGenerators.hpp>
#include <core/TestHelpers.hpp>
#include <filewriter/Memory.hpp>
#include <rapidflash/SparseMultiWriter.hpp>


using namespace rapidflash;


void
testIsAllZero()
{
    std::vector<char> data( 1000, 0 );
    REQUIRE( isAllZero( data.data(), 0 ) );
    REQUIRE( isAllZero( data.data(), data.size() ) );

    /* Non-zero bytes in the 8-byte words and in the unaligned tail. */
    for ( const auto position : { size_t( 0 ), size_t( 7 ), size_t( 8 ), size_t( 500 ), size_t( 991 ),
                                  size_t( 992 ), size_t( 999 ) } ) {
        data[position] = 1;
        REQUIRE( !isAllZero( data.data(), data.size() ) );
        data[position] = 0;
    }

    data[999] = 1;
    REQUIRE( isAllZero( data.data(), 999 ) );
}


[[nodiscard]] std::pair<SparseMultiWriter, std::vector<MemoryFileWriter*> >
createWriter( size_t count,
              bool   sparse = true )
{
    std::vector<UniqueFileWriter> destinations;
    std::vector<MemoryFileWriter*> views;
    for ( size_t i = 0; i < count; ++i ) {
        auto destination = std::make_unique<MemoryFileWriter>();
        views.emplace_back( destination.get() );
        destinations.emplace_back( std::move( destination ) );
    }
    return { SparseMultiWriter( std::move( destinations ), sparse ), std::move( views ) };
}


void
testIdenticalDestinations()
{
    auto [writer, destinations] = createWriter( 3 );
    REQUIRE_EQUAL( writer.size(), size_t( 3 ) );

    const auto image = createSparseImage( 8_Mi + 100, 1_Mi );
    std::vector<size_t> zeroChunks;
    uint64_t skippedBytes{ 0 };
    for ( size_t offset = 0; offset < image.size(); offset += 1_Mi ) {
        const auto size = std::min<size_t>( 1_Mi, image.size() - offset );
        if ( writer.write( image.data() + offset, size ) ) {
            zeroChunks.emplace_back( offset );
            skippedBytes += size;
        }
    }
    writer.flush();

    REQUIRE( !zeroChunks.empty() );
    REQUIRE_EQUAL( writer.skippedBytes(), skippedBytes );

    for ( const auto* destination : destinations ) {
        REQUIRE( destination->data() == image );
        REQUIRE_EQUAL( destination->tell(), image.size() );
        /* Each skipped chunk is a seek followed by a flush. */
        REQUIRE_EQUAL( destination->statistics().seekCalls, zeroChunks.size() );
        REQUIRE_EQUAL( destination->statistics().flushCalls, zeroChunks.size() + 1 );
        REQUIRE_EQUAL( destination->statistics().writeCalls,
                       ( image.size() + 1_Mi - 1 ) / 1_Mi - zeroChunks.size() );
    }
}


void
testTrailingZeros()
{
    auto [writer, destinations] = createWriter( 2 );

    std::vector<char> image( 3_Mi, 0 );
    image[0] = 'a';
    for ( size_t offset = 0; offset < image.size(); offset += 1_Mi ) {
        writer.write( image.data() + offset, 1_Mi );
    }
    writer.close();

    /* The flush after each skip extends the destinations to their full size. */
    for ( const auto* destination : destinations ) {
        REQUIRE( destination->data() == image );
        REQUIRE( destination->closed() );
    }
}


void
testDenseMode()
{
    auto [writer, destinations] = createWriter( 2, /* sparse */ false );

    const std::vector<char> zeros( 4_Ki, 0 );
    REQUIRE( !writer.write( zeros.data(), zeros.size() ) );
    REQUIRE( !writer.write( zeros.data(), 0 ) );
    REQUIRE_EQUAL( writer.skippedBytes(), uint64_t( 0 ) );

    for ( const auto* destination : destinations ) {
        REQUIRE( destination->data() == zeros );
        REQUIRE_EQUAL( destination->statistics().writeCalls, size_t( 1 ) );
        REQUIRE_EQUAL( destination->statistics().seekCalls, size_t( 0 ) );
    }
}


void
testSyncFanOut()
{
    auto [writer, destinations] = createWriter( 2 );
    writer.syncData();
    writer.syncData();
    writer.syncAll();

    for ( const auto* destination : destinations ) {
        REQUIRE_EQUAL( destination->statistics().syncDataCalls, size_t( 2 ) );
        REQUIRE_EQUAL( destination->statistics().syncAllCalls, size_t( 1 ) );
    }
}


void
testFailingDestination()
{
    std::vector<UniqueFileWriter> destinations;
    auto first = std::make_unique<MemoryFileWriter>();
    const auto* const firstView = first.get();
    destinations.emplace_back( std::move( first ) );
    destinations.emplace_back( std::make_unique<MemoryFileWriter>( /* failAtOffset */ 6_Ki ) );
    auto last = std::make_unique<MemoryFileWriter>();
    const auto* const lastView = last.get();
    destinations.emplace_back( std::move( last ) );

    SparseMultiWriter writer( std::move( destinations ) );
    const auto data = createRandomData( 4_Ki );
    writer.write( data.data(), data.size() );
    REQUIRE_THROWS( writer.write( data.data(), data.size() ) );

    /* Destinations are written in order and the failure stops the fan-out. */
    REQUIRE_EQUAL( firstView->data().size(), size_t( 8_Ki ) );
    REQUIRE_EQUAL( lastView->data().size(), size_t( 4_Ki ) );
}


void
testInvalidArguments()
{
    REQUIRE_THROWS( SparseMultiWriter( std::vector<UniqueFileWriter>() ) );

    std::vector<UniqueFileWriter> destinations;
    destinations.emplace_back( std::make_unique<MemoryFileWriter>() );
    destinations.emplace_back( nullptr );
    REQUIRE_THROWS( SparseMultiWriter( std::move( destinations ) ) );
}


int
main()
{
    testIsAllZero();
    testIdenticalDestinations();
    testTrailingZeros();
    testDenseMode();
    testSyncFanOut();
    testFailingDestination();
    testInvalidArguments();

    std::cout << "Tests successful: " << ( gnTests - gnTestErrors ) << " / " << gnTests << "\n";

    return gnTestErrors == 0 ? 0 : 1;
}
