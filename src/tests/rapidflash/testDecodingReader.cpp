#include <algorithm>
#include <iostream>
#include <memory>
#include <vector>

#include <core/DataGenerators.hpp>
#include <core/TestHelpers.hpp>
#include <filereader/BufferView.hpp>
#include <rapidflash/DecodingReader.hpp>


using namespace rapidflash;


[[nodiscard]] std::vector<char>
decodeAll( const std::vector<char>& encoded,
           FileType                 fileType,
           size_t                   bufferSize )
{
    auto reader = openDecodingReader( std::make_unique<BufferViewFileReader>( encoded ), fileType );
    std::vector<char> result;
    std::vector<char> buffer( bufferSize );
    while ( true ) {
        const auto nBytesRead = reader->read( buffer.data(), buffer.size() );
        if ( nBytesRead == 0 ) {
            break;
        }
        result.insert( result.end(), buffer.begin(), buffer.begin() + nBytesRead );
    }

    REQUIRE( reader->eof() );
    REQUIRE_EQUAL( reader->tell(), result.size() );
    return result;
}


[[nodiscard]] std::vector<char>
concatenate( const std::vector<char>& a,
             const std::vector<char>& b )
{
    auto result = a;
    result.insert( result.end(), b.begin(), b.end() );
    return result;
}


void
testRaw()
{
    const auto data = createRandomData( 100_Ki );
    auto reader = openDecodingReader( std::make_unique<BufferViewFileReader>( data ), FileType::RAW );
    REQUIRE( reader->seekable() );
    REQUIRE( decodeAll( data, FileType::RAW, 4_Ki ) == data );
}


void
testDecoder( FileType fileType )
{
    std::cerr << "Test decoder for " << fileType << "\n";

    const auto compress = [fileType] ( const std::vector<char>& data ) {
        return fileType == FileType::GZIP ? compressWithZlib( data ) : compressWithZstd( data );
    };

    const auto image = createSparseImage( 3_Mi + 123 );
    const auto encoded = compress( image );

    for ( const auto bufferSize : { size_t( 1 ), size_t( 4_Ki + 1 ), size_t( 1_Mi ), size_t( 8_Mi ) } ) {
        if ( bufferSize == 1 ) {
            /* Byte-wise decoding of the whole image would take too long. Test it on a small image. */
            const auto smallImage = createRandomData( 10_Ki );
            REQUIRE( decodeAll( compress( smallImage ), fileType, bufferSize ) == smallImage );
        } else {
            REQUIRE( decodeAll( encoded, fileType, bufferSize ) == image );
        }
    }

    /* Decoders are forward-only. */
    {
        auto reader = openDecodingReader( std::make_unique<BufferViewFileReader>( encoded ), fileType );
        REQUIRE( !reader->seekable() );
        REQUIRE( !reader->size().has_value() );
        REQUIRE_THROWS( reader->seek( 0 ) );
    }

    /* Concatenated members or frames are decoded one after another. */
    {
        const auto secondImage = createRandomData( 1_Mi, /* seed */ 99 );
        const auto decoded = decodeAll( concatenate( encoded, compress( secondImage ) ), fileType, 1_Mi );
        REQUIRE( decoded == concatenate( image, secondImage ) );
    }

    /* An empty payload. */
    {
        REQUIRE( decodeAll( compress( std::vector<char>() ), fileType, 1_Mi ).empty() );
    }

    /* Truncated data must not be silently accepted. */
    {
        const std::vector<char> truncated( encoded.begin(), encoded.begin() + encoded.size() / 2 );
        REQUIRE_THROWS( decodeAll( truncated, fileType, 1_Mi ) );
    }

    /* Corrupted data. For gzip, the checksum detects changes in stored blocks. Zstd frames are written without
     * checksum, therefore also corrupt the frame header descriptor. */
    {
        auto corrupted = encoded;
        std::fill( corrupted.begin() + 4, corrupted.begin() + 200, '\xFF' );
        REQUIRE_THROWS( decodeAll( corrupted, fileType, 1_Mi ) );
    }
}


void
testGzipZeroPadding()
{
    const auto image = createRandomData( 100_Ki );
    auto encoded = compressWithZlib( image );
    encoded.resize( encoded.size() + 1000, 0 );
    REQUIRE( decodeAll( encoded, FileType::GZIP, 64_Ki ) == image );
}


void
testCountDecodedBytes()
{
    const auto image = createSparseImage( 2_Mi + 5 );
    {
        BufferViewFileReader reader( image );
        REQUIRE_EQUAL( countDecodedBytes( reader ), image.size() );
    }

    const auto encoded = compressWithZstd( image );
    auto reader = openDecodingReader( std::make_unique<BufferViewFileReader>( encoded ), FileType::ZSTD );
    REQUIRE_EQUAL( countDecodedBytes( *reader, 100_Ki ), image.size() );
    REQUIRE_EQUAL( reader->size().value_or( 0 ), image.size() );
}


int
main()
{
    testRaw();
    testDecoder( FileType::GZIP );
    testDecoder( FileType::ZSTD );
    testGzipZeroPadding();
    testCountDecodedBytes();

    REQUIRE_THROWS( openDecodingReader( {}, FileType::RAW ) );

    std::cout << "Tests successful: " << ( gnTests - gnTestErrors ) << " / " << gnTests << "\n";

    return gnTestErrors == 0 ? 0 : 1;
}
