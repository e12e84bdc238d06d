#include <chrono>
#include <cstdint>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>
#include <typeinfo>
#include <vector>

#include <cxxopts.hpp>

#include <core/common.hpp>
#include <core/Error.hpp>
#include <core/FileUtils.hpp>
#include <core/PeriodicThread.hpp>
#include <rapidflash/rapidflash.hpp>

#include "CLIHelper.hpp"


using namespace rapidflash;


void
printRapidflashHelp( const cxxopts::Options& options )
{
    std::cout
    << options.help()
    << "\n"
    << "The image may be raw, gzip-compressed, or zstd-compressed. The format is detected automatically.\n"
    << "All data on the given outputs will be overwritten!\n"
    << "\n"
    << "Examples:\n"
    << "\n"
    << "List block devices:\n"
    << "  rapidflash --list-devices\n"
    << "\n"
    << "Flash a compressed image to a USB stick:\n"
    << "  rapidflash -i image.img.gz -o /dev/sdb\n"
    << "\n"
    << "Flash an image to two SD cards at once:\n"
    << "  rapidflash -i image.img.zst -o /dev/sdb -o /dev/sdc\n"
    << std::endl;
}


void
printDevices( const DeviceEnumerator& enumerator )
{
    const auto devices = enumerator.enumerate();
    if ( devices.empty() ) {
        std::cout << "No block devices found.\n";
        return;
    }

    for ( const auto& device : devices ) {
        std::cout << device.path << "  " << device.humanSize << "  " << device.category << "  "
                  << device.displayName << "\n";
    }
}


int
rapidflashCLI( int                  argc,
               char const * const * argv )
{
    cxxopts::Options options( "rapidflash",
                              "Writes raw or compressed disk images to one or more block devices or files." );
    options.add_options( "Flash Options" )
        ( "i,input"      , "Image file to write. May be gzip- or zstd-compressed.",
          cxxopts::value<std::string>() )
        ( "o,output"     , "Destination block device or file. May be specified multiple times to write the same "
                           "image to multiple destinations at once.",
          cxxopts::value<std::vector<std::string> >() )
        ( "l,list-devices", "List available block devices and exit." );

    options.add_options( "Advanced" )
        ( "chunk-size", "The amount of data read and written at once in KiB.",
          cxxopts::value<unsigned int>()->default_value( "8192" ) )
        ( "sync-interval", "The amount of data in MiB after which the written data is synced to the devices. "
                           "Defaults to 16 MiB for one output and 32 MiB for multiple outputs.",
          cxxopts::value<unsigned int>() )
        ( "size-strategy", "How to determine the image size for the progress: auto, exact, or streaming. "
                           "exact determines the size before writing, which requires decoding zstd images twice. "
                           "streaming infers the size from the partition table or estimates it while writing.",
          cxxopts::value<std::string>()->default_value( "auto" ) )
        ( "no-sparse", "Write chunks consisting only of zeros instead of skipping over them." )
        ( "stop-at-resolved-size", "Stop writing when the determined image size has been reached even if the "
                                   "image contains more data." );

    options.add_options( "Output Options" )
        ( "h,help"   , "Print this help message." )
        ( "q,quiet"  , "Do not show the progress line." )
        ( "v,verbose", "Print debug output." )
        ( "V,version", "Display software version." );

    options.parse_positional( { "input" } );

    const auto parsedArgs = options.parse( argc, argv );

    const auto quiet = parsedArgs["quiet"].as<bool>();

    FlashOptions flashOptions;
    flashOptions.verbose = parsedArgs["verbose"].as<bool>();

    /* Check against simple commands like help and version. */

    if ( parsedArgs.count( "help" ) > 0 ) {
        printRapidflashHelp( options );
        return 0;
    }

    if ( parsedArgs.count( "version" ) > 0 ) {
        std::cout << "rapidflash, a tool for writing raw and compressed disk images to block devices, "
                  << "version 0.1.0.\n";
        return 0;
    }

    if ( parsedArgs.count( "list-devices" ) > 0 ) {
        printDevices( SysfsDeviceEnumerator() );
        return 0;
    }

    /* Parse input and output file specifications. */

    if ( parsedArgs.count( "input" ) != 1 ) {
        std::cerr << "Exactly one image file to flash must be specified!\n";
        return 1;
    }

    const auto inputFilePath = parsedArgs["input"].as<std::string>();
    if ( !fileExists( inputFilePath ) ) {
        std::cerr << "Input file could not be found! Specified path: " << inputFilePath << "\n";
        return 1;
    }

    const auto outputFilePaths = getFilePaths( parsedArgs, "output" );
    if ( outputFilePaths.empty() ) {
        std::cerr << "At least one output device or file must be specified!\n";
        return 1;
    }

    for ( const auto& outputFilePath : outputFilePaths ) {
        if ( ( outputFilePath == inputFilePath ) || isSameFile( outputFilePath, inputFilePath ) ) {
            std::cerr << "The image file must not also be used as output!\n";
            return 1;
        }
    }

    if ( flashOptions.verbose ) {
        std::cerr << "file path for input: " << inputFilePath << "\n";
        for ( const auto& outputFilePath : outputFilePaths ) {
            std::cerr << "file path for output: " << outputFilePath << "\n";
        }
    }

    /* Parse other arguments. */

    const auto chunkSize = parsedArgs["chunk-size"].as<unsigned int>();
    if ( chunkSize == 0 ) {
        std::cerr << "The chunk size must be larger than 0!\n";
        return 1;
    }
    flashOptions.chunkSize = static_cast<size_t>( chunkSize ) * 1_Ki;

    if ( parsedArgs.count( "sync-interval" ) > 0 ) {
        const auto syncInterval = parsedArgs["sync-interval"].as<unsigned int>();
        if ( syncInterval == 0 ) {
            std::cerr << "The sync interval must be larger than 0!\n";
            return 1;
        }
        flashOptions.syncInterval = static_cast<uint64_t>( syncInterval ) * 1_Mi;
    }

    flashOptions.sizeStrategy = parseSizeStrategy( parsedArgs["size-strategy"].as<std::string>() );
    flashOptions.sparse = parsedArgs.count( "no-sparse" ) == 0;
    flashOptions.stopAtResolvedSize = parsedArgs.count( "stop-at-resolved-size" ) > 0;

    /* Actually do things as requested. */

    ProgressTracker progress;
    {
        std::unique_ptr<PeriodicThread> progressPrinter;
        if ( !quiet ) {
            progressPrinter = std::make_unique<PeriodicThread>(
                [&progress] () { std::cerr << formatProgressLine( progress.snapshot() ) << std::flush; },
                std::chrono::milliseconds( 200 ) );
        }

        try {
            flash( inputFilePath, outputFilePaths, progress, flashOptions );
        } catch ( const FlashError& ) {
            if ( progressPrinter ) {
                progressPrinter.reset();
                std::cerr << "\n";
            }
            throw;
        }

        if ( progressPrinter ) {
            progressPrinter.reset();
            std::cerr << "\n";
        }
    }

    const auto snapshot = progress.snapshot();
    std::cout << "Flash complete! Wrote " << formatBytes( snapshot.bytesWritten ) << " to "
              << outputFilePaths.size() << ( outputFilePaths.size() == 1 ? " destination" : " destinations" )
              << " in " << snapshot.elapsedSeconds << " s -> "
              << snapshot.throughputBytesPerSecond / static_cast<double>( 1_Mi ) << " MB/s\n";

    return 0;
}


#if !defined( WITHOUT_MAIN )
int
main( int argc, char** argv )
{
    try
    {
        return rapidflashCLI( argc, argv );
    }
    catch ( const std::exception& exception )
    {
        const std::string_view message{ exception.what() };
        if ( message.empty() ) {
            std::cerr << "Caught exception with typeid: " << typeid( exception ).name() << "\n";
        } else {
            std::cerr << "Caught exception: " << message << "\n";
        }
        return 1;
    }

    return 1;
}
#endif
