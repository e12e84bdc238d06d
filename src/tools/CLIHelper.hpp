#pragma once

#include <algorithm>
#include <cstdint>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

#include <cxxopts.hpp>

#include <rapidflash/ProgressTracker.hpp>


[[nodiscard]] inline std::vector<std::string>
getFilePaths( cxxopts::ParseResult const& parsedArgs,
              std::string          const& argument )
{
    if ( parsedArgs.count( argument ) == 0 ) {
        return {};
    }

    std::vector<std::string> paths;
    for ( const auto& path : parsedArgs[argument].as<std::vector<std::string> >() ) {
        if ( path.empty() ) {
            continue;
        }
        if ( std::find( paths.begin(), paths.end(), path ) != paths.end() ) {
            if ( parsedArgs.count( "quiet" ) == 0 ) {
                std::cerr << "[Warning] Output '" << path << "' specified more than once. Will write to it once.\n";
            }
            continue;
        }
        paths.emplace_back( path );
    }
    return paths;
}


/**
 * The line starts by returning the cursor and clearing the terminal line so that it can be printed repeatedly.
 */
[[nodiscard]] inline std::string
formatProgressLine( const rapidflash::ProgressSnapshot& snapshot )
{
    std::stringstream line;
    line << "\r\x1B[2K"
         << "Progress: " << std::fixed << std::setprecision( 2 ) << snapshot.fractionComplete * 100 << "%"
         << " | Speed: " << snapshot.throughputBytesPerSecond / ( 1024.0 * 1024.0 ) << " MB/s"
         << " | Elapsed: " << static_cast<uint64_t>( snapshot.elapsedSeconds ) << "s";
    return std::move( line ).str();
}
