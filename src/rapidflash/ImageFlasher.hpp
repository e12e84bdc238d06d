#pragma once

#include <algorithm>
#include <atomic>
#include <cstdint>
#include <functional>
#include <iostream>
#include <memory>
#include <optional>
#include <ostream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <core/common.hpp>
#include <core/Error.hpp>
#include <core/FileUtils.hpp>
#include <filereader/FileReader.hpp>
#include <filereader/Standard.hpp>
#include <filewriter/FileWriter.hpp>
#include <filewriter/Standard.hpp>

#include "DecodingReader.hpp"
#include "format.hpp"
#include "ProgressTracker.hpp"
#include "SizeResolver.hpp"
#include "SparseMultiWriter.hpp"
#include "SyncScheduler.hpp"


namespace rapidflash
{
enum class SizeStrategy
{
    /** Exact sizes for single destinations and raw images, adaptive estimates for compressed images
     * written to multiple destinations. */
    AUTO,
    EXACT,
    STREAMING,
};


[[nodiscard]] inline const char*
toString( SizeStrategy strategy )
{
    switch ( strategy )
    {
    case SizeStrategy::AUTO:
        return "auto";
    case SizeStrategy::EXACT:
        return "exact";
    case SizeStrategy::STREAMING:
        return "streaming";
    }
    return "";
}


[[nodiscard]] inline SizeStrategy
parseSizeStrategy( const std::string& name )
{
    for ( const auto strategy : { SizeStrategy::AUTO, SizeStrategy::EXACT, SizeStrategy::STREAMING } ) {
        if ( name == toString( strategy ) ) {
            return strategy;
        }
    }
    throw std::invalid_argument( "Unknown size strategy '" + name + "'! Expected one of: auto, exact, streaming." );
}


inline std::ostream&
operator<<( std::ostream& out,
            SizeStrategy  strategy )
{
    out << toString( strategy );
    return out;
}


enum class FlashState
{
    IDLE,
    RESOLVING,
    STREAMING,
    FINALIZING,
    COMPLETED,
    FAILED,
};


[[nodiscard]] inline const char*
toString( FlashState state )
{
    switch ( state )
    {
    case FlashState::IDLE:
        return "Idle";
    case FlashState::RESOLVING:
        return "Resolving";
    case FlashState::STREAMING:
        return "Streaming";
    case FlashState::FINALIZING:
        return "Finalizing";
    case FlashState::COMPLETED:
        return "Completed";
    case FlashState::FAILED:
        return "Failed";
    }
    return "";
}


inline std::ostream&
operator<<( std::ostream& out,
            FlashState    state )
{
    out << toString( state );
    return out;
}


struct FlashOptions
{
    size_t chunkSize{ 8_Mi };
    /** Bytes between data syncs. Defaults to SyncScheduler::defaultSyncInterval. */
    std::optional<uint64_t> syncInterval;
    bool sparse{ true };
    SizeStrategy sizeStrategy{ SizeStrategy::AUTO };
    /** Stop reading the image once the resolved exact size has been written. */
    bool stopAtResolvedSize{ false };
    bool verbose{ false };
};


struct ImageSource
{
    std::string path;
    FileType fileType{ FileType::RAW };
    SizeEstimate size;
};


struct FlashStatistics
{
    uint64_t bytesWritten{ 0 };
    uint64_t bytesSkipped{ 0 };
    size_t syncCount{ 0 };
};


/**
 * Runs one flash operation: resolve the image format and size, stream the decoded image chunk-wise to all
 * destinations, and sync everything at the end. The state can be queried from other threads. Every error
 * is reported as FlashError, after which the destinations contain partially written data.
 */
class ImageFlasher
{
public:
    using WriterFactory = std::function<UniqueFileWriter( const std::string& )>;

public:
    explicit
    ImageFlasher( FlashOptions  options = {},
                  WriterFactory openWriter = {} ) :
        m_options( std::move( options ) ),
        m_openWriter( openWriter
                      ? std::move( openWriter )
                      : WriterFactory( [] ( const std::string& path ) -> UniqueFileWriter {
                          return std::make_unique<StandardFileWriter>( path );
                      } ) )
    {}

    void
    flash( const std::string&              imagePath,
           const std::vector<std::string>& destinationPaths,
           ProgressTracker&                progress )
    {
        if ( m_state != FlashState::IDLE ) {
            throw FlashError( Error::INVALID_ARGUMENT, "An ImageFlasher can only be used for one operation!" );
        }

        if ( destinationPaths.empty() ) {
            m_state = FlashState::FAILED;
            throw FlashError( Error::INVALID_ARGUMENT, "No destination given!" );
        }

        if ( m_options.chunkSize == 0 ) {
            m_state = FlashState::FAILED;
            throw FlashError( Error::INVALID_ARGUMENT, "The chunk size must be larger than 0!" );
        }

        /* Opening a destination truncates it, which would destroy the image before it is read. */
        for ( const auto& destinationPath : destinationPaths ) {
            if ( isSameFile( imagePath, destinationPath ) ) {
                m_state = FlashState::FAILED;
                throw FlashError( Error::INVALID_ARGUMENT, "The image '" + imagePath
                                  + "' must not also be used as destination '" + destinationPath + "'!" );
            }
        }

        try {
            run( imagePath, destinationPaths, progress );
            m_state = FlashState::COMPLETED;
        } catch ( const FlashError& ) {
            m_state = FlashState::FAILED;
            throw;
        } catch ( const std::exception& exception ) {
            m_state = FlashState::FAILED;
            throw FlashError( Error::IO_FAILURE, exception.what() );
        }
    }

    [[nodiscard]] FlashState
    state() const noexcept
    {
        return m_state;
    }

    /**
     * Only valid after the flash operation has finished.
     */
    [[nodiscard]] const std::optional<ImageSource>&
    imageSource() const noexcept
    {
        return m_imageSource;
    }

    /**
     * Only valid after the flash operation has finished.
     */
    [[nodiscard]] const FlashStatistics&
    statistics() const noexcept
    {
        return m_statistics;
    }

private:
    [[nodiscard]] bool
    useAdaptiveSize( FileType fileType,
                     size_t   destinationCount ) const noexcept
    {
        switch ( m_options.sizeStrategy )
        {
        case SizeStrategy::EXACT:
            return false;
        case SizeStrategy::STREAMING:
            return true;
        case SizeStrategy::AUTO:
            break;
        }
        return ( destinationCount > 1 ) && ( fileType != FileType::RAW );
    }

    void
    run( const std::string&              imagePath,
         const std::vector<std::string>& destinationPaths,
         ProgressTracker&                progress )
    {
        m_state = FlashState::RESOLVING;

        auto imageFile = std::make_unique<StandardFileReader>( imagePath );
        if ( !imageFile->seekable() ) {
            throw FlashError( Error::INVALID_ARGUMENT, "The image '" + imagePath + "' must be a seekable file!" );
        }

        const auto fileType = determineFileType( *imageFile );
        auto sizeEstimate = useAdaptiveSize( fileType, destinationPaths.size() )
                            ? SizeEstimate::adaptive()
                            : resolveExactSize( imagePath, fileType );
        m_imageSource = ImageSource{ imagePath, fileType, sizeEstimate };
        progress.setTotal( sizeEstimate.isExact() ? sizeEstimate.bytes : adaptiveTotalBytes( 0 ) );

        if ( m_options.verbose ) {
            std::cerr << ( ThreadSafeOutput() << "Image:" << imagePath << "format:" << fileType
                      << "size:" << sizeEstimate ).str();
        }

        std::vector<UniqueFileWriter> destinations;
        destinations.reserve( destinationPaths.size() );
        for ( const auto& path : destinationPaths ) {
            destinations.emplace_back( m_openWriter( path ) );
        }
        SparseMultiWriter writer( std::move( destinations ), m_options.sparse );
        SyncScheduler syncScheduler( writer, m_options.syncInterval.value_or(
                                         SyncScheduler::defaultSyncInterval( destinationPaths.size() ) ) );

        const auto reader = openDecodingReader( std::move( imageFile ), fileType );

        m_state = FlashState::STREAMING;

        HeaderSizeInferrer headerSizeInferrer;
        std::vector<char> chunk( m_options.chunkSize );
        uint64_t bytesWritten{ 0 };
        bool warnedAboutUnderestimate{ false };

        while ( true ) {
            auto nBytesToRead = chunk.size();
            if ( m_options.stopAtResolvedSize && sizeEstimate.isExact() ) {
                if ( bytesWritten >= sizeEstimate.bytes ) {
                    break;
                }
                nBytesToRead = static_cast<size_t>( std::min<uint64_t>( nBytesToRead,
                                                                        sizeEstimate.bytes - bytesWritten ) );
            }

            const auto nBytesRead = readFull( *reader, chunk.data(), nBytesToRead );
            if ( nBytesRead == 0 ) {
                break;
            }

            if ( !sizeEstimate.isExact() ) {
                if ( const auto inferredSize = headerSizeInferrer.append( chunk.data(), nBytesRead ); inferredSize ) {
                    sizeEstimate = SizeEstimate::exact( *inferredSize );
                    if ( m_options.verbose ) {
                        std::cerr << ( ThreadSafeOutput() << "Inferred image size from partition table:"
                                  << formatBytes( *inferredSize ) ).str();
                    }
                }
            }

            if ( writer.write( chunk.data(), nBytesRead ) ) {
                m_statistics.bytesSkipped += nBytesRead;
            }
            bytesWritten += nBytesRead;

            /* Update the total before the written bytes so that observers never see more written than total. */
            if ( sizeEstimate.isExact() ) {
                if ( bytesWritten > sizeEstimate.bytes ) {
                    if ( !warnedAboutUnderestimate && m_options.verbose ) {
                        std::cerr << ( ThreadSafeOutput() << "[Warning] The image is larger than the resolved size of"
                                  << sizeEstimate.bytes << "B." ).str();
                        warnedAboutUnderestimate = true;
                    }
                    sizeEstimate.bytes = bytesWritten;
                }
                progress.setTotal( sizeEstimate.bytes );
            } else {
                progress.setTotal( adaptiveTotalBytes( bytesWritten ) );
            }
            progress.recordWritten( nBytesRead );

            syncScheduler.recordWritten( nBytesRead );
        }

        m_state = FlashState::FINALIZING;

        syncScheduler.finalize();
        writer.close();

        if ( sizeEstimate.isExact() && ( sizeEstimate.bytes != bytesWritten ) && m_options.verbose ) {
            std::cerr << ( ThreadSafeOutput() << "[Warning] Wrote" << bytesWritten << "B instead of the resolved"
                          << sizeEstimate.bytes << "B." ).str();
        }
        progress.setTotal( bytesWritten );
        m_imageSource->size = SizeEstimate::exact( bytesWritten );

        m_statistics.bytesWritten = bytesWritten;
        m_statistics.syncCount = syncScheduler.syncCount();

        if ( m_options.verbose ) {
            std::cerr << ( ThreadSafeOutput() << "Wrote" << formatBytes( bytesWritten ) << "to"
                      << destinationPaths.size() << "destination(s), skipped" << formatBytes( m_statistics.bytesSkipped )
                      << "of zeros, synced" << m_statistics.syncCount << "times." ).str();
        }
    }

private:
    const FlashOptions m_options;
    const WriterFactory m_openWriter;

    std::atomic<FlashState> m_state{ FlashState::IDLE };
    std::optional<ImageSource> m_imageSource;
    FlashStatistics m_statistics;
};


/**
 * Flashes the image to all destinations. On failure, the progress is reset and FlashError is thrown.
 */
inline void
flash( const std::string&              imagePath,
       const std::vector<std::string>& destinationPaths,
       ProgressTracker&                progress,
       FlashOptions                    options = {} )
{
    ImageFlasher flasher( std::move( options ) );
    try {
        flasher.flash( imagePath, destinationPaths, progress );
    } catch ( const FlashError& ) {
        progress.reset();
        throw;
    }
}
}  // namespace rapidflash
