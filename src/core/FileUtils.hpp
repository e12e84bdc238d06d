#pragma once

#include <cstdio>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <functional>
#include <limits>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

#ifndef _GNU_SOURCE
    #define _GNU_SOURCE
#endif

#include <errno.h>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include "common.hpp"


namespace rapidflash
{
[[nodiscard]] inline const char*
originToString( int origin )
{
    switch ( origin )
    {
    case SEEK_SET:
        return "SEEK_SET";
    case SEEK_CUR:
        return "SEEK_CUR";
    case SEEK_END:
        return "SEEK_END";
    default:
        break;
    }

    throw std::invalid_argument( "Unknown origin" );
}


inline bool
fileExists( const std::string& filePath )
{
    return std::ifstream( filePath, std::ios_base::in | std::ios_base::binary ).good();
}


inline size_t
fileSize( const std::string& filePath )
{
    return std::filesystem::file_size( filePath );
}


inline size_t
fileSize( const int fileDescriptor )
{
    struct stat fileStats{};
    const auto result = fstat( fileDescriptor, &fileStats );

    if ( result == -1 ) {
        std::stringstream message;
        message << "Failed to get file size because of: " << strerror( errno ) << " (" << errno << ")";
        throw std::runtime_error( std::move( message ).str() );
    }

    /* st_size is 0 for block devices. Seeking to the end is the portable way to query their capacity. */
    if ( S_ISBLK( fileStats.st_mode ) ) {  // NOLINT
        const auto oldPosition = ::lseek( fileDescriptor, 0, SEEK_CUR );
        const auto endPosition = ::lseek( fileDescriptor, 0, SEEK_END );
        if ( ( oldPosition < 0 ) || ( endPosition < 0 )
             || ( ::lseek( fileDescriptor, oldPosition, SEEK_SET ) < 0 ) ) {
            std::stringstream message;
            message << "Failed to query block device size because of: " << strerror( errno ) << " (" << errno << ")";
            throw std::runtime_error( std::move( message ).str() );
        }
        return static_cast<size_t>( endPosition );
    }

    return static_cast<size_t>( fileStats.st_size );
}


[[nodiscard]] inline bool
isRegularFile( const int fileDescriptor )
{
    struct stat fileStats{};
    return ( fstat( fileDescriptor, &fileStats ) == 0 ) && S_ISREG( fileStats.st_mode );  // NOLINT
}


/**
 * Compares the files themselves, not their path spellings, so that relative paths, symbolic links,
 * and device aliases like /dev/disk/by-id/... resolve to the same file. Paths that do not exist are
 * never the same file.
 */
[[nodiscard]] inline bool
isSameFile( const std::string& path,
            const std::string& otherPath )
{
    std::error_code errorCode;
    const auto equivalent = std::filesystem::equivalent( path, otherPath, errorCode );
    return !errorCode && equivalent;
}


inline size_t
filePosition( std::FILE* file )
{
    if ( file == nullptr ) {
        throw std::runtime_error( "File pointer to call tell on must not be null!" );
    }

    const auto offset = ::ftello( file );
    if ( offset < 0 ) {
        throw std::runtime_error( "Could not get the file position!" );
    }
    return static_cast<size_t>( offset );
}


inline void
fileSeek( std::FILE*    file,
          long long int offset,
          int           origin )
{
    if ( file == nullptr ) {
        throw std::runtime_error( "File pointer to call seek on must not be null!" );
    }

    if ( offset > static_cast<long long int>( std::numeric_limits<off_t>::max() ) ) {
        throw std::out_of_range( "fseeko only takes off_t, try compiling for 64 bit." );
    }

    const auto returnCode = ::fseeko( file, static_cast<off_t>( offset ), origin );
    if ( returnCode != 0 ) {
        std::stringstream message;
        message << "Seeking to " << offset << " from origin " << originToString( origin ) << " failed with code: "
                << returnCode << ", " << std::strerror( errno ) << "!";
        throw std::runtime_error( std::move( message ).str() );
    }
}


struct unique_file_descriptor
{
    explicit
    unique_file_descriptor( int fd ) :
        m_fd( fd )
    {}

    ~unique_file_descriptor()
    {
        close();
    }

    unique_file_descriptor() = default;

    unique_file_descriptor( const unique_file_descriptor& ) = delete;

    unique_file_descriptor&
    operator=( const unique_file_descriptor& ) = delete;

    unique_file_descriptor( unique_file_descriptor&& other ) noexcept :
        m_fd( other.m_fd )
    {
        other.m_fd = -1;
    }

    unique_file_descriptor&
    operator=( unique_file_descriptor&& other ) noexcept
    {
        close();
        m_fd = other.m_fd;
        other.m_fd = -1;
        return *this;
    }

    [[nodiscard]] constexpr int
    operator*() const noexcept
    {
        return m_fd;
    }

    [[nodiscard]] constexpr bool
    valid() const noexcept
    {
        return m_fd >= 0;
    }

    void
    close()
    {
        if ( m_fd >= 0 ) {
            ::close( m_fd );
            m_fd = -1;
        }
    }

private:
    int m_fd{ -1 };
};


using unique_file_ptr = std::unique_ptr<std::FILE, std::function<void ( std::FILE* )> >;

inline unique_file_ptr
make_unique_file_ptr( std::FILE* file )
{
    return {
        file,
        [] ( auto* ownedFile ) {
            if ( ownedFile != nullptr ) {
                std::fclose( ownedFile );  // NOLINT
            }
        }
    };
}


inline unique_file_ptr
make_unique_file_ptr( char const* const filePath,
                      char const* const mode )
{
    if ( ( filePath == nullptr ) || ( mode == nullptr ) || ( std::strlen( filePath ) == 0 ) ) {
        return {};
    }
    return make_unique_file_ptr( std::fopen( filePath, mode ) );  // NOLINT
}


inline unique_file_ptr
throwingOpen( const std::string& filePath,
              const char*        mode )
{
    if ( mode == nullptr ) {
        throw std::invalid_argument( "Mode must be a C-String and not null!" );
    }

    auto file = make_unique_file_ptr( filePath.c_str(), mode );
    if ( file == nullptr ) {
        std::stringstream msg;
        msg << "Opening file '" << filePath << "' with mode '" << mode << "' failed: " << std::strerror( errno );
        throw std::runtime_error( std::move( msg ).str() );
    }

    return file;
}


/**
 * Opens a destination for writing. Regular files are created if necessary and truncated so that regions that
 * are later skipped over instead of written read back as zeros. O_TRUNC has no effect on block devices.
 */
[[nodiscard]] inline unique_file_descriptor
throwingOpenForWriting( const std::string& filePath )
{
    const auto fileDescriptor = ::open( filePath.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644 );  // NOLINT
    if ( fileDescriptor == -1 ) {
        std::stringstream msg;
        msg << "Opening '" << filePath << "' for writing failed: " << std::strerror( errno ) << " (" << errno << ")";
        throw std::runtime_error( std::move( msg ).str() );
    }
    return unique_file_descriptor( fileDescriptor );
}


template<typename Container = std::vector<char> >
[[nodiscard]] Container
readFile( const std::string& fileName )
{
    Container contents( fileSize( fileName ) );
    const auto file = throwingOpen( fileName, "rb" );
    const auto nBytesRead = std::fread( contents.data(), sizeof( contents[0] ), contents.size(), file.get() );

    if ( nBytesRead != contents.size() ) {
        throw std::logic_error( "Did read less bytes than file is large!" );
    }

    return contents;
}


template<typename Container = std::vector<char> >
[[nodiscard]] Container
readFile( const std::filesystem::path& filePath )
{
    return readFile<Container>( filePath.string() );
}


/**
 * Posix write is not guaranteed to write everything and in fact was encountered to not write more than
 * 0x7ffff000 (2'147'479'552) B. To avoid this, it has to be looped over.
 * @return 0 on success or errno of the failing write call.
 */
[[nodiscard]] inline int
writeAllToFd( const int         outputFileDescriptor,
              const void* const dataToWrite,
              const uint64_t    dataToWriteSize )
{
    for ( uint64_t nTotalWritten = 0; nTotalWritten < dataToWriteSize; ) {
        const auto* const currentBufferPosition = reinterpret_cast<const uint8_t*>( dataToWrite ) + nTotalWritten;

        const auto nBytesToWritePerCall =
            static_cast<unsigned int>(
                std::min( static_cast<uint64_t>( std::numeric_limits<unsigned int>::max() ),
                          dataToWriteSize - nTotalWritten ) );

        const auto nBytesWritten = ::write( outputFileDescriptor, currentBufferPosition, nBytesToWritePerCall );
        if ( nBytesWritten < 0 ) {
            if ( errno == EINTR ) {
                continue;
            }
            return errno;
        }
        if ( nBytesWritten == 0 ) {
            /* A block device that is full reports 0 B written instead of an error. */
            return ENOSPC;
        }
        nTotalWritten += static_cast<uint64_t>( nBytesWritten );
    }

    return 0;
}


/**
 * Flushes file contents to the storage device without necessarily flushing metadata like the modification time.
 */
inline void
syncFileData( const int fileDescriptor )
{
#if defined( __APPLE__ )
    const auto result = ::fsync( fileDescriptor );
#else
    const auto result = ::fdatasync( fileDescriptor );
#endif
    if ( result == -1 ) {
        std::stringstream message;
        message << "Failed to sync file data because of: " << strerror( errno ) << " (" << errno << ")";
        throw std::runtime_error( std::move( message ).str() );
    }
}


/**
 * Flushes file contents and all metadata, e.g., the file length, to the storage device.
 */
inline void
syncFile( const int fileDescriptor )
{
    if ( ::fsync( fileDescriptor ) == -1 ) {
        std::stringstream message;
        message << "Failed to sync file because of: " << strerror( errno ) << " (" << errno << ")";
        throw std::runtime_error( std::move( message ).str() );
    }
}
}  // namespace rapidflash
