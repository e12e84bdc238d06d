#pragma once

#include <algorithm>
#include <cstdio>       // fread
#include <filesystem>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>

#include <sys/stat.h>

#include <core/common.hpp>
#include <core/FileUtils.hpp>  // unique_file_ptr, throwingOpen

#include "FileReader.hpp"


namespace rapidflash
{
/**
 * Reads an image from the file system. The image may also be a block device or a FIFO, e.g., /dev/stdin,
 * in which case it is not seekable and the size is not known beforehand.
 */
class StandardFileReader :
    public FileReader
{
public:
    explicit
    StandardFileReader( std::string filePath ) :
        m_file( throwingOpen( filePath, "rb" ) ),
        m_fileDescriptor( ::fileno( fp() ) ),
        m_filePath( std::move( filePath ) ),
        m_seekable( determineSeekable( m_fileDescriptor ) ),
        m_fileSizeBytes( m_seekable ? std::make_optional( fileSize( m_fileDescriptor ) ) : std::nullopt )
    {}

    explicit
    StandardFileReader( const std::filesystem::path& filePath ) :
        StandardFileReader( filePath.string() )
    {}

    /* Add this to avoid ambiguity for const char*, which would otherwise be the case with only
     * std::string and std::filesystem::path constructors. */
    explicit
    StandardFileReader( const char* filePath ) :
        StandardFileReader( std::string( filePath ) )
    {}

    ~StandardFileReader() override
    {
        StandardFileReader::close();
    }

    void
    close() override
    {
        m_file.reset();
    }

    [[nodiscard]] bool
    closed() const override
    {
        return !m_file;
    }

    [[nodiscard]] bool
    eof() const override
    {
        return m_fileSizeBytes ? m_currentPosition >= *m_fileSizeBytes : !m_lastReadSuccessful;
    }

    [[nodiscard]] bool
    seekable() const override
    {
        return m_seekable;
    }

    [[nodiscard]] const std::string&
    path() const noexcept
    {
        return m_filePath;
    }

    [[nodiscard]] size_t
    read( char*  buffer,
          size_t nMaxBytesToRead ) override
    {
        if ( !m_file ) {
            throw std::invalid_argument( "Cannot read from closed file!" );
        }

        if ( nMaxBytesToRead == 0 ) {
            return 0;
        }

        const auto nBytesRead = std::fread( buffer, /* element size */ 1, nMaxBytesToRead, m_file.get() );
        if ( ( nBytesRead < nMaxBytesToRead ) && ( std::ferror( m_file.get() ) != 0 ) ) {
            std::stringstream message;
            message << "[StandardFileReader] Failed to read from '" << m_filePath << "' at offset "
                    << m_currentPosition + nBytesRead << ": " << std::strerror( errno );
            throw std::runtime_error( std::move( message ).str() );
        }

        if ( nBytesRead == 0 ) {
            /* fread returning 0 might traditionally be a valid case if the file position was after the last byte.
             * EOF is only set after reading after the end not when the file position is at the end. */
            m_lastReadSuccessful = false;
            return 0;
        }

        m_currentPosition += nBytesRead;
        m_lastReadSuccessful = nBytesRead == nMaxBytesToRead;

        return nBytesRead;
    }

    size_t
    seek( long long int offset,
          int           origin = SEEK_SET ) override
    {
        if ( !m_file || !m_seekable ) {
            throw std::invalid_argument( "Invalid or file can't be seeked!" );
        }

        fileSeek( m_file.get(), offset, origin );
        m_currentPosition = filePosition( m_file.get() );
        m_lastReadSuccessful = true;

        return m_currentPosition;
    }

    [[nodiscard]] std::optional<size_t>
    size() const override
    {
        return m_fileSizeBytes;
    }

    [[nodiscard]] size_t
    tell() const override
    {
        return m_currentPosition;
    }

private:
    [[nodiscard]] static bool
    determineSeekable( int fileNumber )
    {
        struct stat fileStats{};
        fstat( fileNumber, &fileStats );
        return !S_ISFIFO( fileStats.st_mode ) && !S_ISCHR( fileStats.st_mode ) && !S_ISSOCK( fileStats.st_mode );
    }

    [[nodiscard]] FILE*
    fp() const
    {
        if ( m_file ) {
            return m_file.get();
        }
        throw std::invalid_argument( "Operation not allowed on an invalid file!" );
    }

protected:
    unique_file_ptr m_file;
    const int m_fileDescriptor;
    const std::string m_filePath;

    const bool m_seekable;
    const std::optional<size_t> m_fileSizeBytes;

    size_t m_currentPosition{ 0 };
    bool m_lastReadSuccessful{ true };
};
}  // namespace rapidflash
