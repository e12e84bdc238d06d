#pragma once

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <filesystem>
#include <iostream>
#include <limits>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <sys/types.h>
#include <unistd.h>

#include <core/common.hpp>
#include <core/FileUtils.hpp>

#include "FileWriter.hpp"


namespace rapidflash
{
/**
 * Writes to a block device or a regular file using POSIX calls and a user-space buffer, which is flushed
 * when full, before each seek, and on @ref flush.
 *
 * Regular files are truncated on opening, so that regions skipped with @ref seek read back as zeros.
 * If the image ends with skipped zeros, the file would end up too short. Therefore, @ref flush extends
 * a regular file to the logical write position with ftruncate.
 */
class StandardFileWriter :
    public FileWriter
{
public:
    static constexpr size_t DEFAULT_BUFFER_SIZE = 8_Mi;

public:
    explicit
    StandardFileWriter( std::string filePath,
                        size_t      bufferSize = DEFAULT_BUFFER_SIZE ) :
        m_fileDescriptor( throwingOpenForWriting( filePath ) ),
        m_filePath( std::move( filePath ) ),
        m_isRegularFile( isRegularFile( *m_fileDescriptor ) ),
        m_bufferCapacity( std::max<size_t>( bufferSize, 1 ) )
    {
        m_buffer.reserve( m_bufferCapacity );
    }

    explicit
    StandardFileWriter( const std::filesystem::path& filePath,
                        size_t                       bufferSize = DEFAULT_BUFFER_SIZE ) :
        StandardFileWriter( filePath.string(), bufferSize )
    {}

    explicit
    StandardFileWriter( const char* filePath,
                        size_t      bufferSize = DEFAULT_BUFFER_SIZE ) :
        StandardFileWriter( std::string( filePath ), bufferSize )
    {}

    ~StandardFileWriter() override
    {
        /* Errors can't be reported from the destructor. Call close explicitly to get them. */
        if ( !closed() ) {
            try {
                flush();
            } catch ( const std::exception& exception ) {
                std::cerr << "[Error] Failed to flush '" << m_filePath << "' on destruction: "
                          << exception.what() << "\n";
            }
            m_fileDescriptor.close();
        }
    }

    void
    close() override
    {
        if ( !closed() ) {
            flush();
            m_fileDescriptor.close();
        }
    }

    [[nodiscard]] bool
    closed() const override
    {
        return !m_fileDescriptor.valid();
    }

    [[nodiscard]] const std::string&
    path() const noexcept
    {
        return m_filePath;
    }

    void
    write( const char* buffer,
           size_t      size ) override
    {
        checkOpen();

        /* Large writes bypass the buffer to avoid a superfluous copy. */
        if ( m_buffer.empty() && ( size >= m_bufferCapacity ) ) {
            writeToFile( buffer, size );
            return;
        }

        while ( size > 0 ) {
            const auto nBytesToCopy = std::min( size, m_bufferCapacity - m_buffer.size() );
            m_buffer.insert( m_buffer.end(), buffer, buffer + nBytesToCopy );
            buffer += nBytesToCopy;
            size -= nBytesToCopy;

            if ( m_buffer.size() >= m_bufferCapacity ) {
                flushBuffer();
            }
        }
    }

    size_t
    seek( long long int offset,
          int           origin = SEEK_SET ) override
    {
        checkOpen();
        flushBuffer();

        const auto newPosition = ::lseek( *m_fileDescriptor, static_cast<off_t>( offset ), origin );
        if ( newPosition == static_cast<off_t>( -1 ) ) {
            std::stringstream message;
            message << "[StandardFileWriter] Failed to seek '" << m_filePath << "' to " << offset << " from "
                    << originToString( origin ) << ": " << std::strerror( errno );
            throw std::runtime_error( std::move( message ).str() );
        }
        m_position = static_cast<size_t>( newPosition );

        return m_position;
    }

    [[nodiscard]] size_t
    tell() const override
    {
        return m_position + m_buffer.size();
    }

    void
    flush() override
    {
        checkOpen();
        flushBuffer();

        if ( m_isRegularFile && ( m_position > fileSize( *m_fileDescriptor ) ) ) {
            if ( ::ftruncate( *m_fileDescriptor, static_cast<off_t>( m_position ) ) == -1 ) {
                std::stringstream message;
                message << "[StandardFileWriter] Failed to extend '" << m_filePath << "' to " << m_position
                        << " B: " << std::strerror( errno );
                throw std::runtime_error( std::move( message ).str() );
            }
        }
    }

    void
    syncData() override
    {
        flush();
        syncFileData( *m_fileDescriptor );
    }

    void
    syncAll() override
    {
        flush();
        syncFile( *m_fileDescriptor );
    }

private:
    void
    checkOpen() const
    {
        if ( closed() ) {
            throw std::invalid_argument( "Cannot write to closed file '" + m_filePath + "'!" );
        }
    }

    void
    flushBuffer()
    {
        if ( m_buffer.empty() ) {
            return;
        }
        writeToFile( m_buffer.data(), m_buffer.size() );
        m_buffer.clear();
    }

    void
    writeToFile( const char* buffer,
                 size_t      size )
    {
        const auto errorCode = writeAllToFd( *m_fileDescriptor, buffer, size );
        if ( errorCode != 0 ) {
            std::stringstream message;
            message << "[StandardFileWriter] Failed to write " << formatBytes( size ) << " to '" << m_filePath
                    << "' at offset " << m_position << ": " << std::strerror( errorCode );
            throw std::runtime_error( std::move( message ).str() );
        }
        m_position += size;
    }

private:
    unique_file_descriptor m_fileDescriptor;
    const std::string m_filePath;
    const bool m_isRegularFile;

    const size_t m_bufferCapacity;
    std::vector<char> m_buffer;

    /** Position of the kernel file cursor, i.e., excluding the buffered data. */
    size_t m_position{ 0 };
};
}  // namespace rapidflash
