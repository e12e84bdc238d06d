#pragma once

#include <algorithm>
#include <cstring>
#include <stdexcept>
#include <vector>

#include "FileReader.hpp"


namespace rapidflash
{
/**
 * Serves an in-memory image through the FileReader interface, e.g., to feed encoded test images into the
 * decoders without going through the file system. The buffer is not copied and must outlive the reader.
 */
class BufferViewFileReader :
    public FileReader
{
public:
    explicit
    BufferViewFileReader( const std::vector<char>& image ) :
        m_image( image )
    {}

    void
    close() override
    {
        m_closed = true;
    }

    [[nodiscard]] bool
    closed() const override
    {
        return m_closed;
    }

    [[nodiscard]] bool
    eof() const override
    {
        return m_position >= m_image.size();
    }

    [[nodiscard]] bool
    seekable() const override
    {
        return true;
    }

    [[nodiscard]] size_t
    read( char*  buffer,
          size_t nMaxBytesToRead ) override
    {
        throwIfClosed();
        const auto nBytesToCopy = std::min( m_image.size() - std::min( m_position, m_image.size() ),
                                            nMaxBytesToRead );
        if ( nBytesToCopy > 0 ) {
            std::memcpy( buffer, m_image.data() + m_position, nBytesToCopy );
            m_position += nBytesToCopy;
        }
        return nBytesToCopy;
    }

    /**
     * Offsets past the end are clamped to the image size like for the other readers.
     */
    size_t
    seek( long long int offset,
          int           origin = SEEK_SET ) override
    {
        throwIfClosed();
        m_position = effectiveOffset( offset, origin );
        return m_position;
    }

    [[nodiscard]] std::optional<size_t>
    size() const override
    {
        return m_image.size();
    }

    [[nodiscard]] size_t
    tell() const override
    {
        return m_position;
    }

private:
    void
    throwIfClosed() const
    {
        if ( m_closed ) {
            throw std::invalid_argument( "Cannot access a closed in-memory image!" );
        }
    }

private:
    const std::vector<char>& m_image;
    size_t m_position{ 0 };
    bool m_closed{ false };
};
}  // namespace rapidflash
