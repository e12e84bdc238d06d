#pragma once

#include <cstddef>
#include <cstdio>
#include <memory>


namespace rapidflash
{
class FileWriter;

using UniqueFileWriter = std::unique_ptr<FileWriter>;


/**
 * Write-only counterpart to FileReader for flash destinations. Writes may be buffered in user space.
 * @ref flush hands the buffered data to the kernel, @ref syncData and @ref syncAll additionally wait
 * for the data to reach the storage device.
 */
class FileWriter
{
public:
    FileWriter() = default;

    virtual
    ~FileWriter() = default;

    /* Delete copy constructors and assignments to avoid slicing. */

    FileWriter( const FileWriter& ) = delete;

    FileWriter&
    operator=( const FileWriter& ) = delete;

    FileWriter( FileWriter&& ) = default;

    FileWriter&
    operator=( FileWriter&& ) = delete;

    virtual void
    close() = 0;

    [[nodiscard]] virtual bool
    closed() const = 0;

    virtual void
    write( const char* buffer,
           size_t      size ) = 0;

    /**
     * Moves the write cursor without writing anything. Skipped regions of freshly created regular files
     * read back as zeros. On block devices, they keep their previous contents.
     */
    virtual size_t
    seek( long long int offset,
          int           origin = SEEK_SET ) = 0;

    [[nodiscard]] virtual size_t
    tell() const = 0;

    virtual void
    flush() = 0;

    /** Flushes and then syncs the file data, but not necessarily metadata, to the storage device. */
    virtual void
    syncData() = 0;

    /** Flushes and then syncs the file data and all metadata to the storage device. */
    virtual void
    syncAll() = 0;
};
}  // namespace rapidflash
