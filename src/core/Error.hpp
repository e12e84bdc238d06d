#pragma once

#include <ostream>
#include <stdexcept>
#include <string>
#include <utility>


namespace rapidflash
{
enum class [[nodiscard]] Error
{
    NONE             = 0x00,
    /* The invocation itself was malformed, e.g., no destination was given. Nothing has been opened yet. */
    INVALID_ARGUMENT = 0x10,
    /* Open, read, write, flush, or sync failed on the source or any destination. Truncated or malformed
     * compressed data is reported as this, too, because it shows up as a failed read of the decoded stream. */
    IO_FAILURE       = 0x20,
};


[[nodiscard]] inline std::string
toString( Error error )
{
    switch ( error )
    {
    case Error::NONE:
        return "No error.";
    case Error::INVALID_ARGUMENT:
        return "Invalid argument";
    case Error::IO_FAILURE:
        return "I/O failure";
    }
    return "Unknown error code!";
}


inline std::ostream&
operator<<( std::ostream&     out,
            rapidflash::Error error )
{
    out << toString( error );
    return out;
}


/**
 * The single error type that reaches the caller of a flash operation. It only tells whether the invocation
 * was invalid or whether some I/O failed. Which destination failed and at which offset is not tracked and can
 * at most be found in the human-readable message.
 */
class FlashError :
    public std::runtime_error
{
public:
    FlashError( Error              code,
                const std::string& message ) :
        std::runtime_error( toString( code ) + ": " + message ),
        m_code( code )
    {}

    [[nodiscard]] Error
    code() const noexcept
    {
        return m_code;
    }

private:
    const Error m_code;
};
}  // namespace rapidflash
