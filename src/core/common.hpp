#pragma once

#include <algorithm>
#include <array>
#include <cctype>
#include <chrono>
#include <cstdint>
#include <cstring>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <limits>
#include <ostream>
#include <sstream>
#include <string>
#include <string_view>
#include <thread>
#include <type_traits>
#include <utility>
#include <vector>

#include <unistd.h>


namespace rapidflash
{
template<typename U,
         std::enable_if_t<std::is_unsigned_v<U> >* = nullptr>
[[nodiscard]] constexpr U
saturatingAddition( const U a,
                    const U b )
{
    return a > std::numeric_limits<U>::max() - b ? std::numeric_limits<U>::max() : a + b;
}


template<typename U,
         std::enable_if_t<std::is_signed_v<U> >* = nullptr>
[[nodiscard]] constexpr U
saturatingAddition( const U a,
                    const U b )
{
    /* Underflow or overflow should only be possible when both values have the same sign! */
    if ( ( a > 0 ) && ( b > 0 ) ) {
        return a > std::numeric_limits<U>::max() - b ? std::numeric_limits<U>::max() : a + b;
    }

    if ( ( a < 0 ) && ( b < 0 ) ) {
        return a < std::numeric_limits<U>::lowest() - b ? std::numeric_limits<U>::lowest() : a + b;
    }

    return a + b;
}


template<typename S, typename T>
[[nodiscard]] constexpr bool
startsWith( const S& fullString,
            const T& prefix,
            bool     caseSensitive = true ) noexcept
{
    if ( fullString.size() < prefix.size() ) {
        return false;
    }

    if ( caseSensitive ) {
        return std::equal( prefix.begin(), prefix.end(), fullString.begin() );
    }

    return std::equal( prefix.begin(), prefix.end(), fullString.begin(),
                       [] ( auto a, auto b ) { return std::tolower( a ) == std::tolower( b ); } );
}


/**
 * Formats a byte count with the largest binary unit it reaches, e.g., "14.9 GiB", the way device sizes
 * are usually shown to a user who has to pick the correct one out of a list.
 */
[[nodiscard]] inline std::string
formatBytes( const uint64_t value )
{
    const std::array<std::pair<std::string_view, uint64_t>, 6U> UNITS{ {
        { "PiB", 1024ULL * 1024ULL * 1024ULL * 1024ULL * 1024ULL },
        { "TiB", 1024ULL * 1024ULL * 1024ULL * 1024ULL },
        { "GiB", 1024ULL * 1024ULL * 1024ULL },
        { "MiB", 1024ULL * 1024ULL },
        { "KiB", 1024ULL },
        { "B", 1ULL },
    } };

    for ( const auto& [unit, multiplier] : UNITS ) {
        if ( value >= multiplier ) {
            std::stringstream result;
            if ( multiplier == 1 ) {
                result << value << " " << unit;
            } else {
                result << std::fixed << std::setprecision( 1 )
                       << static_cast<double>( value ) / static_cast<double>( multiplier ) << " " << unit;
            }
            return std::move( result ).str();
        }
    }

    return "0 B";
}


[[nodiscard]] inline std::chrono::time_point<std::chrono::steady_clock>
now() noexcept
{
    return std::chrono::steady_clock::now();
}


/**
 * @return duration in seconds
 */
template<typename T>
[[nodiscard]] double
duration( const T& t0,
          const T& t1 = now() ) noexcept
{
    return std::chrono::duration<double>( t1 - t0 ).count();
}


[[nodiscard]] inline uint64_t
unixTimeInNanoseconds() noexcept
{
    const auto currentTime = std::chrono::system_clock::now().time_since_epoch();
    return static_cast<uint64_t>( std::chrono::duration_cast<std::chrono::nanoseconds>( currentTime ).count() );
}


/**
 * Use like this:
 * @verbatim
 * std::cerr << ( ThreadSafeOutput() << "Hello" << i << "there" ).str();
 * @endverbatim
 */
class ThreadSafeOutput
{
public:
    ThreadSafeOutput()
    {
        using namespace std::chrono;
        const auto time = system_clock::now();
        const auto timePoint = system_clock::to_time_t( time );
        const auto subseconds = duration_cast<milliseconds>( time.time_since_epoch() ).count() % 1000;
        m_out << "[" << std::put_time( std::localtime( &timePoint ), "%H:%M:%S" ) << "."
              << std::setw( 3 ) << std::setfill( '0' ) << subseconds << std::setfill( ' ' ) << "]"
              << "[0x" << std::hex << std::this_thread::get_id() << std::dec << "]";
    }

    template<typename T>
    ThreadSafeOutput&
    operator<<( const T& value )
    {
        m_out << " " << value;
        return *this;
    }

    operator std::string() const
    {
        return m_out.str() + "\n";
    }

    [[nodiscard]] std::string
    str() const
    {
        return m_out.str() + "\n";
    }

private:
    std::stringstream m_out;
};


inline std::ostream&
operator<<( std::ostream&           out,
            const ThreadSafeOutput& output )
{
    out << output.str();
    return out;
}


enum class Endian
{
    LITTLE,
    BIG,
    UNKNOWN,
};


constexpr Endian ENDIAN =
#if defined( __BYTE_ORDER__ ) && defined( __ORDER_LITTLE_ENDIAN__ ) && ( __BYTE_ORDER__ == __ORDER_LITTLE_ENDIAN__ )
    Endian::LITTLE
#elif defined( __BYTE_ORDER__ ) && defined( __ORDER_BIG_ENDIAN__ ) && ( __BYTE_ORDER__ == __ORDER_BIG_ENDIAN__ )
    Endian::BIG
#else
    Endian::UNKNOWN
#endif
;


/**
 * Loads a little-endian integer of type T from possibly unaligned memory. All on-disk structures read by
 * this project (gzip trailer, MBR, GPT) are little-endian regardless of the host.
 * Note that we cannot use reinterpret_cast from char* to uint64_t* because it would result in undefined behavior
 * because of strict-aliasing rules! @see https://en.cppreference.com/w/cpp/language/reinterpret_cast#Type_aliasing
 */
template<typename T>
[[nodiscard]] T
loadLittleEndian( const void* data )
{
    T result{ 0 };
    if constexpr ( ENDIAN == Endian::LITTLE ) {
        std::memcpy( &result, data, sizeof( result ) );
    } else {
        const auto* bytes = static_cast<const uint8_t*>( data );
        for ( size_t i = 0; i < sizeof( T ); ++i ) {
            result |= static_cast<T>( bytes[i] ) << ( i * 8U );
        }
    }
    return result;
}


[[nodiscard]] constexpr uint64_t
operator "" _Ki( unsigned long long int value ) noexcept
{
    return value * 1024ULL;
}


[[nodiscard]] constexpr uint64_t
operator "" _Mi( unsigned long long int value ) noexcept
{
    return value * 1024ULL * 1024ULL;
}


[[nodiscard]] constexpr uint64_t
operator "" _Gi( unsigned long long int value ) noexcept
{
    return value * 1024ULL * 1024ULL * 1024ULL;
}
}  // namespace rapidflash
