#pragma once

#include <algorithm>
#include <chrono>
#include <cstdint>
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


namespace quizpager
{
template<typename I1,
         typename I2,
         typename Enable = typename std::enable_if_t<std::is_integral_v<I1> && std::is_integral_v<I2>> >
[[nodiscard]] constexpr I1
ceilDiv( I1 dividend,
         I2 divisor ) noexcept
{
    return ( dividend + divisor - 1 ) / divisor;
}


/**
 * Subtraction clamped at zero for unsigned types, e.g., for computing the lower end of a window
 * around a chunk index without wrapping around.
 */
template<typename U,
         std::enable_if_t<std::is_unsigned_v<U> >* = nullptr>
[[nodiscard]] constexpr U
saturatingSubtraction( const U a,
                       const U b ) noexcept
{
    return a > b ? a - b : U( 0 );
}


template<typename U,
         std::enable_if_t<std::is_unsigned_v<U> >* = nullptr>
[[nodiscard]] constexpr U
saturatingAddition( const U a,
                    const U b ) noexcept
{
    return a > std::numeric_limits<U>::max() - b ? std::numeric_limits<U>::max() : a + b;
}


template<typename S, typename T>
std::ostream&
operator<<( std::ostream&   out,
            std::pair<S, T> pair )
{
    out << "(" << pair.first << "," << pair.second << ")";
    return out;
}


template<typename T>
std::ostream&
operator<<( std::ostream&         out,
            const std::vector<T>& vector )
{
    if ( vector.empty() ) {
        out << "{}";
        return out;
    }

    out << "{ ";
    for ( auto value = vector.begin(); value != vector.end(); ++value ) {
        if ( value != vector.begin() ) {
            out << ", ";
        }
        out << *value;
    }
    out << " }";

    return out;
}


template<typename S, typename T>
[[nodiscard]] constexpr bool
startsWith( const S& fullString,
            const T& prefix ) noexcept
{
    if ( fullString.size() < prefix.size() ) {
        return false;
    }
    return std::equal( prefix.begin(), prefix.end(), fullString.begin() );
}


template<typename S, typename T>
[[nodiscard]] constexpr bool
endsWith( const S& fullString,
          const T& suffix ) noexcept
{
    if ( fullString.size() < suffix.size() ) {
        return false;
    }
    return std::equal( suffix.rbegin(), suffix.rend(), fullString.rbegin() );
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
 * @return The current local date formatted as YYYY-MM-DD.
 */
[[nodiscard]] inline std::string
currentDate()
{
    const auto timePoint = std::chrono::system_clock::to_time_t( std::chrono::system_clock::now() );
    std::tm localTime{};
    localtime_r( &timePoint, &localTime );
    std::stringstream result;
    result << std::put_time( &localTime, "%Y-%m-%d" );
    return result.str();
}


[[nodiscard]] inline unsigned int
availableCores()
{
    return std::max( 1U, std::thread::hardware_concurrency() );
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
        std::tm localTime{};
        localtime_r( &timePoint, &localTime );
        m_out << "[" << std::put_time( &localTime, "%H:%M:%S" ) << "."
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
}  // namespace quizpager
