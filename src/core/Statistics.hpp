#pragma once

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <iomanip>
#include <limits>
#include <sstream>
#include <string>
#include <type_traits>


namespace quizpager
{
template<typename T>
struct Statistics
{
    constexpr
    Statistics() = default;

    template<typename Container,
             typename = std::enable_if_t<!std::is_same_v<std::decay_t<Container>, Statistics<T> >, void> >
    constexpr explicit
    Statistics( const Container& values ) noexcept
    {
        for ( const auto value : values ) {
            merge( static_cast<T>( value ) );
        }
    }

    [[nodiscard]] constexpr bool
    empty() const noexcept
    {
        return count == 0;
    }

    [[nodiscard]] constexpr double
    average() const noexcept
    {
        return count == 0 ? 0.0 : sum / static_cast<double>( count );
    }

    [[nodiscard]] constexpr double
    variance() const noexcept
    {
        if ( count < 2 ) {
            return 0.0;
        }

        /* Sample variance via Var(x) = <x^2> - <x>^2, rescaled by n / (n-1). */
        const auto n = static_cast<double>( count );
        return ( sum2 / n - average() * average() ) * n / ( n - 1 );
    }

    [[nodiscard]] double
    standardDeviation() const noexcept
    {
        return std::sqrt( std::max( 0.0, variance() ) );
    }

    constexpr void
    merge( const Statistics& other ) noexcept
    {
        if ( other.count == 0 ) {
            return;
        }

        min = std::min( min, other.min );
        max = std::max( max, other.max );
        sum += other.sum;
        sum2 += other.sum2;
        count += other.count;
    }

    constexpr void
    merge( T value ) noexcept
    {
        min = std::min( min, value );
        max = std::max( max, value );
        sum += static_cast<double>( value );
        sum2 += static_cast<double>( value ) * static_cast<double>( value );
        ++count;
    }

    /**
     * Formats as "min <= average +- deviation <= max" with the given unit scaling,
     * e.g., a @p scale of 1e3 to print seconds as milliseconds.
     */
    [[nodiscard]] std::string
    format( double scale = 1.0,
            int    precision = 3 ) const
    {
        if ( empty() ) {
            return "n/a";
        }

        std::stringstream result;
        result << std::fixed << std::setprecision( precision )
               << static_cast<double>( min ) * scale << " <= "
               << average() * scale << " +- " << standardDeviation() * scale << " <= "
               << static_cast<double>( max ) * scale;
        return result.str();
    }

public:
    T min{ std::numeric_limits<T>::max() };
    T max{ std::numeric_limits<T>::lowest() };

    double sum{ 0 };
    double sum2{ 0 };
    uint64_t count{ 0 };
};
}  // namespace quizpager
