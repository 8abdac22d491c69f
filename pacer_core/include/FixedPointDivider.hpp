#ifndef FIXED_POINT_DIVIDER_HPP
#define FIXED_POINT_DIVIDER_HPP

#include <cstdint>
#include <string>

/**
 * @brief Integer-only division with a fixed number of decimal places.
 *
 *  divide(10, 4) -> "2.50000"
 *  divide(1, 3)  -> "0.33333"   (truncated, never rounded)
 *
 *  Used wherever a duration has to be handed to another program as a decimal
 *  number of seconds (sox takes "1.80000", not 1800 ms), and to print the
 *  per-column delays.
 */
class FixedPointDivider {
public:
    static constexpr int DEFAULT_PLACES = 5;

    /**
     * @throws DivisionByZero if denominator is 0
     * @throws std::overflow_error if numerator * 10^places does not fit in 64 bits
     */
    static std::string divide(std::uint64_t numerator,
                              std::uint64_t denominator,
                              int places = DEFAULT_PLACES);

private:
    static std::uint64_t scaleFor(int places);
};

#endif  // FIXED_POINT_DIVIDER_HPP
