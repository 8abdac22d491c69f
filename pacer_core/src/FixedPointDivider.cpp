#include "FixedPointDivider.hpp"
#include "Errors.hpp"
#include <limits>
#include <stdexcept>

std::uint64_t FixedPointDivider::scaleFor(int places) {
    if (places < 0 || places > 18) {
        throw std::invalid_argument("FixedPointDivider: places must be in [0, 18]");
    }
    std::uint64_t scale = 1;
    for (int i = 0; i < places; ++i) scale *= 10;
    return scale;
}

std::string FixedPointDivider::divide(std::uint64_t numerator,
                                      std::uint64_t denominator,
                                      int places) {
    if (denominator == 0) {
        throw DivisionByZero("cannot divide " + std::to_string(numerator) + " by zero");
    }

    const std::uint64_t scale = scaleFor(places);
    if (numerator > std::numeric_limits<std::uint64_t>::max() / scale) {
        throw std::overflow_error("FixedPointDivider: numerator too large");
    }

    // Keep everything in integers: scale up, divide, then split the scaled
    // quotient back into its whole and fractional parts.
    const std::uint64_t scaled = numerator * scale / denominator;
    const std::uint64_t whole = scaled / scale;
    const std::uint64_t fraction = scaled - whole * scale;

    std::string result = std::to_string(whole);
    if (places == 0) return result;

    std::string digits = std::to_string(fraction);
    // left-pad so 0.05 comes out as "05000", not "5000"
    digits.insert(0, static_cast<std::size_t>(places) - digits.size(), '0');
    return result + "." + digits;
}
