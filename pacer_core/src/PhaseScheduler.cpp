#include "PhaseScheduler.hpp"
#include "Errors.hpp"
#include "FixedPointDivider.hpp"

std::string PhaseDelay::seconds() const {
    return FixedPointDivider::divide(static_cast<std::uint64_t>(perColumn.count()), 1000000);
}

long long PhaseScheduler::maxColumnsFor(int durationSeconds) {
    if (durationSeconds <= 0) return 0;
    // one microsecond per column at the least
    return static_cast<long long>(durationSeconds) * 1000 * 1000;
}

PhaseDelay PhaseScheduler::perColumnDelay(int durationSeconds, int columns) {
    if (columns == 0) {
        throw DivisionByZero("per-column delay with zero columns");
    }
    if (durationSeconds <= 0) {
        throw ConfigurationError("phase duration must be a positive whole number of seconds, got "
                                 + std::to_string(durationSeconds));
    }
    if (columns < MIN_COLUMNS) {
        throw ConfigurationError("columns must be at least " + std::to_string(MIN_COLUMNS)
                                 + ", got " + std::to_string(columns));
    }
    if (columns > maxColumnsFor(durationSeconds)) {
        throw ConfigurationError(std::to_string(columns) + " columns leave less than 1 us per column in a "
                                 + std::to_string(durationSeconds) + " s phase");
    }

    // whole seconds -> ms -> us, all in integers
    const long long durationMs = static_cast<long long>(durationSeconds) * 1000;
    const long long perColumnUs = durationMs * 1000 / columns;

    PhaseDelay delay;
    delay.perColumn = std::chrono::microseconds(perColumnUs);
    return delay;
}
