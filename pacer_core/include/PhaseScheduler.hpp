#ifndef PHASE_SCHEDULER_HPP
#define PHASE_SCHEDULER_HPP

#include <chrono>
#include <string>

/**
 * @brief  Pause between two fill characters of the bar graph.
 *
 *  Derived once per phase at startup and never changed afterwards.
 *  Resolution is one microsecond, which is finer than the 5 decimal places
 *  (10 us) the delay is printed with.
 */
struct PhaseDelay {
    std::chrono::microseconds perColumn{0};

    // perColumn in seconds, e.g. "0.05000"
    std::string seconds() const;

    // what the whole bar should take: perColumn * columns
    std::chrono::microseconds total(int columns) const { return perColumn * columns; }
};

/**
 * @brief  Spreads a whole-second phase evenly over the columns of the bar.
 *
 *  The per-column delay is (duration_seconds * 1000) / columns milliseconds,
 *  truncated to the microsecond. The truncation error is never corrected
 *  afterwards, so a phase may end up to `columns` microseconds short.
 */
class PhaseScheduler {
public:
    static constexpr int MIN_COLUMNS = 2;

    /**
     * @brief Most columns a phase of durationSeconds can be spread over
     *        without the per-column delay truncating to zero.
     */
    static long long maxColumnsFor(int durationSeconds);

    /**
     * @throws DivisionByZero     if columns == 0
     * @throws ConfigurationError if durationSeconds <= 0, columns < MIN_COLUMNS,
     *                            or columns > maxColumnsFor(durationSeconds)
     */
    static PhaseDelay perColumnDelay(int durationSeconds, int columns);
};

#endif  // PHASE_SCHEDULER_HPP
