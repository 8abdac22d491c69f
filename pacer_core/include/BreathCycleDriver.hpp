#ifndef BREATH_CYCLE_DRIVER_HPP
#define BREATH_CYCLE_DRIVER_HPP

#include "PhaseContext.hpp"
#include "PhaseScheduler.hpp"

struct PacerConfig;
class AudioBackend;
class BarGraphRenderer;
class CancellationToken;
class Logger;
class ToneBank;

/**
 * @brief  The IN / OUT state machine.
 *
 *  Starts in Inhale and flips to the other phase every time a bar finishes.
 *  There is no end state: run() only returns once the token is cancelled.
 *  Both per-column delays are worked out in the constructor, so a bad
 *  configuration fails before anything is drawn.
 *
 *  When tones are attached, the phase's tone is started right before its bar.
 *  The player runs detached and is never waited for; if it can't be started
 *  the bar is drawn anyway.
 */
class BreathCycleDriver {
public:
    /**
     * @throws ConfigurationError / DivisionByZero from PhaseScheduler
     */
    BreathCycleDriver(const PacerConfig& config, BarGraphRenderer& renderer, Logger& logger);

    // Optional; both must outlive the driver. tones must be prepared.
    void attachTones(AudioBackend& backend, const ToneBank& tones);

    /**
     * @brief Alternate phases until the token is cancelled.
     * @return number of bars drawn to completion
     */
    long run(CancellationToken& token);

    /**
     * @brief Draw the bar for the current phase and advance to the next one.
     * @return false if cancelled during the bar (the phase does not advance)
     */
    bool runPhase(CancellationToken& token);

    BreathPhase currentPhase() const { return phase_; }
    const PhaseDelay& delayFor(BreathPhase phase) const;
    long getCompletedPhases() const { return completed_; }

private:
    PhaseContext contextFor(BreathPhase phase) const;

    BarGraphRenderer& renderer_;
    Logger& logger_;
    AudioBackend* audio_ = nullptr;
    const ToneBank* tones_ = nullptr;

    PhaseDelay inhaleDelay_;
    PhaseDelay exhaleDelay_;

    BreathPhase phase_ = BreathPhase::Inhale;
    long completed_ = 0;
};

#endif  // BREATH_CYCLE_DRIVER_HPP
