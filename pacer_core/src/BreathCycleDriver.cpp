#include "BreathCycleDriver.hpp"
#include "AudioBackend.hpp"
#include "BarGraphRenderer.hpp"
#include "CancellationToken.hpp"
#include "Logger.hpp"
#include "PacerConfig.hpp"
#include "ToneBank.hpp"

BreathCycleDriver::BreathCycleDriver(const PacerConfig& config,
                                     BarGraphRenderer& renderer,
                                     Logger& logger)
    : renderer_(renderer),
      logger_(logger),
      inhaleDelay_(PhaseScheduler::perColumnDelay(config.inhaleSeconds, renderer.getColumns())),
      exhaleDelay_(PhaseScheduler::perColumnDelay(config.exhaleSeconds, renderer.getColumns()))
{
    logger_.info("Cycle", "in " + std::to_string(config.inhaleSeconds) + " s ("
                 + inhaleDelay_.seconds() + " s/column), out "
                 + std::to_string(config.exhaleSeconds) + " s ("
                 + exhaleDelay_.seconds() + " s/column), "
                 + std::to_string(renderer.getColumns()) + " columns");
}

void BreathCycleDriver::attachTones(AudioBackend& backend, const ToneBank& tones) {
    audio_ = &backend;
    tones_ = &tones;
}

const PhaseDelay& BreathCycleDriver::delayFor(BreathPhase phase) const {
    return phase == BreathPhase::Inhale ? inhaleDelay_ : exhaleDelay_;
}

PhaseContext BreathCycleDriver::contextFor(BreathPhase phase) const {
    PhaseContext ctx;
    ctx.phase = phase;
    ctx.caption = captionFor(phase);
    ctx.delay = delayFor(phase);
    ctx.cycleIndex = completed_ / 2;
    return ctx;
}

bool BreathCycleDriver::runPhase(CancellationToken& token) {
    if (token.isCancelled()) return false;

    PhaseContext ctx = contextFor(phase_);

    if (audio_ && tones_ && tones_->isReady()) {
        // fire and forget; a missing player must not stop the bars
        if (!audio_->play(tones_->forPhase(phase_))) {
            logger_.debug("Cycle", "no tone for cycle " + std::to_string(ctx.cycleIndex));
        }
    }

    if (!renderer_.render(ctx, token)) {
        logger_.debug("Cycle", "cancelled during '" + ctx.caption + "' after "
                      + std::to_string(renderer_.getFilled()) + " columns");
        return false;
    }

    completed_++;
    phase_ = nextPhase(phase_);
    return true;
}

long BreathCycleDriver::run(CancellationToken& token) {
    while (runPhase(token)) {
    }
    logger_.info("Cycle", "stopped after " + std::to_string(completed_) + " phases");
    return completed_;
}
