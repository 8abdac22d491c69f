#include "ToneBank.hpp"
#include "CancellationToken.hpp"
#include "Errors.hpp"
#include "Logger.hpp"
#include "PacerConfig.hpp"
#include "TransientAssetRegistry.hpp"

ToneBank::ToneBank(const PacerConfig& config,
                   AudioBackend& backend,
                   TransientAssetRegistry& registry,
                   Logger& logger,
                   long pid)
    : config_(config), backend_(backend), registry_(registry), logger_(logger), pid_(pid) {}

ToneRequest ToneBank::requestFor(BreathPhase phase) const {
    const bool inhale = (phase == BreathPhase::Inhale);
    const int phaseSeconds = inhale ? config_.inhaleSeconds : config_.exhaleSeconds;

    ToneRequest request;
    request.path = TransientAssetRegistry::transientPath(config_.tempDir,
                                                         inhale ? "rising" : "falling", pid_);
    request.duration = std::chrono::seconds(phaseSeconds)
                       - std::chrono::milliseconds(config_.toneLatencyMs);
    // pitch goes up while breathing in, down while breathing out
    request.startHz = inhale ? config_.toneLowHz : config_.toneHighHz;
    request.endHz   = inhale ? config_.toneHighHz : config_.toneLowHz;
    request.fadeMs  = config_.toneFadeMs;
    return request;
}

bool ToneBank::synthesizeOne(BreathPhase phase, ToneAsset& out, const CancellationToken& token) {
    ToneRequest request = requestFor(phase);

    // register first: an interrupt during synthesis must still find the file
    if (!registry_.add(request.path)) return false;

    try {
        out = backend_.synthesize(request);
    } catch (const ExternalToolInterrupted& e) {
        // sox gets the terminal's SIGINT too and may be reaped before the
        // watcher has cancelled the token; that is a cancel, not a failure
        logger_.info("Tones", e.what());
        return false;
    } catch (const ExternalToolFailure&) {
        if (token.isCancelled()) return false;
        throw;
    }

    if (token.isCancelled() || registry_.isReleased()) {
        // written after cleanup already ran
        try {
            TransientAssetRegistry::removeIfExists(request.path);
        } catch (const CleanupFailure& e) {
            logger_.warning("Tones", e.what());
        }
        return false;
    }
    return true;
}

bool ToneBank::prepare(const CancellationToken& token) {
    ready_ = false;
    if (!synthesizeOne(BreathPhase::Inhale, rising_, token)) return false;
    if (!synthesizeOne(BreathPhase::Exhale, falling_, token)) return false;

    logger_.info("Tones", "rising " + rising_.path + " (" + rising_.durationSeconds + " s), falling "
                 + falling_.path + " (" + falling_.durationSeconds + " s)");
    ready_ = true;
    return true;
}

const ToneAsset& ToneBank::forPhase(BreathPhase phase) const {
    return phase == BreathPhase::Inhale ? rising_ : falling_;
}
