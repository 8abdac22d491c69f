#ifndef TONE_BANK_HPP
#define TONE_BANK_HPP

#include "AudioBackend.hpp"
#include "PhaseContext.hpp"

struct PacerConfig;
class CancellationToken;
class Logger;
class TransientAssetRegistry;

/**
 * @brief  The rising (inhale) and falling (exhale) tones, made once at startup.
 *
 *  Each tone is toneLatencyMs shorter than its phase so one player has
 *  finished before the next one is started. The same two files are played on
 *  every cycle and deleted by the registry at exit.
 */
class ToneBank {
public:
    ToneBank(const PacerConfig& config,
             AudioBackend& backend,
             TransientAssetRegistry& registry,
             Logger& logger,
             long pid);

    /**
     * @brief Synthesize both tones.
     *
     * @return false if the token was cancelled before both were ready; any
     *         file written after the registry was released is removed here.
     * @throws ExternalToolFailure if synthesis fails for another reason
     */
    bool prepare(const CancellationToken& token);

    bool isReady() const { return ready_; }

    // Only valid after prepare() returned true
    const ToneAsset& forPhase(BreathPhase phase) const;

    ToneRequest requestFor(BreathPhase phase) const;

private:
    bool synthesizeOne(BreathPhase phase, ToneAsset& out, const CancellationToken& token);

    const PacerConfig& config_;
    AudioBackend& backend_;
    TransientAssetRegistry& registry_;
    Logger& logger_;
    long pid_;

    ToneAsset rising_;
    ToneAsset falling_;
    bool ready_ = false;
};

#endif  // TONE_BANK_HPP
