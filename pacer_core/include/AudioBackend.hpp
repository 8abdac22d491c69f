#ifndef AUDIO_BACKEND_HPP
#define AUDIO_BACKEND_HPP

#include <chrono>
#include <string>
#include <vector>

class Logger;

// What to synthesize: a linear sweep from startHz to endHz with a fade-in
struct ToneRequest {
    std::string path;                       // where the file goes (already registered)
    std::chrono::milliseconds duration{0};
    int startHz = 0;
    int endHz = 0;
    int fadeMs = 0;
};

// A playable file produced by synthesize()
struct ToneAsset {
    std::string path;
    std::string durationSeconds;            // as passed to the synthesizer, e.g. "1.80000"
};

/**
 * @brief  Capability interface between the breath cycle and whatever makes noise.
 *
 *  The driver only ever calls play(); synthesize() runs twice at startup.
 *  Tests substitute a recording stub so no audio hardware is needed.
 */
class AudioBackend {
public:
    virtual ~AudioBackend() = default;

    // Throws ExternalToolFailure if the asset could not be produced
    virtual ToneAsset synthesize(const ToneRequest& request) = 0;

    // Fire and forget. Returns false if playback could not even be started;
    // never throws, never blocks for the length of the tone.
    virtual bool play(const ToneAsset& asset) = 0;
};

/**
 * @brief  sox for synthesis, aplay for playback, both as child processes.
 *
 *  sox -n <path> synth <seconds> sine <f0>:<f1> fade <fade> 0
 *  aplay <path>
 */
class ExternalAudioBackend : public AudioBackend {
public:
    ExternalAudioBackend(const std::string& synthCommand,
                         const std::string& playCommand,
                         Logger& logger);

    ToneAsset synthesize(const ToneRequest& request) override;
    bool play(const ToneAsset& asset) override;

    std::vector<std::string> synthArguments(const ToneRequest& request) const;
    std::vector<std::string> playArguments(const ToneAsset& asset) const;

private:
    std::string synthCommand_;
    std::string playCommand_;
    Logger& logger_;
};

#endif  // AUDIO_BACKEND_HPP
