#include "AudioBackend.hpp"
#include "Errors.hpp"
#include "FixedPointDivider.hpp"
#include "Logger.hpp"
#include "Process.hpp"
#include <csignal>
#include <cstring>
#include <filesystem>
#include <system_error>

ExternalAudioBackend::ExternalAudioBackend(const std::string& synthCommand,
                                           const std::string& playCommand,
                                           Logger& logger)
    : synthCommand_(synthCommand), playCommand_(playCommand), logger_(logger) {}

std::vector<std::string> ExternalAudioBackend::synthArguments(const ToneRequest& request) const {
    // sox wants decimal seconds on the command line
    const std::string seconds = FixedPointDivider::divide(
        static_cast<std::uint64_t>(request.duration.count()), 1000);
    const std::string fade = FixedPointDivider::divide(
        static_cast<std::uint64_t>(request.fadeMs), 1000);

    return {
        synthCommand_, "-n", request.path,
        "synth", seconds,
        "sine", std::to_string(request.startHz) + ":" + std::to_string(request.endHz),
        "fade", fade, "0"
    };
}

std::vector<std::string> ExternalAudioBackend::playArguments(const ToneAsset& asset) const {
    return { playCommand_, asset.path };
}

ToneAsset ExternalAudioBackend::synthesize(const ToneRequest& request) {
    if (request.duration.count() <= 0) {
        throw ExternalToolFailure("tone for " + request.path + " would be empty");
    }

    std::vector<std::string> args = synthArguments(request);
    logger_.info("Audio", "synthesizing " + request.path + ": " + args[4] + " s, "
                 + args[6] + " Hz");

    ExitStatus status = Process::runAndWait(args);
    if (!status.started) {
        throw ExternalToolFailure("could not run '" + synthCommand_ + "'; is it installed?");
    }
    if (status.termSignal != 0) {
        const std::string what = "'" + synthCommand_ + "' was killed by signal "
                                 + std::to_string(status.termSignal) + " ("
                                 + strsignal(status.termSignal) + ") while writing "
                                 + request.path;
        if (status.termSignal == SIGINT || status.termSignal == SIGTERM) {
            throw ExternalToolInterrupted(what);
        }
        throw ExternalToolFailure(what);
    }
    if (status.exitCode != 0) {
        throw ExternalToolFailure("'" + synthCommand_ + "' exited with status "
                                  + std::to_string(status.exitCode) + " while writing " + request.path);
    }

    std::error_code ec;
    if (!std::filesystem::exists(request.path, ec)) {
        throw ExternalToolFailure("'" + synthCommand_ + "' did not produce " + request.path);
    }

    ToneAsset asset;
    asset.path = request.path;
    asset.durationSeconds = args[4];
    return asset;
}

bool ExternalAudioBackend::play(const ToneAsset& asset) {
    if (!Process::spawnDetached(playArguments(asset))) {
        logger_.warning("Audio", "could not start '" + playCommand_ + "' for " + asset.path);
        return false;
    }
    return true;
}
