#include "PacerConfig.hpp"
#include "Errors.hpp"
#include "PhaseScheduler.hpp"
#include <getopt.h>
#include <algorithm>
#include <cerrno>
#include <climits>
#include <cstdio>
#include <cstdlib>
#include <string>

namespace {

// long-only options
enum LongOption {
    OPT_FADE = 1000,
    OPT_TEMP_DIR,
    OPT_SYNTH,
    OPT_PLAYER,
    OPT_LOG_FILE
};

int parseWholeNumber(const char* text, const char* option) {
    char* end = nullptr;
    errno = 0;
    long value = std::strtol(text, &end, 10);
    if (end == text || *end != '\0' || errno == ERANGE || value < INT_MIN || value > INT_MAX) {
        throw ConfigurationError(std::string("--") + option + " must be a whole number, got '"
                                 + text + "'");
    }
    return static_cast<int>(value);
}

void requirePositive(int value, const char* name) {
    if (value <= 0) {
        throw ConfigurationError(std::string(name) + " must be greater than zero, got "
                                 + std::to_string(value));
    }
}

}  // namespace

void PacerConfig::validate() const {
    requirePositive(inhaleSeconds, "inhale time");
    requirePositive(exhaleSeconds, "exhale time");

    if (columns < PhaseScheduler::MIN_COLUMNS) {
        throw ConfigurationError("columns must be at least "
                                 + std::to_string(PhaseScheduler::MIN_COLUMNS) + ", got "
                                 + std::to_string(columns));
    }
    const int shortestSeconds = std::min(inhaleSeconds, exhaleSeconds);
    if (columns > PhaseScheduler::maxColumnsFor(shortestSeconds)) {
        throw ConfigurationError(std::to_string(columns) + " columns leave less than 1 us per column in a "
                                 + std::to_string(shortestSeconds) + " s phase");
    }

    if (!enableTone) return;

    requirePositive(toneHighHz, "tone high frequency");
    requirePositive(toneLowHz, "tone low frequency");
    if (toneLatencyMs < 0) {
        throw ConfigurationError("tone latency cannot be negative");
    }
    if (toneFadeMs < 0) {
        throw ConfigurationError("tone fade cannot be negative");
    }

    const long long shortestMs = static_cast<long long>(shortestSeconds) * 1000;
    if (toneLatencyMs >= shortestMs) {
        throw ConfigurationError("tone latency of " + std::to_string(toneLatencyMs)
                                 + " ms leaves no tone in a " + std::to_string(shortestMs)
                                 + " ms phase");
    }
    if (tempDir.empty() || synthCommand.empty() || playCommand.empty()) {
        throw ConfigurationError("temp dir, synth and player commands cannot be empty");
    }
}

void printUsage(const char* program) {
    std::printf(
        "Usage: %s [options]\n"
        "Paced breathing: follow the bar, in while it fills on IN, out on OUT.\n"
        "Runs until interrupted with Ctrl+C.\n"
        "\n"
        "  -i, --inhale SECONDS   whole seconds to breathe in (default 2)\n"
        "  -e, --exhale SECONDS   whole seconds to breathe out (default 4)\n"
        "  -c, --columns N        bar width in columns, at least %d (default 40)\n"
        "  -q, --no-tone          no rising/falling tones\n"
        "  -l, --latency MS       tones are this much shorter than the phase (default 200)\n"
        "  -H, --tone-high HZ     upper sweep frequency (default 300)\n"
        "  -L, --tone-low HZ      lower sweep frequency (default 150)\n"
        "      --fade MS          tone fade-in (default 100)\n"
        "      --temp-dir DIR     where tone files are written (default /tmp)\n"
        "      --synth CMD        tone synthesizer (default sox)\n"
        "      --player CMD       audio player (default aplay)\n"
        "      --log-file PATH    diagnostics to PATH instead of stderr\n"
        "  -v, --verbose          log informational messages\n"
        "  -h, --help             show this help\n",
        program, PhaseScheduler::MIN_COLUMNS);
}

CommandLine parseCommandLine(int argc, char* argv[]) {
    static struct option long_options[] = {
        {"inhale",    required_argument, 0, 'i'},
        {"exhale",    required_argument, 0, 'e'},
        {"columns",   required_argument, 0, 'c'},
        {"no-tone",   no_argument,       0, 'q'},
        {"latency",   required_argument, 0, 'l'},
        {"tone-high", required_argument, 0, 'H'},
        {"tone-low",  required_argument, 0, 'L'},
        {"fade",      required_argument, 0, OPT_FADE},
        {"temp-dir",  required_argument, 0, OPT_TEMP_DIR},
        {"synth",     required_argument, 0, OPT_SYNTH},
        {"player",    required_argument, 0, OPT_PLAYER},
        {"log-file",  required_argument, 0, OPT_LOG_FILE},
        {"verbose",   no_argument,       0, 'v'},
        {"help",      no_argument,       0, 'h'},
        {0, 0, 0, 0}
    };

    CommandLine result;
    PacerConfig& config = result.config;

    // 0 forces getopt to reinitialise, so this can be called more than once
    optind = 0;
    opterr = 0;

    int opt;
    int option_index = 0;
    while ((opt = getopt_long(argc, argv, ":i:e:c:ql:H:L:vh", long_options, &option_index)) != -1) {
        switch (opt) {
            case 'i': config.inhaleSeconds = parseWholeNumber(optarg, "inhale"); break;
            case 'e': config.exhaleSeconds = parseWholeNumber(optarg, "exhale"); break;
            case 'c': config.columns = parseWholeNumber(optarg, "columns"); break;
            case 'q': config.enableTone = false; break;
            case 'l': config.toneLatencyMs = parseWholeNumber(optarg, "latency"); break;
            case 'H': config.toneHighHz = parseWholeNumber(optarg, "tone-high"); break;
            case 'L': config.toneLowHz = parseWholeNumber(optarg, "tone-low"); break;
            case OPT_FADE: config.toneFadeMs = parseWholeNumber(optarg, "fade"); break;
            case OPT_TEMP_DIR: config.tempDir = optarg; break;
            case OPT_SYNTH: config.synthCommand = optarg; break;
            case OPT_PLAYER: config.playCommand = optarg; break;
            case OPT_LOG_FILE: config.logFile = optarg; break;
            case 'v': config.verbose = true; break;
            case 'h':
                printUsage(argv[0]);
                result.helpRequested = true;
                return result;
            case ':':
                throw UsageError(std::string("option '") + argv[optind - 1] + "' needs an argument");
            default:
                throw UsageError(std::string("unknown option '") + argv[optind - 1] + "'");
        }
    }

    if (optind < argc) {
        throw UsageError(std::string("unexpected argument '") + argv[optind] + "'");
    }
    return result;
}
