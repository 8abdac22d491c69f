#ifndef PACER_CONFIG_HPP
#define PACER_CONFIG_HPP

#include <string>

/**
 * @brief  Everything the user can set, fixed for the life of the process.
 *
 *  Built once in main() from the command line, validated, then passed by
 *  const reference to every component. Defaults are the classic 2 s in,
 *  4 s out, 40 column bar with a 150-300 Hz sweep.
 */
struct PacerConfig {
    int inhaleSeconds = 2;          // whole seconds to breathe in
    int exhaleSeconds = 4;          // whole seconds to breathe out
    int columns       = 40;         // bar width, fill characters per phase

    bool enableTone   = true;
    int toneLatencyMs = 200;        // tones are this much shorter than their phase
    int toneHighHz    = 300;
    int toneLowHz     = 150;
    int toneFadeMs    = 100;        // fade-in at the start of each tone

    std::string tempDir      = "/tmp";
    std::string synthCommand = "sox";
    std::string playCommand  = "aplay";

    std::string logFile;            // empty -> stderr
    bool verbose = false;

    /**
     * @brief Check every bound. Throws ConfigurationError on the first bad value.
     *
     *  Tone settings are only checked when enableTone is set; in particular
     *  the latency must leave a tone of at least 1 ms in the shorter phase.
     */
    void validate() const;
};

/**
 * @brief Result of parsing argv.
 *
 *  helpRequested means usage was printed and the caller should exit 0.
 */
struct CommandLine {
    PacerConfig config;
    bool helpRequested = false;
};

/**
 * @brief getopt_long front end.
 *
 * @throws UsageError          unknown option or missing argument
 * @throws ConfigurationError  a number that is not a whole decimal integer
 *
 * Does not call validate(); main() does that so tests can parse bad values.
 */
CommandLine parseCommandLine(int argc, char* argv[]);

void printUsage(const char* program);

#endif  // PACER_CONFIG_HPP
