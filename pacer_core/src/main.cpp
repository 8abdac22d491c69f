/** Build:
 *    cmake -S . -B build && cmake --build build
 *
 *  Run:
 *    ./build/breathpacer                 (2 s in, 4 s out, 40 columns, tones via sox/aplay)
 *    ./build/breathpacer -i 4 -e 6 -q    (no tones)
 *
 *  Stop with Ctrl+C; the generated tone files in /tmp are removed on the way out.
 */

#include "AudioBackend.hpp"
#include "BarGraphRenderer.hpp"
#include "BreathCycleDriver.hpp"
#include "CancellationToken.hpp"
#include "Errors.hpp"
#include "InterruptHandler.hpp"
#include "Logger.hpp"
#include "PacerConfig.hpp"
#include "ToneBank.hpp"
#include "TransientAssetRegistry.hpp"

#include <iostream>
#include <unistd.h>   // getpid()

int main(int argc, char* argv[]) {
    CommandLine cmd;
    try {
        cmd = parseCommandLine(argc, argv);
    } catch (const UsageError& e) {
        std::cerr << "Error: " << e.what() << "\n"
                  << "Try '" << argv[0] << " --help'.\n";
        return 2;
    } catch (const ConfigurationError& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
    if (cmd.helpRequested) return 0;

    const PacerConfig& config = cmd.config;

    try {
        config.validate();

        Logger logger(config.logFile, config.verbose ? LogLevel::Debug : LogLevel::Warning);

        /**     STARTUP ORDER:
         * registry + interrupt watcher first, so a Ctrl+C during tone synthesis
         *   still cleans up
         * driver next: it computes both per-column delays and throws on bad input
         *   before any file is written
         * tones last, only when enabled; a synthesis failure is fatal
         */
        CancellationToken token;
        TransientAssetRegistry registry(logger);
        InterruptHandler interrupts(token, registry, logger);
        interrupts.install();

        BarGraphRenderer renderer(std::cout, config.columns);
        BreathCycleDriver driver(config, renderer, logger);

        ExternalAudioBackend audio(config.synthCommand, config.playCommand, logger);
        ToneBank tones(config, audio, registry, logger, static_cast<long>(getpid()));

        if (config.enableTone) {
            if (!tones.prepare(token)) {
                return 0;   // interrupted while the tones were being made
            }
            driver.attachTones(audio, tones);
        }

        driver.run(token);

        // Normally already done by the interrupt; a no-op then
        registry.releaseAll();
    } catch (const PacerError& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: unexpected failure: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
