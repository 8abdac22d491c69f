#ifndef PROCESS_HPP
#define PROCESS_HPP

#include <string>
#include <vector>

/**
 * @brief  How a child run by Process::runAndWait ended.
 */
struct ExitStatus {
    bool started = false;   // false: not on PATH, fork failed or exec failed
    int exitCode = 0;       // valid when started and termSignal == 0
    int termSignal = 0;     // non-zero if the child was killed by a signal

    bool succeeded() const { return started && termSignal == 0 && exitCode == 0; }
};

/**
 * @brief  Thin fork/exec wrappers for the external audio tools.
 *
 *  argv[0] is looked up on PATH in the parent, before forking; the child only
 *  calls execv. The child's stdin, stdout and stderr are all pointed at
 *  /dev/null so sox and aplay chatter never reaches the terminal.
 */
class Process {
public:
    /**
     * @brief Run a program to completion.
     */
    static ExitStatus runAndWait(const std::vector<std::string>& argv);

    /**
     * @brief Start a program and forget about it.
     *
     *  Double fork: the intermediate child exits immediately and is reaped
     *  here, so the player is adopted by init and never becomes a zombie of
     *  ours. Only reports whether the program was found and the fork worked,
     *  not whether exec did.
     */
    static bool spawnDetached(const std::vector<std::string>& argv);

    /**
     * @brief Full path of an executable.
     *
     *  Names containing a '/' are returned as they are; anything else is
     *  searched for on PATH (or /usr/bin:/bin if PATH is unset).
     * @return empty if nothing executable was found
     */
    static std::string resolveExecutable(const std::string& name);

private:
    static std::vector<char*> toArgv(const std::vector<std::string>& argv);
    [[noreturn]] static void execQuiet(const char* path, char* const* args);
};

#endif  // PROCESS_HPP
