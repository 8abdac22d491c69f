#include "Process.hpp"
#include <cerrno>
#include <csignal>
#include <cstdlib>
#include <fcntl.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace {

// exit status used by a child whose exec failed, same as the shell's
constexpr int EXEC_FAILED = 127;

constexpr const char* DEFAULT_PATH = "/usr/bin:/bin";

ExitStatus waitForChild(pid_t pid) {
    ExitStatus result;
    int status = 0;
    while (waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) return result;
    }
    result.started = true;
    if (WIFSIGNALED(status)) {
        result.termSignal = WTERMSIG(status);
    } else if (WIFEXITED(status)) {
        result.exitCode = WEXITSTATUS(status);
    }
    return result;
}

}  // namespace

std::string Process::resolveExecutable(const std::string& name) {
    if (name.empty()) return "";
    if (name.find('/') != std::string::npos) return name;

    const char* env = std::getenv("PATH");
    const std::string path = (env && *env) ? env : DEFAULT_PATH;

    std::string::size_type begin = 0;
    while (begin <= path.size()) {
        std::string::size_type end = path.find(':', begin);
        if (end == std::string::npos) end = path.size();

        // an empty PATH entry means the current directory
        std::string dir = path.substr(begin, end - begin);
        std::string candidate = (dir.empty() ? "." : dir) + "/" + name;
        if (access(candidate.c_str(), X_OK) == 0) return candidate;

        begin = end + 1;
    }
    return "";
}

std::vector<char*> Process::toArgv(const std::vector<std::string>& argv) {
    std::vector<char*> args;
    args.reserve(argv.size() + 1);
    for (const auto& a : argv) args.push_back(const_cast<char*>(a.c_str()));
    args.push_back(nullptr);
    return args;
}

// Runs in a freshly forked child of a threaded process: async-signal-safe calls only.
void Process::execQuiet(const char* path, char* const* args) {
    // The parent blocks SIGINT/SIGTERM for its signal watcher thread and
    // the mask survives exec; give the tools the default behaviour back.
    sigset_t none;
    sigemptyset(&none);
    sigprocmask(SIG_SETMASK, &none, nullptr);

    int devNull = open("/dev/null", O_RDWR);
    if (devNull >= 0) {
        dup2(devNull, STDIN_FILENO);
        dup2(devNull, STDOUT_FILENO);
        dup2(devNull, STDERR_FILENO);
        if (devNull > STDERR_FILENO) close(devNull);
    }

    execv(path, args);
    _exit(EXEC_FAILED);   // _exit: don't run the parent's atexit handlers in the child
}

ExitStatus Process::runAndWait(const std::vector<std::string>& argv) {
    ExitStatus notStarted;
    if (argv.empty()) return notStarted;

    // PATH lookup and allocation before fork, not after
    const std::string path = resolveExecutable(argv[0]);
    if (path.empty()) return notStarted;
    std::vector<char*> args = toArgv(argv);

    pid_t pid = fork();
    if (pid < 0) return notStarted;
    if (pid == 0) execQuiet(path.c_str(), args.data());

    ExitStatus status = waitForChild(pid);
    if (status.termSignal == 0 && status.exitCode == EXEC_FAILED) return notStarted;
    return status;
}

bool Process::spawnDetached(const std::vector<std::string>& argv) {
    if (argv.empty()) return false;
    const std::string path = resolveExecutable(argv[0]);
    if (path.empty()) return false;
    std::vector<char*> args = toArgv(argv);

    pid_t pid = fork();
    if (pid < 0) return false;

    if (pid == 0) {
        // intermediate child: start the real one and leave
        pid_t grandchild = fork();
        if (grandchild == 0) execQuiet(path.c_str(), args.data());
        _exit(grandchild < 0 ? EXEC_FAILED : 0);
    }

    return waitForChild(pid).succeeded();
}
