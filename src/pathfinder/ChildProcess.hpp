#ifndef SRC_PATHFINDER_CHILD_PROCESS_HPP_
#define SRC_PATHFINDER_CHILD_PROCESS_HPP_

#include "pathfinder/internal/FileSystem.hpp"

#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <sys/types.h>
#include <thread>
#include <vector>

namespace pathfinder {

class ErrorReporter;

// A spawned child process with piped stdin and stdout and an inherited stderr. A reaper thread blocks on the child's
// termination from the moment it is spawned, so waiting with a timeout and killing never race with reuse of the pid.
class ChildProcess {
public:
    enum WaitResult {
        kExited,
        kTimedOut,
        kWaitError,
    };

    ChildProcess() = delete;
    explicit ChildProcess(std::shared_ptr<ErrorReporter> errorReporter);
    ChildProcess(const ChildProcess&) = delete;
    ChildProcess& operator=(const ChildProcess&) = delete;
    // Kills the child if it is still running. Owners are expected to have terminated it already. A child that cannot be
    // killed is abandoned to its reaper thread.
    ~ChildProcess();

    // Starts command[0], searched for on PATH, with the remaining elements as arguments and |workingDirectory| as its
    // current directory. Fails if the executable could not be started.
    bool spawn(const std::vector<std::string>& command, const fs::path& workingDirectory);

    pid_t pid() const { return m_pid; }
    // Write end of the child's stdin in non-blocking mode, -1 once closed.
    int stdinFd() const { return m_stdinFd; }
    // Read end of the child's stdout.
    int stdoutFd() const { return m_stdoutFd; }
    void closeStdin();

    // Blocks until the child terminates or |timeout| elapses.
    WaitResult waitForExit(std::chrono::milliseconds timeout);

    // Sends SIGKILL if the child is still running, then waits for it to be reaped. Returns false only if the signal
    // could not be delivered.
    bool kill();

    bool running() const;
    // Raw wait status as returned by waitpid(), once the child has been reaped.
    std::optional<int> waitStatus() const;

private:
    // Shared with the reaper thread, which may outlive this object if the child could not be killed.
    struct ExitState {
        // Protects exited, waitFailed and waitStatus.
        std::mutex mutex;
        std::condition_variable condition;
        bool exited = false;
        bool waitFailed = false;
        int waitStatus = 0;
    };

    static void reaperMain(pid_t pid, std::string name, std::shared_ptr<ExitState> exitState);
    void joinReaper();

    std::shared_ptr<ErrorReporter> m_errorReporter;
    pid_t m_pid;
    int m_stdinFd;
    int m_stdoutFd;
    std::string m_name;
    std::shared_ptr<ExitState> m_exitState;
    std::thread m_reaper;
};

} // namespace pathfinder

#endif // SRC_PATHFINDER_CHILD_PROCESS_HPP_
