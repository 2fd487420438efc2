#include "pathfinder/ChildProcess.hpp"

#include "pathfinder/ErrorReporter.hpp"

#include "fmt/format.h"
#include "spdlog/spdlog.h"

#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <sys/wait.h>
#include <unistd.h>

namespace {

void closeDescriptor(int& fd) {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

// Writes to a child that has exited must surface as EPIPE rather than terminate the whole process.
void ignoreBrokenPipes() {
    static std::once_flag once;
    std::call_once(once, [] { std::signal(SIGPIPE, SIG_IGN); });
}

} // namespace

namespace pathfinder {

ChildProcess::ChildProcess(std::shared_ptr<ErrorReporter> errorReporter):
    m_errorReporter(std::move(errorReporter)),
    m_pid(-1),
    m_stdinFd(-1),
    m_stdoutFd(-1),
    m_exitState(std::make_shared<ExitState>()) {}

ChildProcess::~ChildProcess() {
    if (m_pid > 0) {
        if (running()) {
            SPDLOG_WARN("Child process {} ({}) still running at destruction, killing it.", m_pid, m_name);
            if (!kill()) {
                SPDLOG_ERROR("Abandoning child process {} ({}) that could not be killed.", m_pid, m_name);
                m_reaper.detach();
            }
        }
        joinReaper();
    }
    closeDescriptor(m_stdinFd);
    closeDescriptor(m_stdoutFd);
}

bool ChildProcess::spawn(const std::vector<std::string>& command, const fs::path& workingDirectory) {
    if (command.empty()) {
        m_errorReporter->addError(ErrorReporter::kProcess, "cannot spawn an empty command");
        return false;
    }
    if (m_pid > 0) {
        m_errorReporter->addError(ErrorReporter::kProcess, "child process already spawned");
        return false;
    }
    ignoreBrokenPipes();
    m_name = command[0];

    // Everything the child needs is prepared before fork(), which leaves it only async-signal-safe calls to make.
    std::vector<char*> argv;
    argv.reserve(command.size() + 1);
    for (const auto& argument : command) {
        argv.push_back(const_cast<char*>(argument.c_str()));
    }
    argv.push_back(nullptr);
    std::string directory = workingDirectory.string();

    int stdinPipe[2] = {-1, -1};
    int stdoutPipe[2] = {-1, -1};
    // Carries errno back from a failed chdir() or exec, closes on successful exec.
    int statusPipe[2] = {-1, -1};
    // The write end of stdin is non-blocking so that writers can bound how long they wait on a child that stopped
    // reading its input.
    if (::pipe2(stdinPipe, O_CLOEXEC) != 0 || ::pipe2(stdoutPipe, O_CLOEXEC) != 0 ||
        ::pipe2(statusPipe, O_CLOEXEC) != 0 || ::fcntl(stdinPipe[1], F_SETFL, O_NONBLOCK) != 0) {
        m_errorReporter->addError(ErrorReporter::kProcess,
                                  fmt::format("failed to create pipes for '{}': {}", m_name, std::strerror(errno)));
        for (int* fd : {&stdinPipe[0], &stdinPipe[1], &stdoutPipe[0], &stdoutPipe[1], &statusPipe[0], &statusPipe[1]}) {
            closeDescriptor(*fd);
        }
        return false;
    }

    pid_t pid = ::fork();
    if (pid < 0) {
        m_errorReporter->addError(ErrorReporter::kProcess,
                                  fmt::format("failed to fork for '{}': {}", m_name, std::strerror(errno)));
        for (int* fd : {&stdinPipe[0], &stdinPipe[1], &stdoutPipe[0], &stdoutPipe[1], &statusPipe[0], &statusPipe[1]}) {
            closeDescriptor(*fd);
        }
        return false;
    }

    if (pid == 0) {
        // Child. dup2() clears close-on-exec on the duplicated descriptors.
        int error = 0;
        if (::chdir(directory.c_str()) != 0 || ::dup2(stdinPipe[0], STDIN_FILENO) < 0 ||
            ::dup2(stdoutPipe[1], STDOUT_FILENO) < 0) {
            error = errno;
        } else {
            ::execvp(argv[0], argv.data());
            error = errno;
        }
        ssize_t ignored = ::write(statusPipe[1], &error, sizeof(error));
        (void)ignored;
        ::_exit(127);
    }

    closeDescriptor(stdinPipe[0]);
    closeDescriptor(stdoutPipe[1]);
    closeDescriptor(statusPipe[1]);

    int childError = 0;
    ssize_t statusBytes;
    do {
        statusBytes = ::read(statusPipe[0], &childError, sizeof(childError));
    } while (statusBytes < 0 && errno == EINTR);
    closeDescriptor(statusPipe[0]);

    if (statusBytes > 0) {
        int status = 0;
        while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {}
        closeDescriptor(stdinPipe[1]);
        closeDescriptor(stdoutPipe[0]);
        m_errorReporter->addError(ErrorReporter::kProcess,
                                  fmt::format("failed to spawn language server process '{}' in {}: {}", m_name,
                                              directory, std::strerror(childError)));
        return false;
    }

    m_pid = pid;
    m_stdinFd = stdinPipe[1];
    m_stdoutFd = stdoutPipe[0];
    m_reaper = std::thread(&ChildProcess::reaperMain, m_pid, m_name, m_exitState);
    SPDLOG_DEBUG("Spawned child process {} ({}) in {}", m_pid, m_name, directory);
    return true;
}

void ChildProcess::closeStdin() { closeDescriptor(m_stdinFd); }

ChildProcess::WaitResult ChildProcess::waitForExit(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(m_exitState->mutex);
    if (m_pid <= 0) {
        m_errorReporter->addError(ErrorReporter::kProcess, "no child process to wait for");
        return kWaitError;
    }
    if (!m_exitState->condition.wait_for(lock, timeout, [this] { return m_exitState->exited; })) {
        return kTimedOut;
    }
    if (m_exitState->waitFailed) {
        m_errorReporter->addError(ErrorReporter::kProcess,
                                  fmt::format("failed to wait for child process {} ({})", m_pid, m_name));
        return kWaitError;
    }
    lock.unlock();
    joinReaper();
    return kExited;
}

bool ChildProcess::kill() {
    std::unique_lock<std::mutex> lock(m_exitState->mutex);
    if (m_pid <= 0) {
        return true;
    }
    if (!m_exitState->exited) {
        // The reaper has not collected the child yet, so the pid cannot have been reused.
        if (::kill(m_pid, SIGKILL) != 0 && errno != ESRCH) {
            m_errorReporter->addError(ErrorReporter::kProcess,
                                      fmt::format("failed to kill child process {} ({}): {}", m_pid, m_name,
                                                  std::strerror(errno)));
            return false;
        }
        SPDLOG_DEBUG("Sent SIGKILL to child process {} ({})", m_pid, m_name);
        m_exitState->condition.wait(lock, [this] { return m_exitState->exited; });
    }
    lock.unlock();
    joinReaper();
    return true;
}

bool ChildProcess::running() const {
    std::lock_guard<std::mutex> lock(m_exitState->mutex);
    return m_pid > 0 && !m_exitState->exited;
}

std::optional<int> ChildProcess::waitStatus() const {
    std::lock_guard<std::mutex> lock(m_exitState->mutex);
    if (!m_exitState->exited || m_exitState->waitFailed) {
        return std::nullopt;
    }
    return m_exitState->waitStatus;
}

void ChildProcess::reaperMain(pid_t pid, std::string name, std::shared_ptr<ExitState> exitState) {
    // Wait without reaping first, so that the pid stays valid until exited is set under the lock.
    siginfo_t info;
    int result;
    do {
        result = ::waitid(P_PID, static_cast<id_t>(pid), &info, WEXITED | WNOWAIT);
    } while (result < 0 && errno == EINTR);

    std::lock_guard<std::mutex> lock(exitState->mutex);
    if (result < 0) {
        SPDLOG_ERROR("waitid() on child process {} failed: {}", pid, std::strerror(errno));
        exitState->waitFailed = true;
    } else {
        int status = 0;
        pid_t reaped;
        do {
            reaped = ::waitpid(pid, &status, 0);
        } while (reaped < 0 && errno == EINTR);
        if (reaped < 0) {
            SPDLOG_ERROR("waitpid() on child process {} failed: {}", pid, std::strerror(errno));
            exitState->waitFailed = true;
        } else {
            exitState->waitStatus = status;
            if (WIFEXITED(status)) {
                SPDLOG_DEBUG("Child process {} ({}) exited with status {}", pid, name, WEXITSTATUS(status));
            } else if (WIFSIGNALED(status)) {
                SPDLOG_DEBUG("Child process {} ({}) terminated by signal {}", pid, name, WTERMSIG(status));
            }
        }
    }
    exitState->exited = true;
    exitState->condition.notify_all();
}

void ChildProcess::joinReaper() {
    if (m_reaper.joinable() && m_reaper.get_id() != std::this_thread::get_id()) {
        m_reaper.join();
    }
}

} // namespace pathfinder
