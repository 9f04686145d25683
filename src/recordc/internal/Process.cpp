#include "recordc/internal/Process.hpp"

#include "fmt/format.h"
#include "spdlog/spdlog.h"

#include <array>
#include <cerrno>
#include <climits>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <pthread.h>
#include <signal.h>
#include <spawn.h>
#include <sys/wait.h>
#include <thread>
#include <unistd.h>

extern char** environ;

namespace recordc {

namespace {

bool makePipe(int fds[2]) {
#if defined(__linux__)
    return pipe2(fds, O_CLOEXEC) == 0;
#else
    if (pipe(fds) != 0) { return false; }
    fcntl(fds[0], F_SETFD, FD_CLOEXEC);
    fcntl(fds[1], F_SETFD, FD_CLOEXEC);
    return true;
#endif
}

void closeFd(int& fd) {
    if (fd >= 0) {
        close(fd);
        fd = -1;
    }
}

std::vector<char*> makeArgv(const std::vector<std::string>& arguments) {
    std::vector<char*> argv;
    argv.reserve(arguments.size() + 1);
    for (const auto& argument : arguments) {
        argv.emplace_back(const_cast<char*>(argument.c_str()));
    }
    argv.emplace_back(nullptr);
    return argv;
}

// Children start with an empty signal mask and default SIGPIPE handling, whatever the host process has set.
void initSpawnAttributes(posix_spawnattr_t* attributes) {
    posix_spawnattr_init(attributes);
    sigset_t signals;
    sigemptyset(&signals);
    posix_spawnattr_setsigmask(attributes, &signals);
    sigaddset(&signals, SIGPIPE);
    posix_spawnattr_setsigdefault(attributes, &signals);
    posix_spawnattr_setflags(attributes, POSIX_SPAWN_SETSIGMASK | POSIX_SPAWN_SETSIGDEF);
}

int pollTimeout(std::chrono::steady_clock::time_point deadline) {
    if (deadline == std::chrono::steady_clock::time_point::max()) { return -1; }
    auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline
            - std::chrono::steady_clock::now()).count();
    if (remaining <= 0) { return 0; }
    if (remaining > INT_MAX) { return INT_MAX; }
    return static_cast<int>(remaining);
}

int decodeStatus(int status) {
    if (WIFEXITED(status)) { return WEXITSTATUS(status); }
    if (WIFSIGNALED(status)) { return 128 + WTERMSIG(status); }
    return -1;
}

bool waitForChild(pid_t pid, int& status) {
    while (waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            SPDLOG_ERROR("waitpid() failed for child {}: {}", pid, std::strerror(errno));
            return false;
        }
    }
    return true;
}

} // namespace

ProcessResult runProcess(const std::vector<std::string>& arguments, std::chrono::milliseconds timeout) {
    ProcessResult result;
    if (arguments.empty()) {
        result.spawnError = "no program to run";
        return result;
    }

    int outputPipe[2];
    if (!makePipe(outputPipe)) {
        result.spawnError = fmt::format("failed to create pipe: {}", std::strerror(errno));
        return result;
    }

    posix_spawn_file_actions_t actions;
    posix_spawn_file_actions_init(&actions);
    posix_spawn_file_actions_addopen(&actions, STDIN_FILENO, "/dev/null", O_RDONLY, 0);
    posix_spawn_file_actions_adddup2(&actions, outputPipe[1], STDOUT_FILENO);
    posix_spawn_file_actions_adddup2(&actions, outputPipe[1], STDERR_FILENO);
    posix_spawnattr_t attributes;
    initSpawnAttributes(&attributes);

    auto argv = makeArgv(arguments);
    pid_t pid = -1;
    int spawnError = posix_spawnp(&pid, argv[0], &actions, &attributes, argv.data(), environ);
    posix_spawn_file_actions_destroy(&actions);
    posix_spawnattr_destroy(&attributes);
    closeFd(outputPipe[1]);

    if (spawnError != 0) {
        closeFd(outputPipe[0]);
        result.spawnError = fmt::format("failed to run '{}': {}", arguments[0], std::strerror(spawnError));
        return result;
    }
    result.spawned = true;
    SPDLOG_TRACE("Spawned '{}' as pid {}", arguments[0], pid);

    auto deadline = timeout.count() > 0 ? std::chrono::steady_clock::now() + timeout
                                        : std::chrono::steady_clock::time_point::max();
    std::array<char, 4096> buffer;
    while (true) {
        pollfd pollFd{outputPipe[0], POLLIN, 0};
        int ready = poll(&pollFd, 1, pollTimeout(deadline));
        if (ready < 0) {
            if (errno == EINTR) { continue; }
            SPDLOG_ERROR("poll() failed on output of '{}': {}", arguments[0], std::strerror(errno));
            break;
        }
        if (ready == 0) {
            SPDLOG_WARN("'{}' exceeded timeout of {} ms, killing pid {}", arguments[0], timeout.count(), pid);
            kill(pid, SIGKILL);
            result.timedOut = true;
            break;
        }
        ssize_t bytesRead = ::read(outputPipe[0], buffer.data(), buffer.size());
        if (bytesRead < 0) {
            if (errno == EINTR) { continue; }
            SPDLOG_ERROR("read() failed on output of '{}': {}", arguments[0], std::strerror(errno));
            break;
        }
        if (bytesRead == 0) { break; }
        result.output.append(buffer.data(), static_cast<size_t>(bytesRead));
    }
    closeFd(outputPipe[0]);

    int status = 0;
    if (waitForChild(pid, status)) {
        result.exitStatus = decodeStatus(status);
    }
    return result;
}

ChildProcess::ChildProcess(): m_pid(-1), m_stdin(-1), m_stdout(-1) {}

ChildProcess::~ChildProcess() { terminate(std::chrono::milliseconds(100)); }

bool ChildProcess::spawn(const std::vector<std::string>& arguments, std::string& error) {
    if (isRunning()) {
        error = "child process already running";
        return false;
    }
    if (arguments.empty()) {
        error = "no program to run";
        return false;
    }

    int inputPipe[2];
    int outputPipe[2];
    if (!makePipe(inputPipe)) {
        error = fmt::format("failed to create pipe: {}", std::strerror(errno));
        return false;
    }
    if (!makePipe(outputPipe)) {
        error = fmt::format("failed to create pipe: {}", std::strerror(errno));
        closeFd(inputPipe[0]);
        closeFd(inputPipe[1]);
        return false;
    }

    posix_spawn_file_actions_t actions;
    posix_spawn_file_actions_init(&actions);
    posix_spawn_file_actions_adddup2(&actions, inputPipe[0], STDIN_FILENO);
    posix_spawn_file_actions_adddup2(&actions, outputPipe[1], STDOUT_FILENO);
    posix_spawn_file_actions_addopen(&actions, STDERR_FILENO, "/dev/null", O_WRONLY, 0);
    posix_spawnattr_t attributes;
    initSpawnAttributes(&attributes);

    auto argv = makeArgv(arguments);
    pid_t pid = -1;
    int spawnError = posix_spawnp(&pid, argv[0], &actions, &attributes, argv.data(), environ);
    posix_spawn_file_actions_destroy(&actions);
    posix_spawnattr_destroy(&attributes);
    closeFd(inputPipe[0]);
    closeFd(outputPipe[1]);

    if (spawnError != 0) {
        closeFd(inputPipe[1]);
        closeFd(outputPipe[0]);
        error = fmt::format("failed to run '{}': {}", arguments[0], std::strerror(spawnError));
        return false;
    }

#if defined(__APPLE__)
    fcntl(inputPipe[1], F_SETNOSIGPIPE, 1);
#endif

    m_pid = pid;
    m_stdin = inputPipe[1];
    m_stdout = outputPipe[0];
    SPDLOG_DEBUG("Started child '{}' as pid {}", arguments[0], m_pid);
    return true;
}

bool ChildProcess::write(std::string_view data) {
    if (m_stdin < 0) { return false; }

#if defined(__linux__)
    // A child that has exited turns our write into SIGPIPE, which would terminate the host. Block it on this thread
    // and discard it if raised.
    sigset_t pipeSignal;
    sigset_t oldMask;
    sigemptyset(&pipeSignal);
    sigaddset(&pipeSignal, SIGPIPE);
    pthread_sigmask(SIG_BLOCK, &pipeSignal, &oldMask);
#endif

    bool ok = true;
    size_t written = 0;
    while (written < data.size()) {
        ssize_t bytesWritten = ::write(m_stdin, data.data() + written, data.size() - written);
        if (bytesWritten < 0) {
            if (errno == EINTR) { continue; }
#if defined(__linux__)
            if (errno == EPIPE) {
                timespec noWait{0, 0};
                sigtimedwait(&pipeSignal, nullptr, &noWait);
            }
#endif
            SPDLOG_WARN("write() to child {} failed: {}", m_pid, std::strerror(errno));
            ok = false;
            break;
        }
        written += static_cast<size_t>(bytesWritten);
    }

#if defined(__linux__)
    pthread_sigmask(SIG_SETMASK, &oldMask, nullptr);
#endif
    return ok;
}

bool ChildProcess::read(std::string& buffer, std::chrono::steady_clock::time_point deadline, bool& timedOut) {
    timedOut = false;
    if (m_stdout < 0) { return false; }

    std::array<char, 4096> chunk;
    while (true) {
        pollfd pollFd{m_stdout, POLLIN, 0};
        int ready = poll(&pollFd, 1, pollTimeout(deadline));
        if (ready < 0) {
            if (errno == EINTR) { continue; }
            SPDLOG_ERROR("poll() failed on child {}: {}", m_pid, std::strerror(errno));
            return false;
        }
        if (ready == 0) {
            timedOut = true;
            return false;
        }
        ssize_t bytesRead = ::read(m_stdout, chunk.data(), chunk.size());
        if (bytesRead < 0) {
            if (errno == EINTR) { continue; }
            SPDLOG_ERROR("read() failed on child {}: {}", m_pid, std::strerror(errno));
            return false;
        }
        if (bytesRead == 0) { return false; }
        buffer.append(chunk.data(), static_cast<size_t>(bytesRead));
        return true;
    }
}

void ChildProcess::terminate(std::chrono::milliseconds grace) {
    closeFd(m_stdin);
    if (m_pid > 0) {
        int status = 0;
        auto deadline = std::chrono::steady_clock::now() + grace;
        pid_t waited = waitpid(m_pid, &status, WNOHANG);
        while (waited == 0 && std::chrono::steady_clock::now() < deadline) {
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
            waited = waitpid(m_pid, &status, WNOHANG);
        }
        if (waited == 0) {
            SPDLOG_WARN("Child {} did not exit after stdin closed, killing", m_pid);
            kill(m_pid, SIGKILL);
            waitForChild(m_pid, status);
        } else if (waited > 0) {
            SPDLOG_DEBUG("Child {} exited with status {}", m_pid, decodeStatus(status));
        }
        m_pid = -1;
    }
    closeFd(m_stdout);
}

} // namespace recordc
