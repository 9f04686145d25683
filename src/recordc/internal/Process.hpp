#ifndef SRC_RECORDC_INTERNAL_PROCESS_HPP_
#define SRC_RECORDC_INTERNAL_PROCESS_HPP_

#include <chrono>
#include <string>
#include <string_view>
#include <sys/types.h>
#include <vector>

namespace recordc {

struct ProcessResult {
    bool spawned = false;
    bool timedOut = false;
    // Exit code of the child, or 128 + signal number if it was killed by a signal.
    int exitStatus = -1;
    // Combined stdout and stderr.
    std::string output;
    std::string spawnError;
};

// Runs arguments[0], searched for in PATH, with the remaining elements as its arguments. No shell is involved. Blocks
// until the child exits or the timeout elapses, in which case the child is killed. A zero timeout waits forever.
ProcessResult runProcess(const std::vector<std::string>& arguments, std::chrono::milliseconds timeout);

// A long-lived child with pipes to its stdin and stdout. Its stderr is discarded. Not thread-safe, callers must
// serialize access.
class ChildProcess {
public:
    ChildProcess();
    ~ChildProcess();

    bool spawn(const std::vector<std::string>& arguments, std::string& error);
    bool isRunning() const { return m_pid > 0; }
    pid_t pid() const { return m_pid; }

    // Writes all of data to the child's stdin. Returns false if the child closed its end.
    bool write(std::string_view data);

    // Appends whatever the child has written to buffer, waiting until the deadline for at least one byte. Returns
    // false on end of stream or error, or on timeout with timedOut set.
    bool read(std::string& buffer, std::chrono::steady_clock::time_point deadline, bool& timedOut);

    // Closes the child's stdin, waits up to grace for it to exit, then kills it. Safe to call when not running.
    void terminate(std::chrono::milliseconds grace);

private:
    pid_t m_pid;
    int m_stdin;
    int m_stdout;
};

} // namespace recordc

#endif // SRC_RECORDC_INTERNAL_PROCESS_HPP_
