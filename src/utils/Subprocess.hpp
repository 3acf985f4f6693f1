// HomeStream - Subprocess
// fork/exec wrapper for the transcoder, media inspector and decoder executables

#pragma once

#include <string>
#include <vector>
#include <optional>
#include <sys/types.h>

namespace homestream::utils {

/**
 * @brief Child process with its stdout on a pipe
 *
 * stdin and stderr of the child are connected to /dev/null. The child is
 * terminated and reaped on destruction if still running.
 */
class Subprocess {
public:
    struct RunResult {
        int exitCode{-1};
        std::string output;
    };

    explicit Subprocess(std::vector<std::string> command);
    ~Subprocess();

    Subprocess(const Subprocess&) = delete;
    Subprocess& operator=(const Subprocess&) = delete;

    /**
     * Start the child
     * @return false if the pipe or fork failed
     */
    bool start();

    /**
     * Read from the child's stdout
     * @return bytes read, 0 at end of output, -1 on error
     */
    ssize_t read(char* buffer, size_t len);

    /**
     * Wait for exit
     * @return exit status, or -1 if killed by a signal
     */
    int wait();

    /**
     * SIGTERM the child (no-op if not running)
     */
    void terminate();

    bool running() const { return m_pid > 0; }
    pid_t pid() const { return m_pid; }

    const std::vector<std::string>& command() const { return m_command; }
    std::string commandLine() const;

    /**
     * Run a command to completion, capturing stdout
     * @return nullopt if the process could not be started
     */
    static std::optional<RunResult> run(const std::vector<std::string>& command);

private:
    void closeOutput();

    std::vector<std::string> m_command;
    pid_t m_pid{-1};
    int m_stdout{-1};
};

} // namespace homestream::utils
