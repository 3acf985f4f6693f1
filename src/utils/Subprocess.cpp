/**
 * Subprocess.cpp
 */

#include "Subprocess.hpp"

#include <cerrno>
#include <csignal>
#include <fcntl.h>
#include <sys/wait.h>
#include <unistd.h>

namespace homestream::utils {

Subprocess::Subprocess(std::vector<std::string> command)
    : m_command(std::move(command)) {
}

Subprocess::~Subprocess() {
    if (running()) {
        terminate();
        wait();
    }
    closeOutput();
}

std::string Subprocess::commandLine() const {
    std::string cmdLine;
    for (const auto& arg : m_command) {
        if (!cmdLine.empty()) cmdLine += " ";
        if (arg.find(' ') != std::string::npos) {
            cmdLine += "\"" + arg + "\"";
        } else {
            cmdLine += arg;
        }
    }
    return cmdLine;
}

bool Subprocess::start() {
    if (m_command.empty() || running()) {
        return false;
    }

    int fds[2];
    if (pipe(fds) != 0) {
        return false;
    }

    // Build argv before forking
    std::vector<char*> args;
    for (auto& arg : m_command) {
        args.push_back(const_cast<char*>(arg.c_str()));
    }
    args.push_back(nullptr);

    m_pid = fork();

    if (m_pid == 0) {
        // Child process
        int devNull = open("/dev/null", O_RDWR);
        if (devNull >= 0) {
            dup2(devNull, STDIN_FILENO);
            dup2(devNull, STDERR_FILENO);
            close(devNull);
        }
        dup2(fds[1], STDOUT_FILENO);
        close(fds[0]);
        close(fds[1]);

        execvp(args[0], args.data());
        _exit(127);
    }

    close(fds[1]);

    if (m_pid < 0) {
        close(fds[0]);
        m_pid = -1;
        return false;
    }

    m_stdout = fds[0];
    return true;
}

ssize_t Subprocess::read(char* buffer, size_t len) {
    if (m_stdout < 0) return 0;

    while (true) {
        ssize_t n = ::read(m_stdout, buffer, len);
        if (n < 0 && errno == EINTR) continue;
        return n;
    }
}

int Subprocess::wait() {
    if (!running()) return -1;

    closeOutput();

    int status = 0;
    pid_t result;
    do {
        result = waitpid(m_pid, &status, 0);
    } while (result < 0 && errno == EINTR);

    m_pid = -1;

    if (result < 0 || !WIFEXITED(status)) {
        return -1;
    }
    return WEXITSTATUS(status);
}

void Subprocess::terminate() {
    if (!running()) return;
    ::kill(m_pid, SIGTERM);
}

void Subprocess::closeOutput() {
    if (m_stdout >= 0) {
        close(m_stdout);
        m_stdout = -1;
    }
}

std::optional<Subprocess::RunResult> Subprocess::run(const std::vector<std::string>& command) {
    Subprocess process(command);
    if (!process.start()) {
        return std::nullopt;
    }

    RunResult result;
    char buffer[8192];
    ssize_t n;
    while ((n = process.read(buffer, sizeof(buffer))) > 0) {
        result.output.append(buffer, static_cast<size_t>(n));
    }

    result.exitCode = process.wait();
    return result;
}

} // namespace homestream::utils
