#pragma once
#include <string>
#include <vector>
#include <chrono>
#include <sys/types.h>

namespace decaf {

// The downstream agent (or next proxy in a chain), run as a child process
// speaking ACP on its stdin/stdout. stderr is inherited.
class AgentProcess {
public:
    explicit AgentProcess(std::vector<std::string> argv);
    ~AgentProcess();

    AgentProcess(const AgentProcess&) = delete;
    AgentProcess& operator=(const AgentProcess&) = delete;

    // Fork and exec argv[0] (PATH lookup). Returns false and populates
    // error on failure. An exec failure shows up as exit status 127.
    bool start(std::string& error);

    // Write end of the child's stdin, read end of its stdout (-1 if closed).
    int stdin_fd() const { return stdin_fd_; }
    int stdout_fd() const { return stdout_fd_; }

    // Close the child's stdin so it sees EOF.
    void close_stdin();

    // Close stdin, wait up to grace for the child to exit, then SIGKILL it.
    // Returns the exit status (128 + signal if killed), or -1 if the
    // process was never started.
    int stop(std::chrono::milliseconds grace = std::chrono::milliseconds(2000));

    pid_t pid() const { return pid_; }
    const std::vector<std::string>& argv() const { return argv_; }

private:
    static int decode_status(int status);

    std::vector<std::string> argv_;
    pid_t pid_ = -1;
    int stdin_fd_ = -1;
    int stdout_fd_ = -1;
    int exit_status_ = -1;
};

} // namespace decaf
