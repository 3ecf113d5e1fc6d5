#include "agent_process.hpp"

#include <csignal>
#include <fcntl.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <thread>

namespace decaf {

AgentProcess::AgentProcess(std::vector<std::string> argv)
    : argv_(std::move(argv))
{}

AgentProcess::~AgentProcess() {
    stop(std::chrono::milliseconds(0));
}

bool AgentProcess::start(std::string& error) {
    if (argv_.empty()) {
        error = "No agent command given";
        return false;
    }
    if (pid_ > 0) {
        error = "Agent already started";
        return false;
    }

    // Built before fork: the child must not allocate.
    std::vector<char*> args;
    args.reserve(argv_.size() + 1);
    for (auto& arg : argv_) args.push_back(arg.data());
    args.push_back(nullptr);

    int stdin_pipe[2];
    int stdout_pipe[2];

    if (::pipe2(stdin_pipe, O_CLOEXEC) != 0) {
        error = std::string("Failed to create pipes: ") + std::strerror(errno);
        return false;
    }
    if (::pipe2(stdout_pipe, O_CLOEXEC) != 0) {
        error = std::string("Failed to create pipes: ") + std::strerror(errno);
        ::close(stdin_pipe[0]);
        ::close(stdin_pipe[1]);
        return false;
    }

    pid_t pid = ::fork();
    if (pid < 0) {
        error = std::string("Failed to fork process: ") + std::strerror(errno);
        ::close(stdin_pipe[0]);
        ::close(stdin_pipe[1]);
        ::close(stdout_pipe[0]);
        ::close(stdout_pipe[1]);
        return false;
    }

    if (pid == 0) {
        // Child: stdin/stdout become the pipes, stderr stays ours.
        ::close(stdin_pipe[1]);
        ::close(stdout_pipe[0]);
        ::dup2(stdin_pipe[0], STDIN_FILENO);
        ::dup2(stdout_pipe[1], STDOUT_FILENO);
        ::close(stdin_pipe[0]);
        ::close(stdout_pipe[1]);
        std::signal(SIGPIPE, SIG_DFL);
        ::execvp(args[0], args.data());
        _exit(127);
    }

    ::close(stdin_pipe[0]);
    ::close(stdout_pipe[1]);
    pid_ = pid;
    stdin_fd_ = stdin_pipe[1];
    stdout_fd_ = stdout_pipe[0];
    exit_status_ = -1;
    return true;
}

void AgentProcess::close_stdin() {
    if (stdin_fd_ >= 0) {
        ::close(stdin_fd_);
        stdin_fd_ = -1;
    }
}

int AgentProcess::stop(std::chrono::milliseconds grace) {
    close_stdin();

    if (pid_ > 0) {
        int status = 0;
        pid_t reaped = 0;
        auto deadline = std::chrono::steady_clock::now() + grace;

        while (true) {
            reaped = ::waitpid(pid_, &status, WNOHANG);
            if (reaped != 0) break;
            if (std::chrono::steady_clock::now() >= deadline) break;
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }

        if (reaped == 0) {
            ::kill(pid_, SIGKILL);
            reaped = ::waitpid(pid_, &status, 0);
        }
        exit_status_ = reaped == pid_ ? decode_status(status) : -1;
        pid_ = -1;
    }

    if (stdout_fd_ >= 0) {
        ::close(stdout_fd_);
        stdout_fd_ = -1;
    }
    return exit_status_;
}

int AgentProcess::decode_status(int status) {
    if (WIFEXITED(status)) return WEXITSTATUS(status);
    if (WIFSIGNALED(status)) return 128 + WTERMSIG(status);
    return -1;
}

} // namespace decaf
