#include "command_runner.hpp"
#include <cerrno>
#include <cstring>
#include <format>
#include <fcntl.h>
#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>

namespace tmxu {

static void close_fd(int& fd) {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

void CommandRunner::drain(int stdout_fd, int stderr_fd, std::string& out, std::string& err) {
    struct pollfd fds[2] = {
        {stdout_fd, POLLIN, 0},
        {stderr_fd, POLLIN, 0},
    };
    std::string* sinks[2] = {&out, &err};
    int open_count = 2;
    char buffer[4096];

    while (open_count > 0) {
        int ret = ::poll(fds, 2, -1);
        if (ret < 0) {
            if (errno == EINTR) continue;
            return;
        }

        for (int i = 0; i < 2; ++i) {
            if (fds[i].fd < 0 || fds[i].revents == 0) continue;

            ssize_t n = ::read(fds[i].fd, buffer, sizeof(buffer));
            if (n > 0) {
                sinks[i]->append(buffer, static_cast<size_t>(n));
            } else if (n == 0 || errno != EINTR) {
                // EOF or read error: stop watching this stream
                fds[i].fd = -1;
                open_count--;
            }
        }
    }
}

CommandOutput CommandRunner::run(const std::vector<std::string>& argv) {
    CommandOutput output;

    if (argv.empty()) {
        output.error_message = "empty command";
        return output;
    }

    int out_pipe[2] = {-1, -1};
    int err_pipe[2] = {-1, -1};
    int exec_pipe[2] = {-1, -1};  // Reports exec failure errno back to the parent

    if (::pipe(out_pipe) < 0 || ::pipe(err_pipe) < 0 || ::pipe2(exec_pipe, O_CLOEXEC) < 0) {
        output.error_message = std::format("pipe() failed: {}", std::strerror(errno));
        for (int* p : {out_pipe, err_pipe, exec_pipe}) {
            close_fd(p[0]);
            close_fd(p[1]);
        }
        return output;
    }

    std::vector<char*> args;
    args.reserve(argv.size() + 1);
    for (const auto& arg : argv) {
        args.push_back(const_cast<char*>(arg.c_str()));
    }
    args.push_back(nullptr);

    pid_t pid = ::fork();
    if (pid < 0) {
        output.error_message = std::format("fork() failed: {}", std::strerror(errno));
        for (int* p : {out_pipe, err_pipe, exec_pipe}) {
            close_fd(p[0]);
            close_fd(p[1]);
        }
        return output;
    }

    if (pid == 0) {
        // Child: wire stdout/stderr to the pipes, stdin to /dev/null
        int devnull = ::open("/dev/null", O_RDONLY);
        if (devnull >= 0) {
            ::dup2(devnull, STDIN_FILENO);
            ::close(devnull);
        }
        ::dup2(out_pipe[1], STDOUT_FILENO);
        ::dup2(err_pipe[1], STDERR_FILENO);
        ::close(out_pipe[0]);
        ::close(out_pipe[1]);
        ::close(err_pipe[0]);
        ::close(err_pipe[1]);
        ::close(exec_pipe[0]);

        ::execvp(args[0], args.data());

        int exec_errno = errno;
        ssize_t ignored = ::write(exec_pipe[1], &exec_errno, sizeof(exec_errno));
        (void)ignored;
        ::_exit(127);
    }

    // Parent
    close_fd(out_pipe[1]);
    close_fd(err_pipe[1]);
    close_fd(exec_pipe[1]);

    int exec_errno = 0;
    ssize_t n;
    do {
        n = ::read(exec_pipe[0], &exec_errno, sizeof(exec_errno));
    } while (n < 0 && errno == EINTR);
    close_fd(exec_pipe[0]);

    if (n == static_cast<ssize_t>(sizeof(exec_errno))) {
        // exec failed; reap the child and report
        close_fd(out_pipe[0]);
        close_fd(err_pipe[0]);
        while (::waitpid(pid, nullptr, 0) < 0 && errno == EINTR) {
        }
        output.error_message = std::format("{}: {}", argv[0], std::strerror(exec_errno));
        return output;
    }

    drain(out_pipe[0], err_pipe[0], output.stdout_text, output.stderr_text);
    close_fd(out_pipe[0]);
    close_fd(err_pipe[0]);

    int status = 0;
    while (::waitpid(pid, &status, 0) < 0) {
        if (errno == EINTR) continue;
        output.error_message = std::format("waitpid() failed: {}", std::strerror(errno));
        return output;
    }

    output.spawned = true;
    output.exit_code = WIFEXITED(status) ? WEXITSTATUS(status) : -1;
    return output;
}

} // namespace tmxu
