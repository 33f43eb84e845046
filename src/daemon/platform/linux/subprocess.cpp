#include "platform/linux/subprocess.hpp"

#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <sys/wait.h>
#include <unistd.h>

namespace platform {

std::expected<int, std::string> run_command(const std::vector<std::string>& argv,
                                            const std::optional<std::string>& input) {
    if (argv.empty()) {
        return std::unexpected("empty command");
    }

    std::vector<char*> args;
    args.reserve(argv.size() + 1);
    for (const auto& a : argv) args.push_back(const_cast<char*>(a.c_str()));
    args.push_back(nullptr);

    int pipefd[2] = {-1, -1};
    if (input && ::pipe2(pipefd, O_CLOEXEC) < 0) {
        return std::unexpected(std::string("pipe() failed: ") + std::strerror(errno));
    }

    pid_t pid = ::fork();
    if (pid < 0) {
        if (input) {
            ::close(pipefd[0]);
            ::close(pipefd[1]);
        }
        return std::unexpected(std::string("fork() failed: ") + std::strerror(errno));
    }

    if (pid == 0) {
        // The daemon blocks SIGINT/SIGTERM for its signalfd; children should not inherit that.
        sigset_t none;
        sigemptyset(&none);
        sigprocmask(SIG_SETMASK, &none, nullptr);

        if (input) {
            ::dup2(pipefd[0], STDIN_FILENO);
        }
        ::execvp(args[0], args.data());
        ::_exit(kCommandNotFound);
    }

    if (input) {
        ::close(pipefd[0]);
        size_t total_written = 0;
        while (total_written < input->size()) {
            ssize_t n = ::write(pipefd[1], input->data() + total_written,
                                input->size() - total_written);
            if (n < 0) {
                if (errno == EINTR) continue;
                // EPIPE: the child exited early; its exit code tells the story.
                break;
            }
            total_written += static_cast<size_t>(n);
        }
        ::close(pipefd[1]);
    }

    int status;
    while (::waitpid(pid, &status, 0) < 0) {
        if (errno == EINTR) continue;
        return std::unexpected(std::string("waitpid() failed: ") + std::strerror(errno));
    }

    if (WIFSIGNALED(status)) {
        return std::unexpected(argv[0] + " killed by signal " + std::to_string(WTERMSIG(status)));
    }
    return WEXITSTATUS(status);
}

} // namespace platform
