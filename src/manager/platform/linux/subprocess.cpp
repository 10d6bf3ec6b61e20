#include "platform/linux/subprocess.hpp"

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <fcntl.h>
#include <sys/wait.h>
#include <unistd.h>

std::expected<CommandResult, std::string>
run_command(const std::vector<std::string>& argv,
            const std::vector<std::pair<std::string, std::string>>& env) {
    if (argv.empty()) {
        return std::unexpected(std::string("empty command"));
    }

    std::vector<char*> args;
    for (auto& a : argv) args.push_back(const_cast<char*>(a.c_str()));
    args.push_back(nullptr);

    int pipefd[2];
    if (::pipe2(pipefd, O_CLOEXEC) < 0) {
        return std::unexpected(std::string("pipe() failed: ") + std::strerror(errno));
    }

    pid_t pid = ::fork();
    if (pid < 0) {
        ::close(pipefd[0]);
        ::close(pipefd[1]);
        return std::unexpected(std::string("fork() failed: ") + std::strerror(errno));
    }

    if (pid == 0) {
        // Child: stdout into the pipe, then exec
        ::dup2(pipefd[1], STDOUT_FILENO);
        for (auto& [name, value] : env) {
            ::setenv(name.c_str(), value.c_str(), 1);
        }
        ::execvp(args[0], args.data());
        ::_exit(127);
    }

    ::close(pipefd[1]);
    CommandResult result;
    char buf[4096];
    while (true) {
        ssize_t n = ::read(pipefd[0], buf, sizeof(buf));
        if (n < 0) {
            if (errno == EINTR) continue;
            break;
        }
        if (n == 0) break;
        result.out.append(buf, static_cast<size_t>(n));
    }
    ::close(pipefd[0]);

    int status;
    while (::waitpid(pid, &status, 0) < 0) {
        if (errno == EINTR) continue;
        return std::unexpected(std::string("waitpid() failed: ") + std::strerror(errno));
    }

    if (WIFEXITED(status)) {
        result.exit_code = WEXITSTATUS(status);
    } else {
        return std::unexpected(argv[0] + " terminated by signal " + std::to_string(WTERMSIG(status)));
    }

    if (result.exit_code == 127) {
        return std::unexpected(argv[0] + " could not be executed");
    }
    return result;
}
