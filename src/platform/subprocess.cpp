#include "platform/subprocess.hpp"

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <fcntl.h>
#include <filesystem>
#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>

namespace fs = std::filesystem;

namespace process {

namespace {

std::string errno_msg(const char* what) {
    return std::string(what) + " failed: " + std::strerror(errno);
}

bool is_executable(const fs::path& p) {
    std::error_code ec;
    return fs::is_regular_file(p, ec) && ::access(p.c_str(), X_OK) == 0;
}

} // namespace

std::expected<Result, std::string> run(const std::vector<std::string>& argv) {
    if (argv.empty()) {
        return std::unexpected("empty command line");
    }

    int out_pipe[2];
    int err_pipe[2];
    if (::pipe(out_pipe) < 0) {
        return std::unexpected(errno_msg("pipe()"));
    }
    if (::pipe(err_pipe) < 0) {
        auto msg = errno_msg("pipe()");
        ::close(out_pipe[0]);
        ::close(out_pipe[1]);
        return std::unexpected(msg);
    }

    std::vector<char*> args;
    args.reserve(argv.size() + 1);
    for (auto& a : argv) args.push_back(const_cast<char*>(a.c_str()));
    args.push_back(nullptr);

    pid_t pid = ::fork();
    if (pid < 0) {
        auto msg = errno_msg("fork()");
        ::close(out_pipe[0]);
        ::close(out_pipe[1]);
        ::close(err_pipe[0]);
        ::close(err_pipe[1]);
        return std::unexpected(msg);
    }

    if (pid == 0) {
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
        ::execvp(args[0], args.data());
        ::_exit(127);
    }

    ::close(out_pipe[1]);
    ::close(err_pipe[1]);

    Result result;
    pollfd fds[2] = {
        {.fd = out_pipe[0], .events = POLLIN, .revents = 0},
        {.fd = err_pipe[0], .events = POLLIN, .revents = 0},
    };
    std::string* sinks[2] = {&result.out, &result.err};
    int open_fds = 2;
    char buf[4096];

    while (open_fds > 0) {
        int rc = ::poll(fds, 2, -1);
        if (rc < 0) {
            if (errno == EINTR) continue;
            break;
        }
        for (int i = 0; i < 2; ++i) {
            if (fds[i].fd < 0 || fds[i].revents == 0) continue;
            ssize_t n = ::read(fds[i].fd, buf, sizeof(buf));
            if (n > 0) {
                sinks[i]->append(buf, static_cast<size_t>(n));
            } else if (n == 0 || errno != EINTR) {
                ::close(fds[i].fd);
                fds[i].fd = -1;
                --open_fds;
            }
        }
    }
    for (auto& p : fds) {
        if (p.fd >= 0) ::close(p.fd);
    }

    int status;
    while (::waitpid(pid, &status, 0) < 0) {
        if (errno == EINTR) continue;
        return std::unexpected(errno_msg("waitpid()"));
    }

    if (WIFEXITED(status)) {
        result.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        result.exit_code = 128 + WTERMSIG(status);
    }
    return result;
}

std::string find_executable(const std::string& name) {
    if (name.empty()) return {};

    if (name.find('/') != std::string::npos) {
        return is_executable(name) ? name : std::string{};
    }

    const char* path_env = std::getenv("PATH");
    std::string path = path_env ? path_env : "/usr/local/bin:/usr/bin:/bin";

    size_t pos = 0;
    while (pos <= path.size()) {
        size_t next = path.find(':', pos);
        if (next == std::string::npos) next = path.size();
        std::string dir = path.substr(pos, next - pos);
        if (dir.empty()) dir = ".";
        auto candidate = fs::path(dir) / name;
        if (is_executable(candidate)) return candidate.string();
        pos = next + 1;
    }
    return {};
}

} // namespace process
