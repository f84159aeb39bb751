#include "relay/media/subprocess.hpp"

#include <spdlog/spdlog.h>

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <spawn.h>
#include <sys/wait.h>
#include <unistd.h>

extern char** environ;

namespace relay::media {

namespace {

struct Pipe {
    int read_fd = -1;
    int write_fd = -1;

    ~Pipe() {
        if (read_fd >= 0) ::close(read_fd);
        if (write_fd >= 0) ::close(write_fd);
    }

    bool open() {
        // Both ends close-on-exec so concurrent spawns never inherit them;
        // dup2 in the child clears the flag on stdout/stderr
        int fds[2];
        if (::pipe2(fds, O_CLOEXEC) != 0) {
            return false;
        }
        read_fd = fds[0];
        write_fd = fds[1];
        return true;
    }

    void close_write() {
        if (write_fd >= 0) {
            ::close(write_fd);
            write_fd = -1;
        }
    }
};

void flush_lines(std::string& buffer, std::string& sink, const LineCallback& on_line, bool eof) {
    std::size_t start = 0;
    while (true) {
        const auto nl = buffer.find('\n', start);
        if (nl == std::string::npos) {
            break;
        }
        std::string line = buffer.substr(start, nl - start);
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (!on_line || !on_line(line)) {
            sink += line;
            sink += '\n';
        }
        start = nl + 1;
    }
    buffer.erase(0, start);
    if (eof && !buffer.empty()) {
        if (!on_line || !on_line(buffer)) {
            sink += buffer;
        }
        buffer.clear();
    }
}

} // namespace

Result<ProcessOutcome, std::string> run_process(const std::vector<std::string>& argv,
                                                const LineCallback& on_line) {
    if (argv.empty()) {
        return Err<ProcessOutcome>(std::string("Empty command line"));
    }

    Pipe out;
    Pipe err;
    if (!out.open() || !err.open()) {
        return Err<ProcessOutcome>(std::string("pipe() failed: ") + std::strerror(errno));
    }

    posix_spawn_file_actions_t actions;
    posix_spawn_file_actions_init(&actions);
    posix_spawn_file_actions_adddup2(&actions, out.write_fd, STDOUT_FILENO);
    posix_spawn_file_actions_adddup2(&actions, err.write_fd, STDERR_FILENO);
    posix_spawn_file_actions_addopen(&actions, STDIN_FILENO, "/dev/null", O_RDONLY, 0);

    std::vector<char*> args;
    args.reserve(argv.size() + 1);
    for (const auto& arg : argv) {
        args.push_back(const_cast<char*>(arg.c_str()));
    }
    args.push_back(nullptr);

    pid_t pid = 0;
    const int rc = posix_spawnp(&pid, argv.front().c_str(), &actions, nullptr, args.data(), environ);
    posix_spawn_file_actions_destroy(&actions);
    if (rc != 0) {
        return Err<ProcessOutcome>("Failed to start " + argv.front() + ": " + std::strerror(rc));
    }
    spdlog::debug("Spawned {} (pid {})", argv.front(), pid);

    out.close_write();
    err.close_write();

    ProcessOutcome outcome;
    std::string out_buffer;
    std::string err_buffer;
    pollfd fds[2] = {{out.read_fd, POLLIN, 0}, {err.read_fd, POLLIN, 0}};
    int open_streams = 2;
    char chunk[4096];

    while (open_streams > 0) {
        if (::poll(fds, 2, -1) < 0) {
            if (errno == EINTR) continue;
            break;
        }
        for (int i = 0; i < 2; ++i) {
            if (fds[i].fd < 0 || (fds[i].revents & (POLLIN | POLLHUP | POLLERR)) == 0) {
                continue;
            }
            const ssize_t n = ::read(fds[i].fd, chunk, sizeof(chunk));
            if (n > 0) {
                if (i == 0) {
                    out_buffer.append(chunk, static_cast<std::size_t>(n));
                    flush_lines(out_buffer, outcome.stdout_text, on_line, false);
                } else {
                    err_buffer.append(chunk, static_cast<std::size_t>(n));
                }
            } else if (n == 0 || errno != EINTR) {
                fds[i].fd = -1;
                --open_streams;
            }
        }
    }
    flush_lines(out_buffer, outcome.stdout_text, on_line, true);
    outcome.stderr_text = std::move(err_buffer);

    int status = 0;
    while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {
    }
    if (WIFEXITED(status)) {
        outcome.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        outcome.exit_code = 128 + WTERMSIG(status);
    }
    return Result<ProcessOutcome, std::string>(OkValue<ProcessOutcome>(std::move(outcome)));
}

} // namespace relay::media
