#include <cerrno>
#include <cstring>
#include <exception>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <spawn.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include "wiredive/core/codec/process.hpp"

extern char** environ;


namespace wiredive::core::codec {

namespace {

// Closes on scope exit unless released
class Fd {
public:
    Fd() noexcept = default;
    explicit Fd(int fd) noexcept : fd_(fd) {}
    ~Fd() { reset(); }

    Fd(const Fd&) = delete;
    Fd& operator=(const Fd&) = delete;

    [[nodiscard]] int get() const noexcept { return fd_; }
    [[nodiscard]] bool valid() const noexcept { return fd_ >= 0; }

    void reset(int fd = -1) noexcept {
        if (fd_ >= 0) {
            ::close(fd_);
        }
        fd_ = fd;
    }

private:
    int fd_ = -1;
};

[[nodiscard]]
bool make_pipe(Fd& read_end, Fd& write_end) noexcept {
    int fds[2];
    if (::pipe2(fds, O_CLOEXEC) != 0) {
        return false;
    }
    read_end.reset(fds[0]);
    write_end.reset(fds[1]);
    return true;
}

// Reads what is available; returns false on EOF or error
[[nodiscard]]
bool drain(Fd& fd, std::string& sink) {
    char buf[16 * 1024];
    const ssize_t n = ::read(fd.get(), buf, sizeof(buf));
    if (n > 0) {
        sink.append(buf, static_cast<std::size_t>(n));
        return true;
    }
    if (n < 0 && (errno == EINTR || errno == EAGAIN)) {
        return true;
    }
    return false;
}

} // namespace


Error run_process(const std::vector<std::string>& argv,
                  std::string_view input,
                  ProcessResult& result,
                  std::chrono::milliseconds timeout) noexcept
{
    result = ProcessResult{};
    if (argv.empty() || argv.front().empty()) {
        return Error::InvalidInput;
    }

    try {
        Fd in_r, in_w, out_r, out_w, err_r, err_w;
        if (!make_pipe(in_r, in_w) || !make_pipe(out_r, out_w) || !make_pipe(err_r, err_w)) {
            return Error::SpawnFailed;
        }

        posix_spawn_file_actions_t actions;
        if (::posix_spawn_file_actions_init(&actions) != 0) {
            return Error::SpawnFailed;
        }
        ::posix_spawn_file_actions_adddup2(&actions, in_r.get(), STDIN_FILENO);
        ::posix_spawn_file_actions_adddup2(&actions, out_w.get(), STDOUT_FILENO);
        ::posix_spawn_file_actions_adddup2(&actions, err_w.get(), STDERR_FILENO);

        std::vector<char*> args;
        args.reserve(argv.size() + 1);
        for (const auto& a : argv) {
            args.push_back(const_cast<char*>(a.c_str()));
        }
        args.push_back(nullptr);

        pid_t pid = -1;
        const int rc = ::posix_spawnp(&pid, args[0], &actions, nullptr, args.data(), environ);
        ::posix_spawn_file_actions_destroy(&actions);
        if (rc != 0) {
            return Error::SpawnFailed;
        }

        // Parent keeps only its ends
        in_r.reset();
        out_w.reset();
        err_w.reset();

        ::fcntl(in_w.get(), F_SETFL, ::fcntl(in_w.get(), F_GETFL) | O_NONBLOCK);

        std::size_t written = 0;
        if (input.empty()) {
            in_w.reset();
        }

        const auto deadline = std::chrono::steady_clock::now() + timeout;
        bool io_error = false;

        while (out_r.valid() || err_r.valid()) {
            const auto now = std::chrono::steady_clock::now();
            if (now >= deadline) {
                result.timed_out = true;
                ::kill(pid, SIGKILL);
                break;
            }
            const int wait_ms = static_cast<int>(
                std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now).count());

            pollfd fds[3];
            nfds_t n = 0;
            int in_idx = -1, out_idx = -1, err_idx = -1;
            if (in_w.valid())  { in_idx  = static_cast<int>(n); fds[n++] = pollfd{in_w.get(),  POLLOUT, 0}; }
            if (out_r.valid()) { out_idx = static_cast<int>(n); fds[n++] = pollfd{out_r.get(), POLLIN,  0}; }
            if (err_r.valid()) { err_idx = static_cast<int>(n); fds[n++] = pollfd{err_r.get(), POLLIN,  0}; }

            const int ready = ::poll(fds, n, wait_ms);
            if (ready < 0) {
                if (errno == EINTR) {
                    continue;
                }
                io_error = true;
                ::kill(pid, SIGKILL);
                break;
            }

            if (in_idx >= 0 && fds[in_idx].revents != 0) {
                if (fds[in_idx].revents & (POLLERR | POLLHUP)) {
                    in_w.reset(); // child stopped reading
                } else {
                    const ssize_t w = ::write(in_w.get(), input.data() + written, input.size() - written);
                    if (w > 0) {
                        written += static_cast<std::size_t>(w);
                        if (written == input.size()) {
                            in_w.reset();
                        }
                    } else if (w < 0 && errno != EAGAIN && errno != EINTR) {
                        in_w.reset();
                    }
                }
            }
            if (out_idx >= 0 && fds[out_idx].revents != 0) {
                if (!drain(out_r, result.out)) {
                    out_r.reset();
                }
            }
            if (err_idx >= 0 && fds[err_idx].revents != 0) {
                if (!drain(err_r, result.err)) {
                    err_r.reset();
                }
            }
        }

        int status = 0;
        while (::waitpid(pid, &status, 0) < 0) {
            if (errno != EINTR) {
                return Error::IoError;
            }
        }

        if (WIFSIGNALED(status)) {
            result.signalled = true;
            return Error::ProcessFailed;
        }
        result.exit_status = WEXITSTATUS(status);
        if (io_error) {
            return Error::IoError;
        }
        if (result.timed_out || result.exit_status != 0) {
            return Error::ProcessFailed;
        }
        return Error::None;
    }
    catch (const std::exception&) {
        return Error::IoError;
    }
}

} // namespace wiredive::core::codec
