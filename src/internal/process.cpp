#include "internal/process.hpp"

#include "quarry/format.hpp"

#include <fcntl.h>
#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <stdexcept>

using namespace quarry::literals;

namespace quarry::internal::process {

    namespace detail {

        // stop requests are observed at this granularity
        inline constexpr int poll_slice_ms = 50;

        static void close_pair(int (&fds)[2]) {
            for (auto& fd : fds) {
                if (fd >= 0) {
                    ::close(fd);
                    fd = -1;
                }
            }
        }

        [[noreturn]] static void exec_child(const std::vector<std::string>& args, int stdout_fd, int stderr_fd) {
            ::setpgid(0, 0);

            if (auto null_fd = ::open("/dev/null", O_RDONLY); null_fd >= 0) {
                ::dup2(null_fd, STDIN_FILENO);
                ::close(null_fd);
            }
            ::dup2(stdout_fd, STDOUT_FILENO);
            ::dup2(stderr_fd, STDERR_FILENO);
            ::close(stdout_fd);
            ::close(stderr_fd);

            std::vector<char*> argv{};
            argv.reserve(args.size() + 1);
            for (const auto& arg : args) {
                argv.push_back(const_cast<char*>(arg.c_str()));
            }
            argv.push_back(nullptr);
            ::execvp(argv[0], argv.data());
            _exit(127);
        }

        static int decode_wait_status(int status) {
            if (WIFEXITED(status)) {
                return WEXITSTATUS(status);
            }
            if (WIFSIGNALED(status)) {
                return 128 + WTERMSIG(status);
            }
            return 1;
        }

    }  // namespace detail

    subprocess_result run_subprocess(
            const std::vector<std::string>& args,
            std::optional<std::chrono::milliseconds> timeout,
            std::stop_token stop) {
        if (args.empty() || args.front().empty()) {
            throw std::runtime_error("run_subprocess: empty command");
        }

        int stdout_pipe[2]{-1, -1};
        int stderr_pipe[2]{-1, -1};
        if (::pipe(stdout_pipe) != 0) {
            throw std::runtime_error("pipe() failed: {}"_format(std::strerror(errno)));
        }
        if (::pipe(stderr_pipe) != 0) {
            auto err = errno;
            detail::close_pair(stdout_pipe);
            throw std::runtime_error("pipe() failed: {}"_format(std::strerror(err)));
        }

        auto pid = ::fork();
        if (pid < 0) {
            auto err = errno;
            detail::close_pair(stdout_pipe);
            detail::close_pair(stderr_pipe);
            throw std::runtime_error("fork() failed: {}"_format(std::strerror(err)));
        }

        if (pid == 0) {
            ::close(stdout_pipe[0]);
            ::close(stderr_pipe[0]);
            detail::exec_child(args, stdout_pipe[1], stderr_pipe[1]);
        }

        // parent; set the group here too so a kill issued before the child runs still lands
        ::setpgid(pid, pid);
        ::close(stdout_pipe[1]);
        ::close(stderr_pipe[1]);

        subprocess_result result{};
        int fds_open = 2;

        pollfd fds[2]{};
        fds[0] = {.fd = stdout_pipe[0], .events = POLLIN, .revents = 0};
        fds[1] = {.fd = stderr_pipe[0], .events = POLLIN, .revents = 0};

        std::optional<std::chrono::steady_clock::time_point> deadline{};
        if (timeout) {
            deadline = std::chrono::steady_clock::now() + *timeout;
        }

        while (fds_open > 0) {
            if (stop.stop_requested()) {
                result.cancelled = true;
                break;
            }

            int wait_ms = detail::poll_slice_ms;
            if (deadline) {
                auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
                                         *deadline - std::chrono::steady_clock::now())
                                         .count();
                if (remaining <= 0) {
                    result.timed_out = true;
                    break;
                }
                wait_ms = static_cast<int>(std::min<long long>(remaining, detail::poll_slice_ms));
            }

            int ret = ::poll(fds, 2, wait_ms);
            if (ret < 0) {
                if (errno == EINTR) {
                    continue;
                }
                break;
            }
            if (ret == 0) {
                continue;
            }

            char chunk[4096]{};
            for (int i = 0; i < 2; ++i) {
                if (fds[i].fd < 0) {
                    continue;
                }
                if ((fds[i].revents & (POLLIN | POLLHUP | POLLERR)) != 0) {
                    auto n = ::read(fds[i].fd, chunk, sizeof(chunk));
                    if (n > 0) {
                        (i == 0 ? result.stdout_output : result.stderr_output).append(chunk, static_cast<size_t>(n));
                    }
                    else if (n == 0 || errno != EINTR) {
                        ::close(fds[i].fd);
                        fds[i].fd = -1;
                        --fds_open;
                    }
                }
            }
        }

        for (auto& entry : fds) {
            if (entry.fd >= 0) {
                ::close(entry.fd);
            }
        }

        int status = 0;
        bool reaped = false;
        bool reap_failed = false;

        // a child may close its output and keep running; the deadline and stop token still apply
        while (!result.timed_out && !result.cancelled) {
            auto ret = ::waitpid(pid, &status, WNOHANG);
            if (ret == pid) {
                reaped = true;
                break;
            }
            if (ret < 0) {
                if (errno == EINTR) {
                    continue;
                }
                reap_failed = true;
                break;
            }
            if (stop.stop_requested()) {
                result.cancelled = true;
                break;
            }
            if (deadline && std::chrono::steady_clock::now() >= *deadline) {
                result.timed_out = true;
                break;
            }
            ::poll(nullptr, 0, detail::poll_slice_ms);
        }

        if (result.timed_out || result.cancelled) {
            ::kill(-pid, SIGKILL);
            ::kill(pid, SIGKILL);
        }

        if (!reaped && !reap_failed) {
            while (::waitpid(pid, &status, 0) < 0) {
                if (errno != EINTR) {
                    reap_failed = true;
                    break;
                }
            }
        }
        reaped = !reap_failed;

        if (result.timed_out || result.cancelled) {
            result.exit_code = 128 + SIGKILL;
            return result;
        }

        result.exit_code = reaped ? detail::decode_wait_status(status) : 1;
        return result;
    }

}  // namespace quarry::internal::process
