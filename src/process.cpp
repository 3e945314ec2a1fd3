#include "plotgate/process.hpp"

#include "plotgate/format.hpp"

#include "internal/platform.hpp"

extern "C" {
#include <fcntl.h>
#include <sys/wait.h>
#include <unistd.h>
}

#include <cerrno>
#include <cstring>
#include <string>

using namespace plotgate::literals;

namespace plotgate {

    namespace detail {

        static void close_fd(int& fd) {
            if (fd >= 0) {
                ::close(fd);
                fd = -1;
            }
        }

        static std::string errno_text(int err) {
            return std::string{std::strerror(err)};
        }

        // Reads until EOF; only the exec-status pipe and the output pipe use this
        static std::string read_all(int fd) {
            std::string buf{};
            char chunk[4096]{};
            for (;;) {
                auto n = ::read(fd, chunk, sizeof(chunk));
                if (n < 0) {
                    if (errno == EINTR) {
                        continue;
                    }
                    break;
                }
                if (n == 0) {
                    break;
                }
                buf.append(chunk, static_cast<size_t>(n));
            }
            return buf;
        }

        static int wait_exit_code(pid_t pid) {
            int status = 0;
            while (::waitpid(pid, &status, 0) < 0) {
                if (errno != EINTR) {
                    throw spawn_error("waitpid failed: {}"_format(errno_text(errno)));
                }
            }

            if (WIFEXITED(status)) {
                return WEXITSTATUS(status);
            }
            if (WIFSIGNALED(status)) {
                return 128 + WTERMSIG(status);
            }
            return 1;
        }

    }  // namespace detail

    shell_result run_shell(const std::string& command) {
        namespace platform = internal::platform;

        int output_pipe[2]{-1, -1};
        int status_pipe[2]{-1, -1};
        // O_CLOEXEC: shells forked by other threads must not inherit the write end
        if (::pipe2(output_pipe, O_CLOEXEC) != 0) {
            throw spawn_error("pipe() failed: {}"_format(detail::errno_text(errno)));
        }
        // closed by a successful exec; carries errno back when exec fails
        if (::pipe2(status_pipe, O_CLOEXEC) != 0) {
            auto err = errno;
            detail::close_fd(output_pipe[0]);
            detail::close_fd(output_pipe[1]);
            throw spawn_error("pipe() failed: {}"_format(detail::errno_text(err)));
        }

        std::string shell{platform::shell_path};
        std::string argv0{platform::shell_argv0};
        std::string flag{platform::shell_command_flag};

        auto pid = ::fork();
        if (pid < 0) {
            auto err = errno;
            detail::close_fd(output_pipe[0]);
            detail::close_fd(output_pipe[1]);
            detail::close_fd(status_pipe[0]);
            detail::close_fd(status_pipe[1]);
            throw spawn_error("fork failed: {}"_format(detail::errno_text(err)));
        }

        if (pid == 0) {
            ::close(output_pipe[0]);
            ::close(status_pipe[0]);
            if (::dup2(output_pipe[1], STDOUT_FILENO) < 0 || ::dup2(output_pipe[1], STDERR_FILENO) < 0) {
                _exit(127);
            }
            ::close(output_pipe[1]);

            char* argv[] = {argv0.data(), flag.data(), const_cast<char*>(command.c_str()), nullptr};
            ::execv(shell.c_str(), argv);

            int err = errno;
            [[maybe_unused]] auto written = ::write(status_pipe[1], &err, sizeof(err));
            _exit(127);
        }

        detail::close_fd(output_pipe[1]);
        detail::close_fd(status_pipe[1]);

        auto exec_status = detail::read_all(status_pipe[0]);
        detail::close_fd(status_pipe[0]);

        shell_result result{};
        result.output = detail::read_all(output_pipe[0]);
        detail::close_fd(output_pipe[0]);
        result.exit_code = detail::wait_exit_code(pid);

        if (exec_status.size() >= sizeof(int)) {
            int err = 0;
            std::memcpy(&err, exec_status.data(), sizeof(err));
            throw spawn_error("failed to execute shell {}: {}"_format(shell, detail::errno_text(err)));
        }

        return result;
    }

}  // namespace plotgate
