//
// Created by gregorian-rayne on 2/5/26.
//

#include "pinch/resolve/process.hpp"

#include <array>
#include <chrono>
#include <cerrno>

#ifndef _WIN32
#include <fcntl.h>
#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>
#endif

namespace pinch::process {

#ifdef _WIN32
    Result<CommandResult, Error> run_command(const std::string& command, const fs::path&) {
        return Result<CommandResult, Error>::failure(
            Error::io_error("Subprocess execution is not supported on this platform", command)
        );
    }
#else
    namespace {

        /**
         * Owns both ends of a pipe; closes whatever is still open.
         */
        struct Pipe {
            int read_end = -1;
            int write_end = -1;

            Pipe() = default;
            Pipe(const Pipe&) = delete;
            Pipe& operator=(const Pipe&) = delete;

            ~Pipe() {
                close_read();
                close_write();
            }

            /**
             * Both ends are close-on-exec so a child forked by another
             * resolver thread cannot hold our write end open. dup2 in the
             * child clears the flag on the copies it keeps.
             */
            bool open() {
                int fds[2];
#ifdef __linux__
                if (::pipe2(fds, O_CLOEXEC) != 0) {
                    return false;
                }
#else
                if (::pipe(fds) != 0) {
                    return false;
                }
                ::fcntl(fds[0], F_SETFD, FD_CLOEXEC);
                ::fcntl(fds[1], F_SETFD, FD_CLOEXEC);
#endif
                read_end = fds[0];
                write_end = fds[1];
                return true;
            }

            void close_read() {
                if (read_end >= 0) {
                    ::close(read_end);
                    read_end = -1;
                }
            }

            void close_write() {
                if (write_end >= 0) {
                    ::close(write_end);
                    write_end = -1;
                }
            }
        };

        [[noreturn]] void exec_child(const std::string& command, const fs::path& working_dir,
                                     Pipe& out, Pipe& err) {
            ::dup2(out.write_end, STDOUT_FILENO);
            ::dup2(err.write_end, STDERR_FILENO);
            out.close_read();
            out.close_write();
            err.close_read();
            err.close_write();

            if (!working_dir.empty() && ::chdir(working_dir.c_str()) != 0) {
                ::_exit(127);
            }
            ::execl("/bin/sh", "sh", "-c", command.c_str(), static_cast<char*>(nullptr));
            ::_exit(127);
        }

        /**
         * Reads both pipes until each reports end of file.
         */
        void collect(Pipe& out, Pipe& err, CommandResult& result) {
            std::array<char, 4096> buffer{};
            std::array<pollfd, 2> fds = {{
                {out.read_end, POLLIN, 0},
                {err.read_end, POLLIN, 0}
            }};
            std::array<std::string*, 2> sinks = {&result.stdout_output, &result.stderr_output};

            std::size_t open_streams = fds.size();
            while (open_streams > 0) {
                if (::poll(fds.data(), fds.size(), -1) < 0) {
                    if (errno == EINTR) {
                        continue;
                    }
                    return;
                }
                for (std::size_t i = 0; i < fds.size(); ++i) {
                    if (fds[i].fd < 0 || fds[i].revents == 0) {
                        continue;
                    }
                    const ssize_t n = ::read(fds[i].fd, buffer.data(), buffer.size());
                    if (n > 0) {
                        sinks[i]->append(buffer.data(), static_cast<std::size_t>(n));
                    } else if (n == 0 || errno != EINTR) {
                        fds[i].fd = -1;
                        --open_streams;
                    }
                }
            }
        }

    }  // namespace

    Result<CommandResult, Error> run_command(const std::string& command, const fs::path& working_dir) {
        const auto started = std::chrono::steady_clock::now();

        Pipe out;
        Pipe err;
        if (!out.open() || !err.open()) {
            return Result<CommandResult, Error>::failure(
                Error::io_error("Failed to create pipe", command)
            );
        }

        const pid_t pid = ::fork();
        if (pid < 0) {
            return Result<CommandResult, Error>::failure(
                Error::io_error("Failed to fork", command)
            );
        }
        if (pid == 0) {
            exec_child(command, working_dir, out, err);
        }

        out.close_write();
        err.close_write();

        CommandResult result;
        collect(out, err, result);

        int status = 0;
        pid_t waited;
        do {
            waited = ::waitpid(pid, &status, 0);
        } while (waited < 0 && errno == EINTR);

        if (waited < 0) {
            result.exit_code = -1;
        } else if (WIFEXITED(status)) {
            result.exit_code = WEXITSTATUS(status);
        } else if (WIFSIGNALED(status)) {
            result.exit_code = -WTERMSIG(status);
        }

        result.execution_time = std::chrono::duration_cast<Duration>(std::chrono::steady_clock::now() - started);
        return Result<CommandResult, Error>::success(std::move(result));
    }
#endif

}  // namespace pinch::process
