#ifndef _WIN32
#include "./proc.hpp"

#include <gitsvc/util/log.hpp>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

#include <array>
#include <cerrno>
#include <cstring>
#include <string>
#include <system_error>

using namespace gitsvc;

namespace {

void check_rc(bool b, std::string_view s) {
    if (!b) {
        throw std::system_error(std::error_code(errno, std::system_category()), std::string(s));
    }
}

/// A pipe whose ends are closed when it goes out of scope
struct pipe_pair {
    int read_end  = -1;
    int write_end = -1;

    pipe_pair() {
        int fds[2] = {};
        // None of our pipes may leak into a concurrently spawned child
        auto rc = ::pipe2(fds, O_CLOEXEC);
        check_rc(rc == 0, "Create pipe for subprocess");
        read_end  = fds[0];
        write_end = fds[1];
    }

    pipe_pair(const pipe_pair&) = delete;

    ~pipe_pair() {
        close_read();
        close_write();
    }

    void close_read() noexcept {
        if (read_end != -1) {
            ::close(read_end);
            read_end = -1;
        }
    }

    void close_write() noexcept {
        if (write_end != -1) {
            ::close(write_end);
            write_end = -1;
        }
    }
};

/// What the child reports through the exec-status pipe if it cannot become the requested program
struct child_failure {
    enum stage_t : int { chdir_failed, exec_failed, redirect_failed } stage;
    int error;
};

[[noreturn]] void child_fail(int status_fd, child_failure::stage_t stage) noexcept {
    child_failure f{stage, errno};
    auto          nwritten = ::write(status_fd, &f, sizeof f);
    (void)nwritten;
    ::_exit(127);
}

::pid_t spawn_child(const proc_options& opts,
                    pipe_pair&          stdout_pipe,
                    pipe_pair&          stderr_pipe,
                    pipe_pair&          status_pipe) {
    // We must allocate BEFORE fork(), since the CRT might stumble with malloc()-related locks that
    // are held during the fork().
    std::vector<const char*> strings;
    strings.reserve(opts.command.size() + 1);
    for (auto& s : opts.command) {
        strings.push_back(s.data());
    }
    strings.push_back(nullptr);

    std::string workdir = opts.cwd ? opts.cwd->string() : std::string();

    auto child_pid = ::fork();
    check_rc(child_pid != -1, "Failed to fork() a subprocess");
    if (child_pid != 0) {
        return child_pid;
    }

    // We are child. Only async-signal-safe calls from here on.
    const int status_fd = status_pipe.write_end;
    if (::dup2(stdout_pipe.write_end, STDOUT_FILENO) == -1
        || ::dup2(stderr_pipe.write_end, STDERR_FILENO) == -1) {
        child_fail(status_fd, child_failure::redirect_failed);
    }
    auto devnull = ::open("/dev/null", O_RDONLY);
    if (devnull == -1 || ::dup2(devnull, STDIN_FILENO) == -1) {
        child_fail(status_fd, child_failure::redirect_failed);
    }
    if (!workdir.empty() && ::chdir(workdir.data()) == -1) {
        child_fail(status_fd, child_failure::chdir_failed);
    }

    ::execvp(strings[0], (char* const*)strings.data());
    child_fail(status_fd, child_failure::exec_failed);
}

void append_from(int fd, std::string& out, bool& eof) {
    std::array<char, 1024> buffer;
    auto                   nread = ::read(fd, buffer.data(), buffer.size());
    if (nread == -1 && errno == EINTR) {
        return;
    }
    check_rc(nread >= 0, "Failed in read()");
    if (nread == 0) {
        eof = true;
        return;
    }
    out.append(buffer.data(), static_cast<std::size_t>(nread));
}

}  // namespace

proc_result gitsvc::run_proc(const proc_options& opts) {
    gitsvc_log(debug, "Spawning subprocess: {}", quote_command(opts.command));
    if (opts.command.empty()) {
        throw std::system_error(std::make_error_code(std::errc::invalid_argument),
                                "Cannot spawn a subprocess with an empty command line");
    }

    pipe_pair stdout_pipe;
    pipe_pair stderr_pipe;
    pipe_pair status_pipe;

    auto child = spawn_child(opts, stdout_pipe, stderr_pipe, status_pipe);

    stdout_pipe.close_write();
    stderr_pipe.close_write();
    status_pipe.close_write();

    // The status pipe is closed-on-exec: Reading EOF means the child has become the program.
    child_failure failure{};
    ssize_t       nstatus = 0;
    do {
        nstatus = ::read(status_pipe.read_end, &failure, sizeof failure);
    } while (nstatus == -1 && errno == EINTR);
    if (nstatus == static_cast<ssize_t>(sizeof failure)) {
        int status = 0;
        ::waitpid(child, &status, 0);
        auto ec = std::error_code(failure.error, std::system_category());
        switch (failure.stage) {
        case child_failure::chdir_failed:
            throw std::system_error(ec,
                                    "Failed to enter working directory ["
                                        + (opts.cwd ? opts.cwd->string() : std::string()) + "]");
        case child_failure::redirect_failed:
            throw std::system_error(ec, "Failed to redirect stdio for subprocess");
        case child_failure::exec_failed:
            break;
        }
        throw std::system_error(ec, "Failed to execute [" + opts.command.front() + "]");
    }

    proc_result res;

    std::array<pollfd, 2> fds;
    fds[0].fd     = stdout_pipe.read_end;
    fds[0].events = POLLIN;
    fds[1].fd     = stderr_pipe.read_end;
    fds[1].events = POLLIN;

    bool stdout_eof = false;
    bool stderr_eof = false;

    using namespace std::chrono_literals;
    auto timeout = -1ms;
    if (opts.timeout) {
        timeout = *opts.timeout;
    }
    while (!stdout_eof || !stderr_eof) {
        // A negative fd is ignored by poll()
        fds[0].fd = stdout_eof ? -1 : stdout_pipe.read_end;
        fds[1].fd = stderr_eof ? -1 : stderr_pipe.read_end;
        auto rc   = ::poll(fds.data(), fds.size(), static_cast<int>(timeout.count()));
        if (rc == -1 && errno == EINTR) {
            errno = 0;
            continue;
        }
        check_rc(rc != -1, "Failed in poll()");
        if (rc == 0) {
            // Timeout!
            ::kill(child, SIGINT);
            timeout       = -1ms;
            res.timed_out = true;
            gitsvc_log(debug, "Subprocess [{}] timed out", quote_command(opts.command));
            continue;
        }
        if (fds[0].revents & (POLLIN | POLLHUP | POLLERR)) {
            append_from(stdout_pipe.read_end, res.stdout_output, stdout_eof);
        }
        if (fds[1].revents & (POLLIN | POLLHUP | POLLERR)) {
            append_from(stderr_pipe.read_end, res.stderr_output, stderr_eof);
        }
    }

    int status = 0;
    int rc     = 0;
    do {
        rc = ::waitpid(child, &status, 0);
    } while (rc == -1 && errno == EINTR);
    check_rc(rc >= 0, "Failed in waitpid()");

    if (WIFEXITED(status)) {
        res.retc = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        res.signal = WTERMSIG(status);
    }

    gitsvc_log(trace,
               "Subprocess [{}] exited {} (signal {})",
               quote_command(opts.command),
               res.retc,
               res.signal);
    return res;
}

#endif  // _WIN32
