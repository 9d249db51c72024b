#include "subprocess.hpp"
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <format>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace cmdrun {

namespace {

// Owned file descriptor, closed on scope exit
class Fd {
public:
    Fd() = default;
    ~Fd() { reset(); }

    Fd(const Fd&) = delete;
    Fd& operator=(const Fd&) = delete;

    [[nodiscard]] int get() const { return fd_; }

    void reset(const int fd = -1) {
        if (fd_ >= 0) {
            close(fd_);
        }
        fd_ = fd;
    }

private:
    int fd_ = -1;
};

struct Pipe {
    Fd read_end;
    Fd write_end;
};

void open_pipe(Pipe& p, const std::string& program) {
    int fds[2];
    if (pipe2(fds, O_CLOEXEC) < 0) {
        throw SpawnError(program, errno);
    }
    p.read_end.reset(fds[0]);
    p.write_end.reset(fds[1]);
}

ExitStatus decode_wait_status(const int status) {
    ExitStatus result;
    if (WIFEXITED(status)) {
        result.exited = true;
        result.code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        result.exited = false;
        result.signal = WTERMSIG(status);
        result.core_dumped = WCOREDUMP(status);
    }
    return result;
}

int wait_for(const pid_t pid) {
    int status = 0;
    while (waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            return -1;
        }
    }
    return status;
}

// Read until EOF, retrying on EINTR. Returns false on a read error.
bool read_all(const int fd, std::string& out) {
    char buffer[4096];
    while (true) {
        const ssize_t n = read(fd, buffer, sizeof(buffer));
        if (n > 0) {
            out.append(buffer, static_cast<size_t>(n));
        } else if (n == 0) {
            return true;
        } else if (errno != EINTR) {
            return false;
        }
    }
}

// Fork and exec argv. When capture_fd is set the child's stdout goes there
// and stdin comes from /dev/null. Returns the child pid after exec succeeded.
pid_t spawn(const std::vector<std::string>& argv, const int capture_fd) {
    const std::string& program = argv.front();

    // Build argv array before forking
    std::vector<char*> cargv;
    cargv.reserve(argv.size() + 1);
    for (const auto& s : argv) cargv.push_back(const_cast<char*>(s.c_str()));
    cargv.push_back(nullptr);

    Pipe status_pipe;
    open_pipe(status_pipe, program);

    const pid_t pid = fork();
    if (pid < 0) {
        throw SpawnError(program, errno);
    }

    if (pid == 0) {
        // Child: only async-signal-safe calls from here on
        if (capture_fd >= 0) {
            const int null_fd = open("/dev/null", O_RDONLY);
            if (null_fd >= 0) {
                dup2(null_fd, STDIN_FILENO);
                close(null_fd);
            }
            dup2(capture_fd, STDOUT_FILENO);
        }
        execvp(cargv[0], cargv.data());

        const int err = errno;
        [[maybe_unused]] const ssize_t written = write(status_pipe.write_end.get(), &err, sizeof(err));
        _exit(127);
    }

    status_pipe.write_end.reset();

    int child_errno = 0;
    ssize_t n;
    do {
        n = read(status_pipe.read_end.get(), &child_errno, sizeof(child_errno));
    } while (n < 0 && errno == EINTR);

    if (n == static_cast<ssize_t>(sizeof(child_errno))) {
        // exec failed; reap the child before reporting
        wait_for(pid);
        throw SpawnError(program, child_errno);
    }
    return pid;
}

} // namespace

SpawnError::SpawnError(const std::string& program, const int os_error)
    : Error(ErrorKind::ProcessSpawn,
            std::format("could not run '{}': {}", program, std::strerror(os_error)),
            std::format("could not run '{}'\n{} (os error {})", program, std::strerror(os_error), os_error))
    , os_error_(os_error) {}

ExitStatus run_subprocess(const std::vector<std::string>& argv) {
    if (argv.empty() || argv.front().empty()) {
        throw SpawnError(argv.empty() ? std::string() : argv.front(), ENOENT);
    }

    const pid_t pid = spawn(argv, -1);
    const int status = wait_for(pid);
    if (status < 0) {
        throw SpawnError(argv.front(), errno);
    }
    return decode_wait_status(status);
}

CapturedOutput run_subprocess_capture(const std::vector<std::string>& argv) {
    if (argv.empty() || argv.front().empty()) {
        throw SpawnError(argv.empty() ? std::string() : argv.front(), ENOENT);
    }

    Pipe out_pipe;
    open_pipe(out_pipe, argv.front());

    const pid_t pid = spawn(argv, out_pipe.write_end.get());
    out_pipe.write_end.reset();

    CapturedOutput result;
    const bool read_ok = read_all(out_pipe.read_end.get(), result.out);
    const int read_errno = errno;

    const int status = wait_for(pid);
    if (status < 0) {
        throw SpawnError(argv.front(), errno);
    }
    if (!read_ok) {
        throw SpawnError(argv.front(), read_errno);
    }
    result.status = decode_wait_status(status);
    return result;
}

} // namespace cmdrun
