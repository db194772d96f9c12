#include "ProcessUtils.hpp"
#include <cerrno>
#include <cstring>
#include <stdexcept>
#include <string>
#include <system_error>
#include <vector>
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace ProcessUtils {

namespace {

class Pipe {
public:
    Pipe() {
        if (::pipe2(fds_, O_CLOEXEC) != 0) {
            throw std::system_error(errno, std::generic_category(), "pipe2");
        }
    }

    ~Pipe() {
        close_read();
        close_write();
    }

    Pipe(const Pipe&) = delete;
    Pipe& operator=(const Pipe&) = delete;

    int read_end() const { return fds_[0]; }
    int write_end() const { return fds_[1]; }

    void close_read() {
        if (fds_[0] >= 0) {
            ::close(fds_[0]);
            fds_[0] = -1;
        }
    }

    void close_write() {
        if (fds_[1] >= 0) {
            ::close(fds_[1]);
            fds_[1] = -1;
        }
    }

private:
    int fds_[2] = {-1, -1};
};

int decode_status(int status) {
    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    if (WIFSIGNALED(status)) {
        return 128 + WTERMSIG(status);
    }
    return -1;
}

// Only async-signal-safe calls: the child of a threaded parent must not allocate
void write_stderr(const char* text) {
    size_t left = std::strlen(text);
    while (left > 0) {
        const ssize_t written = ::write(STDERR_FILENO, text, left);
        if (written <= 0) return;
        text += written;
        left -= static_cast<size_t>(written);
    }
}

void report_exec_failure(const char* program, int error) {
    char digits[16];
    size_t pos = sizeof(digits);
    digits[--pos] = '\0';
    unsigned int value = error > 0 ? static_cast<unsigned int>(error) : 0u;
    do {
        digits[--pos] = static_cast<char>('0' + value % 10);
        value /= 10;
    } while (value != 0 && pos > 0);

    write_stderr("exec ");
    write_stderr(program);
    write_stderr(" failed: errno ");
    write_stderr(digits + pos);
    write_stderr(error == ENOENT ? " (no such file or directory)\n" : "\n");
}

pid_t spawn(const std::vector<std::string>& args, Pipe& out, Pipe& err) {
    if (args.empty()) {
        throw std::invalid_argument("Cannot run an empty command");
    }

    std::vector<char*> argv;
    argv.reserve(args.size() + 1);
    for (const auto& arg : args) {
        argv.push_back(const_cast<char*>(arg.c_str()));
    }
    argv.push_back(nullptr);

    const pid_t pid = ::fork();
    if (pid < 0) {
        throw std::system_error(errno, std::generic_category(), "fork");
    }

    if (pid == 0) {
        ::setpgid(0, 0);
        ::signal(SIGINT, SIG_DFL);
        ::signal(SIGTERM, SIG_DFL);

        const int devnull = ::open("/dev/null", O_RDONLY);
        if (devnull >= 0) {
            ::dup2(devnull, STDIN_FILENO);
            ::close(devnull);
        }
        ::dup2(out.write_end(), STDOUT_FILENO);
        ::dup2(err.write_end(), STDERR_FILENO);

        ::execvp(argv[0], argv.data());
        report_exec_failure(argv[0], errno);
        ::_exit(127);
    }

    out.close_write();
    err.close_write();
    return pid;
}

// Reads both pipes until EOF, then reaps the child
int pump(pid_t pid, Pipe& out, Pipe& err, const OutputCallback& on_stdout, const OutputCallback& on_stderr) {
    pollfd fds[2] = {
        {out.read_end(), POLLIN, 0},
        {err.read_end(), POLLIN, 0},
    };
    int open_streams = 2;
    char buffer[4096];

    while (open_streams > 0) {
        const int ready = ::poll(fds, 2, -1);
        if (ready < 0) {
            if (errno == EINTR) continue;
            throw std::system_error(errno, std::generic_category(), "poll");
        }

        for (int i = 0; i < 2; ++i) {
            if (fds[i].fd < 0 || fds[i].revents == 0) continue;

            const ssize_t n = ::read(fds[i].fd, buffer, sizeof(buffer));
            if (n < 0 && errno == EINTR) continue;
            if (n <= 0) {
                fds[i].fd = -1;
                --open_streams;
                continue;
            }

            const auto& callback = (i == 0) ? on_stdout : on_stderr;
            if (callback) {
                callback(std::string(buffer, static_cast<size_t>(n)));
            }
        }
    }

    int status = 0;
    while (::waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            throw std::system_error(errno, std::generic_category(), "waitpid");
        }
    }
    return decode_status(status);
}

}

ProcessResult run(const std::vector<std::string>& args) {
    ProcessResult result;
    result.exit_code = run_streaming(
        args,
        [&result](const std::string& chunk) { result.stdout_text += chunk; },
        [&result](const std::string& chunk) { result.stderr_text += chunk; });
    return result;
}

int run_streaming(const std::vector<std::string>& args,
                  const OutputCallback& on_stdout,
                  const OutputCallback& on_stderr) {
    Pipe out;
    Pipe err;
    const pid_t pid = spawn(args, out, err);
    return pump(pid, out, err, on_stdout, on_stderr);
}

std::string describe(const std::vector<std::string>& args) {
    std::string text;
    for (const auto& arg : args) {
        if (!text.empty()) text += ' ';
        if (arg.empty() || arg.find_first_of(" \t\n'\"") != std::string::npos) {
            text += '\'' + arg + '\'';
        } else {
            text += arg;
        }
    }
    return text;
}

} // namespace ProcessUtils
