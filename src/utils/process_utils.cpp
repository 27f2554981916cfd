/**
 * @file process_utils.cpp
 * @brief posix_spawn based process execution with independent output pipes
 *
 * **Pipe Handling**:
 * ```
 * parent                      child
 *   stdout_pipe[0] <──────── stdout_pipe[1] (dup2 → STDOUT_FILENO)
 *   stderr_pipe[0] <──────── stderr_pipe[1] (dup2 → STDERR_FILENO)
 *                            /dev/null      (open → STDIN_FILENO)
 * ```
 * The parent polls both read ends until each reports EOF, then reaps the
 * child with waitpid.
 *
 * @date 2025
 */

#include "sandrun/utils/process_utils.hpp"

#include <spdlog/spdlog.h>

#include <array>
#include <cerrno>
#include <cstring>
#include <string>

#include <fcntl.h>
#include <poll.h>
#include <spawn.h>
#include <sys/wait.h>
#include <unistd.h>

extern char** environ;

namespace sandrun {
namespace utils {

namespace {

/**
 * @brief Owns one end of a pipe
 */
class FileDescriptor {
public:
    FileDescriptor() = default;
    explicit FileDescriptor(int fd) : fd_(fd) {}
    ~FileDescriptor() { Close(); }

    FileDescriptor(const FileDescriptor&) = delete;
    FileDescriptor& operator=(const FileDescriptor&) = delete;

    int Get() const { return fd_; }

    void Reset(int fd) {
        Close();
        fd_ = fd;
    }

    void Close() {
        if (fd_ >= 0) {
            ::close(fd_);
            fd_ = -1;
        }
    }

private:
    int fd_{-1};
};

struct Pipe {
    FileDescriptor read_end;
    FileDescriptor write_end;
};

std::string ErrnoMessage(const std::string& what, int err) {
    return what + ": " + std::strerror(err);
}

void OpenPipe(Pipe& p) {
    int fds[2];
    if (::pipe2(fds, O_CLOEXEC) == -1) {
        throw ProcessError(ErrnoMessage("pipe2 failed", errno));
    }
    p.read_end.Reset(fds[0]);
    p.write_end.Reset(fds[1]);
}

int DecodeWaitStatus(int status) {
    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    if (WIFSIGNALED(status)) {
        return 128 + WTERMSIG(status);
    }
    return -1;
}

int ReapChild(pid_t pid) {
    int status = 0;
    while (::waitpid(pid, &status, 0) == -1) {
        if (errno != EINTR) {
            throw ProcessError(ErrnoMessage("waitpid failed", errno));
        }
    }
    return DecodeWaitStatus(status);
}

/**
 * @brief RAII wrapper for posix_spawn_file_actions_t
 */
class SpawnActions {
public:
    SpawnActions() {
        int rc = ::posix_spawn_file_actions_init(&actions_);
        if (rc != 0) {
            throw ProcessError(ErrnoMessage("posix_spawn_file_actions_init failed", rc));
        }
    }
    ~SpawnActions() { ::posix_spawn_file_actions_destroy(&actions_); }

    void AddOpen(int fd, const char* path, int flags) {
        Check(::posix_spawn_file_actions_addopen(&actions_, fd, path, flags, 0), "addopen");
    }

    void AddDup2(int fd, int new_fd) {
        Check(::posix_spawn_file_actions_adddup2(&actions_, fd, new_fd), "adddup2");
    }

    SpawnActions(const SpawnActions&) = delete;
    SpawnActions& operator=(const SpawnActions&) = delete;

    posix_spawn_file_actions_t* Get() { return &actions_; }

private:
    posix_spawn_file_actions_t actions_;

    static void Check(int rc, const char* what) {
        if (rc != 0) {
            throw ProcessError(ErrnoMessage(std::string("posix_spawn_file_actions_") + what + " failed", rc));
        }
    }
};

} // anonymous namespace

// ============================================================================
// PROCESS EXECUTION
// ============================================================================

int RunProcess(const std::vector<std::string>& argv,
               const ChunkCallback& on_stdout,
               const ChunkCallback& on_stderr) {
    if (argv.empty()) {
        throw ProcessError("Empty command line");
    }

    Pipe out_pipe;
    Pipe err_pipe;
    OpenPipe(out_pipe);
    OpenPipe(err_pipe);

    SpawnActions actions;
    actions.AddOpen(STDIN_FILENO, "/dev/null", O_RDONLY);
    actions.AddDup2(out_pipe.write_end.Get(), STDOUT_FILENO);
    actions.AddDup2(err_pipe.write_end.Get(), STDERR_FILENO);

    std::vector<char*> c_argv;
    c_argv.reserve(argv.size() + 1);
    for (const auto& arg : argv) {
        c_argv.push_back(const_cast<char*>(arg.c_str()));
    }
    c_argv.push_back(nullptr);

    pid_t pid = -1;
    int rc = ::posix_spawnp(&pid, c_argv[0], actions.Get(), nullptr, c_argv.data(), environ);
    if (rc != 0) {
        throw ProcessError(ErrnoMessage("Failed to spawn " + argv[0], rc));
    }

    // Parent never writes
    out_pipe.write_end.Close();
    err_pipe.write_end.Close();

    std::array<char, 4096> buffer;
    std::array<pollfd, 2> fds{};
    fds[0].fd = out_pipe.read_end.Get();
    fds[0].events = POLLIN;
    fds[1].fd = err_pipe.read_end.Get();
    fds[1].events = POLLIN;

    std::string failure;
    int open_streams = 2;

    while (open_streams > 0 && failure.empty()) {
        int ready = ::poll(fds.data(), fds.size(), -1);
        if (ready == -1) {
            if (errno == EINTR) {
                continue;
            }
            failure = ErrnoMessage("poll failed", errno);
            break;
        }

        for (std::size_t i = 0; i < fds.size(); ++i) {
            if (fds[i].fd < 0 || fds[i].revents == 0) {
                continue;
            }

            ssize_t n = ::read(fds[i].fd, buffer.data(), buffer.size());
            if (n > 0) {
                const ChunkCallback& sink = (i == 0) ? on_stdout : on_stderr;
                if (sink) {
                    sink(buffer.data(), static_cast<std::size_t>(n));
                }
            } else if (n == 0) {
                fds[i].fd = -1;  // EOF; poll ignores negative descriptors
                --open_streams;
            } else if (errno != EINTR && errno != EAGAIN) {
                failure = ErrnoMessage("read failed", errno);
                break;
            }
        }
    }

    // Closing the read ends makes a still-writing child fail with SIGPIPE
    out_pipe.read_end.Close();
    err_pipe.read_end.Close();

    int exit_code = ReapChild(pid);

    if (!failure.empty()) {
        throw ProcessError(failure);
    }

    spdlog::trace("{} exited with {}", argv[0], exit_code);
    return exit_code;
}

CommandResult RunCommand(const std::vector<std::string>& argv) {
    CommandResult result;
    result.exit_code = RunProcess(
        argv,
        [&result](const char* data, std::size_t size) { result.output.append(data, size); },
        [&result](const char* data, std::size_t size) { result.error.append(data, size); });
    return result;
}

} // namespace utils
} // namespace sandrun
