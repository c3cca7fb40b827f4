#include "process/process_runner.h"

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <spawn.h>
#include <sys/wait.h>
#include <thread>
#include <unistd.h>

extern char** environ;

namespace audio_segmenter {
namespace process {

namespace {

constexpr int kPollSliceMs = 50;

class FileActions {
   public:
    FileActions() {
        ok_ = posix_spawn_file_actions_init(&actions_) == 0;
    }
    ~FileActions() {
        if (ok_) {
            posix_spawn_file_actions_destroy(&actions_);
        }
    }
    FileActions(const FileActions&) = delete;
    FileActions& operator=(const FileActions&) = delete;

    bool ok() const {
        return ok_;
    }
    posix_spawn_file_actions_t* get() {
        return &actions_;
    }

   private:
    posix_spawn_file_actions_t actions_;
    bool ok_ = false;
};

void closeFd(int& fd) {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

// Read what is available; returns false once the stream hit EOF or failed
bool drainFd(int fd, std::string& out, size_t maxBytes) {
    char buffer[4096];
    while (true) {
        const ssize_t n = ::read(fd, buffer, sizeof(buffer));
        if (n > 0) {
            if (out.size() < maxBytes) {
                out.append(buffer, std::min(static_cast<size_t>(n), maxBytes - out.size()));
            }
            continue;
        }
        if (n == 0) {
            return false;
        }
        if (errno == EINTR) {
            continue;
        }
        return errno == EAGAIN || errno == EWOULDBLOCK;
    }
}

void killAndReap(pid_t pid) {
    ::kill(pid, SIGKILL);
    int status = 0;
    while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {
    }
}

}  // namespace

const char* processStatusToString(ProcessStatus status) {
    switch (status) {
    case ProcessStatus::Exited:
        return "exited";
    case ProcessStatus::SpawnFailed:
        return "spawn_failed";
    case ProcessStatus::TimedOut:
        return "timed_out";
    case ProcessStatus::Cancelled:
        return "cancelled";
    case ProcessStatus::Signaled:
        return "signaled";
    }
    return "unknown";
}

ProcessResult runProcess(const std::vector<std::string>& args, const ProcessOptions& options) {
    ProcessResult result;
    if (args.empty() || args[0].empty()) {
        result.message = "empty command";
        return result;
    }

    int outPipe[2] = {-1, -1};
    int errPipe[2] = {-1, -1};
    if (::pipe2(outPipe, O_CLOEXEC) != 0) {
        result.message = std::string("pipe failed: ") + std::strerror(errno);
        return result;
    }
    if (::pipe2(errPipe, O_CLOEXEC) != 0) {
        result.message = std::string("pipe failed: ") + std::strerror(errno);
        closeFd(outPipe[0]);
        closeFd(outPipe[1]);
        return result;
    }

    std::vector<char*> argv;
    argv.reserve(args.size() + 1);
    for (const auto& arg : args) {
        argv.push_back(const_cast<char*>(arg.c_str()));
    }
    argv.push_back(nullptr);

    pid_t pid = -1;
    int rc = 0;
    {
        FileActions actions;
        if (!actions.ok()) {
            rc = ENOMEM;
        } else {
            rc = posix_spawn_file_actions_addopen(actions.get(), STDIN_FILENO, "/dev/null",
                                                  O_RDONLY, 0);
            if (rc == 0) {
                rc = posix_spawn_file_actions_adddup2(actions.get(), outPipe[1], STDOUT_FILENO);
            }
            if (rc == 0) {
                rc = posix_spawn_file_actions_adddup2(actions.get(), errPipe[1], STDERR_FILENO);
            }
            if (rc == 0) {
                rc = posix_spawnp(&pid, args[0].c_str(), actions.get(), nullptr, argv.data(),
                                  environ);
            }
        }
    }
    closeFd(outPipe[1]);
    closeFd(errPipe[1]);

    if (rc != 0) {
        closeFd(outPipe[0]);
        closeFd(errPipe[0]);
        result.message = "failed to spawn " + args[0] + ": " + std::strerror(rc);
        return result;
    }

    ::fcntl(outPipe[0], F_SETFL, ::fcntl(outPipe[0], F_GETFL) | O_NONBLOCK);
    ::fcntl(errPipe[0], F_SETFL, ::fcntl(errPipe[0], F_GETFL) | O_NONBLOCK);

    const bool hasDeadline = options.timeoutMs > 0;
    const auto deadline =
        std::chrono::steady_clock::now() + std::chrono::milliseconds(options.timeoutMs);

    bool reaped = false;
    int status = 0;
    while (true) {
        if (options.cancelFlag && options.cancelFlag->load()) {
            killAndReap(pid);
            result.status = ProcessStatus::Cancelled;
            result.message = args[0] + " cancelled";
            break;
        }
        if (hasDeadline && std::chrono::steady_clock::now() >= deadline) {
            killAndReap(pid);
            result.status = ProcessStatus::TimedOut;
            result.message =
                args[0] + " timed out after " + std::to_string(options.timeoutMs) + " ms";
            break;
        }

        if (outPipe[0] >= 0 || errPipe[0] >= 0) {
            pollfd fds[2];
            int* owners[2];
            std::string* sinks[2];
            nfds_t count = 0;
            if (outPipe[0] >= 0) {
                fds[count] = {outPipe[0], POLLIN, 0};
                owners[count] = &outPipe[0];
                sinks[count++] = &result.stdoutData;
            }
            if (errPipe[0] >= 0) {
                fds[count] = {errPipe[0], POLLIN, 0};
                owners[count] = &errPipe[0];
                sinks[count++] = &result.stderrData;
            }
            if (::poll(fds, count, kPollSliceMs) > 0) {
                for (nfds_t i = 0; i < count; ++i) {
                    if (fds[i].revents != 0 &&
                        !drainFd(fds[i].fd, *sinks[i], options.maxCaptureBytes)) {
                        closeFd(*owners[i]);
                    }
                }
            }
        }

        const pid_t waited = ::waitpid(pid, &status, WNOHANG);
        if (waited == pid) {
            reaped = true;
        } else if (waited < 0 && errno != EINTR) {
            result.status = ProcessStatus::SpawnFailed;
            result.message = std::string("waitpid failed: ") + std::strerror(errno);
            break;
        }

        if (reaped) {
            // Collect anything still buffered in the pipes
            if (outPipe[0] >= 0) {
                drainFd(outPipe[0], result.stdoutData, options.maxCaptureBytes);
            }
            if (errPipe[0] >= 0) {
                drainFd(errPipe[0], result.stderrData, options.maxCaptureBytes);
            }
            if (WIFEXITED(status)) {
                result.status = ProcessStatus::Exited;
                result.exitCode = WEXITSTATUS(status);
            } else if (WIFSIGNALED(status)) {
                result.status = ProcessStatus::Signaled;
                result.signal = WTERMSIG(status);
                result.message = args[0] + " terminated by signal " +
                                 std::to_string(result.signal);
            }
            break;
        }

        if (outPipe[0] < 0 && errPipe[0] < 0) {
            std::this_thread::sleep_for(std::chrono::milliseconds(kPollSliceMs));
        }
    }

    closeFd(outPipe[0]);
    closeFd(errPipe[0]);
    return result;
}

std::string toCommandString(const std::vector<std::string>& args) {
    std::string out;
    for (size_t i = 0; i < args.size(); ++i) {
        if (i > 0) {
            out += ' ';
        }
        const auto& arg = args[i];
        if (arg.empty() || arg.find_first_of(" \t'\"") != std::string::npos) {
            out += '\'';
            for (char c : arg) {
                if (c == '\'') {
                    out += "'\\''";
                } else {
                    out += c;
                }
            }
            out += '\'';
        } else {
            out += arg;
        }
    }
    return out;
}

std::string lastLine(const std::string& text, size_t maxLength) {
    size_t end = text.find_last_not_of(" \t\r\n");
    if (end == std::string::npos) {
        return {};
    }
    size_t begin = text.rfind('\n', end);
    begin = begin == std::string::npos ? 0 : begin + 1;
    std::string line = text.substr(begin, end - begin + 1);
    if (line.size() > maxLength) {
        line.resize(maxLength);
    }
    return line;
}

}  // namespace process
}  // namespace audio_segmenter
