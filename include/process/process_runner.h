#ifndef PROCESS_PROCESS_RUNNER_H
#define PROCESS_PROCESS_RUNNER_H

#include <atomic>
#include <cstddef>
#include <string>
#include <vector>

namespace audio_segmenter {
namespace process {

enum class ProcessStatus {
    Exited,       // Child exited normally (check exitCode)
    SpawnFailed,  // posix_spawnp or pipe setup failed
    TimedOut,     // Killed after timeoutMs
    Cancelled,    // Killed because cancelFlag was raised
    Signaled      // Child died from a signal it did not receive from us
};

const char* processStatusToString(ProcessStatus status);

struct ProcessOptions {
    int timeoutMs = 0;  // 0 = wait forever
    const std::atomic<bool>* cancelFlag = nullptr;
    size_t maxCaptureBytes = 1024 * 1024;  // Per stream; extra output is read and discarded
};

struct ProcessResult {
    ProcessStatus status = ProcessStatus::SpawnFailed;
    int exitCode = -1;
    int signal = 0;
    std::string stdoutData;
    std::string stderrData;
    std::string message;

    bool succeeded() const {
        return status == ProcessStatus::Exited && exitCode == 0;
    }
};

/**
 * @brief Run a command (args[0] resolved via PATH) and capture stdout/stderr.
 *
 * stdin is connected to /dev/null. The child is killed with SIGKILL when the
 * timeout expires or the cancel flag is raised; the call always reaps the child
 * before returning.
 */
ProcessResult runProcess(const std::vector<std::string>& args,
                         const ProcessOptions& options = ProcessOptions{});

// Shell-like rendering for logs (arguments with spaces are quoted)
std::string toCommandString(const std::vector<std::string>& args);

// Last non-empty line of tool output, trimmed to maxLength
std::string lastLine(const std::string& text, size_t maxLength = 300);

}  // namespace process
}  // namespace audio_segmenter

#endif  // PROCESS_PROCESS_RUNNER_H
