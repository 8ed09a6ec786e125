#pragma once

#include <string>
#include <vector>

#ifdef _WIN32
#  ifndef WIN32_LEAN_AND_MEAN
#    define WIN32_LEAN_AND_MEAN
#  endif
#  include <windows.h>
#endif

namespace platform {

// Owning handle to a spawned child process. Move-only.
class ProcessHandle {
public:
    ProcessHandle();
    ~ProcessHandle();

    ProcessHandle(ProcessHandle&& other) noexcept;
    ProcessHandle& operator=(ProcessHandle&& other) noexcept;
    ProcessHandle(const ProcessHandle&) = delete;
    ProcessHandle& operator=(const ProcessHandle&) = delete;

    bool valid() const;

    // Wait for the process to exit. Returns its exit code, or -1 on
    // timeout / abnormal exit. timeout_ms = -1 waits indefinitely.
    int wait(int timeout_ms = -1);

    // SIGTERM, then SIGKILL after 2s (TerminateProcess on Windows).
    void terminate();

private:
#ifdef _WIN32
    HANDLE handle_ = INVALID_HANDLE_VALUE;
    HANDLE thread_ = INVALID_HANDLE_VALUE;
#else
    int pid_ = -1;
#endif
    friend ProcessHandle spawn(const std::string& program,
                               const std::vector<std::string>& args,
                               bool quiet);
};

// Spawn a child process with stdin closed. quiet: discard stdout and stderr.
ProcessHandle spawn(const std::string& program,
                    const std::vector<std::string>& args,
                    bool quiet = false);

// Spawn, wait up to timeout_ms and return the exit code.
// A process still running at the deadline is terminated and -1 returned.
int run_process(const std::string& program,
                const std::vector<std::string>& args,
                int timeout_ms);

} // namespace platform
