#include "process.hpp"
#include "platform.hpp"

#ifndef _WIN32
#  include <unistd.h>
#  include <sys/wait.h>
#  include <signal.h>
#  include <fcntl.h>
#endif

#include <sstream>

namespace platform {

ProcessHandle::ProcessHandle() = default;

ProcessHandle::~ProcessHandle() {
#ifdef _WIN32
    if (handle_ != INVALID_HANDLE_VALUE) CloseHandle(handle_);
    if (thread_ != INVALID_HANDLE_VALUE) CloseHandle(thread_);
#endif
}

ProcessHandle::ProcessHandle(ProcessHandle&& other) noexcept {
#ifdef _WIN32
    handle_ = other.handle_;
    thread_ = other.thread_;
    other.handle_ = INVALID_HANDLE_VALUE;
    other.thread_ = INVALID_HANDLE_VALUE;
#else
    pid_ = other.pid_;
    other.pid_ = -1;
#endif
}

ProcessHandle& ProcessHandle::operator=(ProcessHandle&& other) noexcept {
    if (this != &other) {
#ifdef _WIN32
        if (handle_ != INVALID_HANDLE_VALUE) CloseHandle(handle_);
        if (thread_ != INVALID_HANDLE_VALUE) CloseHandle(thread_);
        handle_ = other.handle_;
        thread_ = other.thread_;
        other.handle_ = INVALID_HANDLE_VALUE;
        other.thread_ = INVALID_HANDLE_VALUE;
#else
        pid_ = other.pid_;
        other.pid_ = -1;
#endif
    }
    return *this;
}

bool ProcessHandle::valid() const {
#ifdef _WIN32
    return handle_ != INVALID_HANDLE_VALUE;
#else
    return pid_ > 0;
#endif
}

int ProcessHandle::wait(int timeout_ms) {
#ifdef _WIN32
    if (handle_ == INVALID_HANDLE_VALUE) return -1;
    DWORD ms = (timeout_ms < 0) ? INFINITE : static_cast<DWORD>(timeout_ms);
    if (WaitForSingleObject(handle_, ms) != WAIT_OBJECT_0) return -1;
    DWORD code = 1;
    GetExitCodeProcess(handle_, &code);
    return static_cast<int>(code);
#else
    if (pid_ <= 0) return -1;
    int status = 0;
    if (timeout_ms < 0) {
        if (waitpid(pid_, &status, 0) != pid_) return -1;
        pid_ = -1;
        return WIFEXITED(status) ? WEXITSTATUS(status) : -1;
    }
    for (int elapsed = 0; elapsed < timeout_ms; elapsed += 50) {
        pid_t ret = waitpid(pid_, &status, WNOHANG);
        if (ret == pid_) {
            pid_ = -1;
            return WIFEXITED(status) ? WEXITSTATUS(status) : -1;
        }
        if (ret < 0) return -1;
        sleep_ms(50);
    }
    return -1;  // timed out, still running
#endif
}

void ProcessHandle::terminate() {
#ifdef _WIN32
    if (handle_ != INVALID_HANDLE_VALUE) {
        TerminateProcess(handle_, 1);
        WaitForSingleObject(handle_, 2000);
    }
#else
    if (pid_ <= 0) return;
    kill(pid_, SIGTERM);
    for (int i = 0; i < 20; i++) {
        int status;
        if (waitpid(pid_, &status, WNOHANG) == pid_) {
            pid_ = -1;
            return;
        }
        sleep_ms(100);
    }
    kill(pid_, SIGKILL);
    waitpid(pid_, nullptr, 0);
    pid_ = -1;
#endif
}

#ifdef _WIN32

ProcessHandle spawn(const std::string& program,
                    const std::vector<std::string>& args,
                    bool quiet) {
    ProcessHandle handle;

    std::ostringstream cmdline;
    cmdline << "\"" << program << "\"";
    for (const auto& arg : args) {
        cmdline << " \"" << arg << "\"";
    }
    std::string cmd_str = cmdline.str();

    STARTUPINFOA si = {};
    si.cb = sizeof(si);
    PROCESS_INFORMATION pi = {};
    DWORD flags = quiet ? CREATE_NO_WINDOW : 0;

    if (CreateProcessA(nullptr, cmd_str.data(), nullptr, nullptr, FALSE,
                       flags, nullptr, nullptr, &si, &pi)) {
        handle.handle_ = pi.hProcess;
        handle.thread_ = pi.hThread;
    }
    return handle;
}

#else // Unix

ProcessHandle spawn(const std::string& program,
                    const std::vector<std::string>& args,
                    bool quiet) {
    ProcessHandle handle;

    // Build argv before forking; only async-signal-safe calls in the child
    std::vector<const char*> argv;
    argv.push_back(program.c_str());
    for (const auto& a : args) argv.push_back(a.c_str());
    argv.push_back(nullptr);

    pid_t pid = fork();
    if (pid < 0) return handle;

    if (pid == 0) {
        int devnull = open("/dev/null", O_RDWR);
        if (devnull >= 0) {
            dup2(devnull, STDIN_FILENO);
            if (quiet) {
                dup2(devnull, STDOUT_FILENO);
                dup2(devnull, STDERR_FILENO);
            }
            close(devnull);
        }
        execvp(program.c_str(), const_cast<char* const*>(argv.data()));
        _exit(127);  // exec failed
    }

    handle.pid_ = pid;
    return handle;
}

#endif

int run_process(const std::string& program,
                const std::vector<std::string>& args,
                int timeout_ms) {
    ProcessHandle proc = spawn(program, args, true);
    if (!proc.valid()) return -1;

    int code = proc.wait(timeout_ms);
    if (code < 0) proc.terminate();
    return code;
}

} // namespace platform
