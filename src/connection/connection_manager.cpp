#include "connection_manager.hpp"
#include <core/log.hpp>

ConnectionManager::ConnectionManager(DeviceTarget target)
    : target_(std::move(target)) {
}

std::string ConnectionManager::describe() const {
    return target_.str();
}

bool ConnectionManager::connect(bool always_log_errors) {
    std::lock_guard<std::mutex> lock(lock_);

    close_locked();
    connected_ = false;

    auto status = open_locked();
    if (status.ok()) {
        connected_ = true;
        failure_reported_ = false;
        log_info("Connection to {} successfully established", describe());
        return true;
    }

    close_locked();
    if (always_log_errors || !failure_reported_) {
        log_warning("Couldn't connect to {}, error: {}", describe(), status.message);
        failure_reported_ = true;
    } else {
        log_debug("Still unable to connect to {}: {}", describe(), status.message);
    }
    return false;
}

ShellResult ConnectionManager::shell(const std::string& command) {
    if (!connected_) {
        return ShellResult::None();
    }

    std::unique_lock<std::mutex> lock(lock_, std::try_to_lock);
    if (!lock.owns_lock()) {
        log_debug("Skipping '{}' on {}: a previous command has not finished", command, describe());
        return ShellResult::None();
    }

    // Re-check under the lock; close() may have run in between
    if (!connected_) {
        return ShellResult::None();
    }

    auto r = execute_locked(command);
    if (r.failed()) {
        connected_ = false;
    }
    return r;
}

void ConnectionManager::close() {
    std::lock_guard<std::mutex> lock(lock_);
    close_locked();
    connected_ = false;
}
