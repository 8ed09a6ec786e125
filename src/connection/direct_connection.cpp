#include "direct_connection.hpp"
#include <transport/ssh_transport.hpp>
#include <core/log.hpp>

DirectConnection::DirectConnection(DeviceTarget target,
                                   std::optional<std::string> key_path,
                                   TransportFactory factory,
                                   KeyGenerator generator)
    : ConnectionManager(std::move(target)),
      key_path_(std::move(key_path)),
      factory_(std::move(factory)),
      generator_(std::move(generator)) {
    if (!factory_) {
        factory_ = [] { return std::make_unique<SshTransport>(); };
    }
}

DirectConnection::~DirectConnection() {
    std::lock_guard<std::mutex> lock(lock_);
    close_locked();
}

bool DirectConnection::has_transport() {
    std::lock_guard<std::mutex> lock(lock_);
    return transport_ != nullptr;
}

TransportStatus DirectConnection::open_locked() {
    std::optional<KeyPair> key;
    if (key_path_) {
        // After a failed generation only look for a key placed there by hand
        auto loaded = load_key_pair(*key_path_, generation_failed_ ? KeyGenerator() : generator_);
        if (loaded.is_err()) {
            generation_failed_ = true;
            return TransportStatus::Err(TransportError::AUTH_FAILED, loaded.error);
        }
        generation_failed_ = false;
        key = std::move(loaded.value);
    }

    transport_ = factory_();
    auto status = transport_->open(target_, key ? &*key : nullptr);
    if (status.failed()) {
        transport_.reset();
    }
    return status;
}

ShellResult DirectConnection::execute_locked(const std::string& command) {
    if (!transport_) {
        return ShellResult::Err(TransportError::MALFORMED_STATE, "No transport available");
    }
    log_debug("shell {}: {}", describe(), command);
    return transport_->execute(command);
}

void DirectConnection::close_locked() {
    if (transport_) {
        transport_->close();
        transport_.reset();
    }
}
