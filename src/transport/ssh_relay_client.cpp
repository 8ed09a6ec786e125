#include "ssh_relay_client.hpp"
#include "ssh_transport.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <core/utils.hpp>
#include <fmt/format.h>

namespace {

// Handle to one device on the relay. Does not own the client; the
// ProxyConnection holding both releases its device handles first.
class RelayDevice : public ProxyDevice {
public:
    RelayDevice(SshRelayClient& client, std::string serial)
        : client_(client), serial_(std::move(serial)) {}

    Result<std::string> serial_no() override {
        return Result<std::string>::Ok(serial_);
    }

    ShellResult shell(const std::string& command) override {
        auto r = client_.run(fmt::format(CMD_RELAY_SHELL, shell_quote(serial_), shell_quote(command)));
        if (r.failed()) return r;

        // adb reports its own failures ("error: device offline", "error: closed")
        // on stderr; a device command's non-zero exit is not one of them
        std::string err = trimmed(r.stderr_data);
        if (err.rfind("error:", 0) == 0) {
            return ShellResult::Err(TransportError::RPC_FAILURE, err);
        }
        return r;
    }

private:
    SshRelayClient& client_;
    std::string serial_;
};

} // namespace

std::vector<std::string> parse_adb_devices(const std::string& output) {
    std::vector<std::string> serials;
    for (const auto& line : split_lines(output)) {
        if (line.empty() || line.rfind("List of devices", 0) == 0 || line[0] == '*') continue;
        auto fields = split_whitespace(line);
        if (fields.size() >= 2 && fields[1] == "device") {
            serials.push_back(fields[0]);
        }
    }
    return serials;
}

SshRelayClient::SshRelayClient(const ProxyConfig& config, std::optional<KeyPair> key,
                               std::unique_ptr<Transport> transport)
    : config_(config), key_(std::move(key)), transport_(std::move(transport)) {
    if (!transport_) {
        transport_ = std::make_unique<SshTransport>();
    }
}

SshRelayClient::~SshRelayClient() {
    close();
}

std::string SshRelayClient::server() const {
    return config_.host + ":" + std::to_string(config_.port);
}

ShellResult SshRelayClient::run(const std::string& command) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (!open_) {
        DeviceTarget relay;
        relay.host = config_.host;
        relay.port = config_.port;
        relay.user = config_.user;
        relay.timeout = config_.timeout;

        auto status = transport_->open(relay, key_ ? &*key_ : nullptr);
        if (status.failed()) {
            return ShellResult::Err(TransportError::CONNECTION_RESET,
                fmt::format("proxy server {} unreachable: {}", server(), status.message));
        }
        open_ = true;
    }

    auto r = transport_->execute(command);
    if (r.failed()) {
        transport_->close();
        open_ = false;
        return ShellResult::Err(TransportError::CONNECTION_RESET,
            fmt::format("lost proxy server {}: {}", server(), r.message));
    }
    return r;
}

Result<void> SshRelayClient::remote_connect(const std::string& host, int port) {
    std::string serial = host + ":" + std::to_string(port);
    auto r = run(fmt::format(CMD_RELAY_CONNECT, shell_quote(serial)));
    if (r.failed()) {
        return Result<void>::Err(r.message);
    }

    std::string out = trimmed(r.output.value_or(""));
    if (out.find("connected to") != std::string::npos) {
        return Result<void>::Ok();
    }
    return Result<void>::Err(fmt::format("adb connect {}: {}", serial,
                                         out.empty() ? trimmed(r.stderr_data) : out));
}

Result<std::vector<std::shared_ptr<ProxyDevice>>> SshRelayClient::devices() {
    using DeviceList = std::vector<std::shared_ptr<ProxyDevice>>;

    auto r = run(CMD_RELAY_DEVICES);
    if (r.failed()) {
        return Result<DeviceList>::Err(r.message);
    }
    if (r.exit_status != 0) {
        return Result<DeviceList>::Err(fmt::format("adb devices exited with {}: {}",
                                                   r.exit_status, trimmed(r.stderr_data)));
    }

    DeviceList list;
    for (auto& serial : parse_adb_devices(r.output.value_or(""))) {
        list.push_back(std::make_shared<RelayDevice>(*this, serial));
    }
    return Result<DeviceList>::Ok(std::move(list));
}

void SshRelayClient::close() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (open_) {
        transport_->close();
        open_ = false;
    }
}
