#include "connection_factory.hpp"
#include "direct_connection.hpp"
#include "proxy_connection.hpp"
#include <transport/ssh_relay_client.hpp>
#include <core/log.hpp>

using ManagerPtr = std::unique_ptr<ConnectionManager>;

Result<ManagerPtr> make_connection(const Config& config) {
    const auto& device = config.device();

    if (!config.proxy()) {
        log_debug("Using direct backend for {}", device.target.str());
        return Result<ManagerPtr>::Ok(
            std::make_unique<DirectConnection>(device.target, device.key_path));
    }

    const auto& proxy = *config.proxy();
    std::optional<KeyPair> key;
    if (proxy.key_path) {
        // The relay key belongs to the user; never generate one in its place
        auto loaded = load_key_pair(*proxy.key_path, nullptr);
        if (loaded.is_err()) {
            return Result<ManagerPtr>::Err("Proxy key: " + loaded.error);
        }
        key = std::move(loaded.value);
    }

    log_debug("Using proxy backend for {} via {}:{}", device.target.str(), proxy.host, proxy.port);
    auto client = std::make_unique<SshRelayClient>(proxy, std::move(key));
    return Result<ManagerPtr>::Ok(
        std::make_unique<ProxyConnection>(device.target, std::move(client)));
}
