#pragma once

#include <memory>
#include <core/config.hpp>
#include "connection_manager.hpp"

// DirectConnection over SSH, or ProxyConnection through an SSH relay when
// the config has a proxy section. Does not connect.
Result<std::unique_ptr<ConnectionManager>> make_connection(const Config& config);
