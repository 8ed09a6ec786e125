#pragma once

#include <optional>
#include <string>
#include <core/types.hpp>
#include <core/credentials.hpp>
#include "errors.hpp"

// Outcome of Transport::open and other calls with no payload
struct TransportStatus {
    TransportError error = TransportError::NONE;
    std::string message;

    bool ok() const { return error == TransportError::NONE; }
    bool failed() const { return error != TransportError::NONE; }

    static TransportStatus Ok() { return {}; }
    static TransportStatus Err(TransportError e, std::string msg) {
        return {e, std::move(msg)};
    }
};

// Shell command result. `output` is empty when there was nothing to return:
// the device produced no output, the manager was disconnected or busy, or
// the command failed (then `error` says why).
struct ShellResult {
    TransportError error = TransportError::NONE;
    std::optional<std::string> output;
    std::string message;
    std::string stderr_data;
    int exit_status = 0;

    bool ok() const { return error == TransportError::NONE; }
    bool failed() const { return error != TransportError::NONE; }

    static ShellResult None() { return {}; }
    static ShellResult Output(std::string text, int exit_status = 0) {
        ShellResult r;
        r.output = std::move(text);
        r.exit_status = exit_status;
        return r;
    }
    static ShellResult Err(TransportError e, std::string msg) {
        ShellResult r;
        r.error = e;
        r.message = std::move(msg);
        return r;
    }
};

// Executes commands on one device. Not safe for overlapping execute() calls;
// ConnectionManager serializes them.
class Transport {
public:
    virtual ~Transport() = default;

    // Open a session to `target`, authenticating with `key` when given.
    virtual TransportStatus open(const DeviceTarget& target, const KeyPair* key) = 0;

    // Run one command. A command that printed nothing yields no output.
    virtual ShellResult execute(const std::string& command) = 0;

    // Best-effort teardown; safe to call on a closed transport.
    virtual void close() = 0;
};
