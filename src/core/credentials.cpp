#include "credentials.hpp"
#include "constants.hpp"
#include "log.hpp"
#include <platform/process.hpp>
#include <cerrno>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <sys/stat.h>

namespace fs = std::filesystem;

static Result<std::string> read_file(const std::string& path) {
    std::ifstream f(path, std::ios::binary);
    if (!f) {
        return Result<std::string>::Err("Cannot read " + path);
    }
    std::ostringstream ss;
    ss << f.rdbuf();
    if (f.bad()) {
        return Result<std::string>::Err("Read error on " + path);
    }
    return Result<std::string>::Ok(ss.str());
}

Result<void> generate_key_pair(const std::string& private_path) {
    std::error_code ec;
    fs::path parent = fs::path(private_path).parent_path();
    if (!parent.empty()) {
        fs::create_directories(parent, ec);
        if (ec) {
            return Result<void>::Err("Cannot create " + parent.string() + ": " + ec.message());
        }
    }

    int rc = platform::run_process("ssh-keygen",
        {"-q", "-t", "rsa", "-b", "2048", "-N", "", "-m", "PEM", "-f", private_path},
        KEYGEN_TIMEOUT_MS);
    if (rc != 0) {
        return Result<void>::Err(fmt::format("ssh-keygen exited with {}", rc));
    }

    if (chmod(private_path.c_str(), 0600) != 0) {
        return Result<void>::Err(fmt::format("Cannot restrict permissions on {}: {}",
                                             private_path, std::strerror(errno)));
    }
    return Result<void>::Ok();
}

Result<KeyPair> load_key_pair(const std::string& private_path,
                              const KeyGenerator& generator) {
    KeyPair pair;

    auto priv = read_file(private_path);
    if (priv.is_err()) {
        if (!generator) {
            return Result<KeyPair>::Err("No private key at " + private_path);
        }
        log_info("No private key at {}, generating a new key pair", private_path);
        auto gen = generator(private_path);
        if (gen.is_err()) {
            return Result<KeyPair>::Err("Key generation failed: " + gen.error);
        }
        priv = read_file(private_path);
        if (priv.is_err()) {
            return Result<KeyPair>::Err(priv.error);
        }
    }
    pair.private_key = std::move(priv.value);

    auto pub = read_file(private_path + ".pub");
    if (pub.is_ok()) {
        pair.public_key = std::move(pub.value);
    }

    return Result<KeyPair>::Ok(std::move(pair));
}
