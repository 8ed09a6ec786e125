#pragma once

#include <string>
#include <functional>
#include "types.hpp"

// Device authentication material. Contents are opaque to droidlink; the
// transport interprets them (PEM for the SSH transport).
struct KeyPair {
    std::string private_key;
    std::string public_key;   // empty = let the transport derive it
};

// Creates a fresh key pair at `private_path` (public half at private_path + ".pub").
using KeyGenerator = std::function<Result<void>(const std::string& private_path)>;

// Default generator: ssh-keygen -t rsa -b 2048 -N "" -f <path>
Result<void> generate_key_pair(const std::string& private_path);

// Read the private key at `private_path`; if that fails, generate a pair
// there and read it back. An empty generator only reads. The public key is read from "<path>.pub" when
// present and left empty otherwise.
Result<KeyPair> load_key_pair(const std::string& private_path,
                              const KeyGenerator& generator = generate_key_pair);
