#pragma once

#include <map>
#include <optional>
#include <string>

// Android key event codes by name ("HOME", "VOLUME_UP", ...)
const std::map<std::string, int>& key_codes();

// Exact, case-sensitive lookup
std::optional<int> key_code(const std::string& name);
