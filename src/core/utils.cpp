#include "utils.hpp"
#include <platform/platform.hpp>
#include <sstream>
#include <stdexcept>

std::optional<int> parse_int(const std::string& s) {
    std::string t = trimmed(s);
    if (t.empty()) return std::nullopt;
    try {
        size_t used = 0;
        int v = std::stoi(t, &used);
        if (used != t.size()) return std::nullopt;
        return v;
    } catch (const std::invalid_argument&) {
        return std::nullopt;
    } catch (const std::out_of_range&) {
        return std::nullopt;
    }
}

std::vector<std::string> split_whitespace(const std::string& s) {
    std::vector<std::string> tokens;
    std::istringstream in(s);
    std::string tok;
    while (in >> tok) {
        tokens.push_back(tok);
    }
    return tokens;
}

std::vector<std::string> split_lines(const std::string& s) {
    std::vector<std::string> lines;
    std::istringstream in(s);
    std::string line;
    while (std::getline(in, line)) {
        trim(line);
        lines.push_back(line);
    }
    return lines;
}

std::string shell_quote(const std::string& s) {
    std::string out = "'";
    for (char c : s) {
        if (c == '\'') {
            out += "'\\''";
        } else {
            out += c;
        }
    }
    out += "'";
    return out;
}

std::string expand_user(const std::string& path) {
    if (path.empty() || path[0] != '~') return path;
    if (path.size() > 1 && path[1] != '/') return path;   // ~other_user is left alone
    return (platform::home_dir() / path.substr(path.size() > 1 ? 2 : 1)).string();
}
