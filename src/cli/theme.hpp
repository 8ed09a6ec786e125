#pragma once

#include <string>
#include <fmt/format.h>

#ifndef DROIDLINK_VERSION
#define DROIDLINK_VERSION "0.1.0"
#endif

namespace theme {

// Terminal colors (ANSI escape sequences)
// Android green: #3DDC84
// Slate:         #5F7A8C
namespace color {
    const std::string GREEN_BRAND = "\033[38;2;61;220;132m";
    const std::string SLATE     = "\033[38;2;95;122;140m";
    const std::string WHITE     = "\033[97m";
    const std::string GRAY      = "\033[90m";
    const std::string RED       = "\033[91m";
    const std::string GREEN     = "\033[92m";
    const std::string YELLOW    = "\033[93m";
    const std::string BOLD      = "\033[1m";
    const std::string DIM       = "\033[2m";
    const std::string RESET     = "\033[0m";
}

// Shorthand wrappers
inline std::string brand(const std::string& s)  { return color::GREEN_BRAND + s + color::RESET; }
inline std::string slate(const std::string& s)   { return color::SLATE + s + color::RESET; }
inline std::string bold(const std::string& s)    { return color::BOLD + s + color::RESET; }
inline std::string dim(const std::string& s)     { return color::DIM + s + color::RESET; }
inline std::string green(const std::string& s)   { return color::GREEN + s + color::RESET; }
inline std::string red(const std::string& s)     { return color::RED + s + color::RESET; }
inline std::string yellow(const std::string& s)  { return color::YELLOW + s + color::RESET; }
inline std::string white(const std::string& s)   { return color::WHITE + s + color::RESET; }

// ── Layout ──────────────────────────────────────────────

// Horizontal line only; callers control spacing
inline std::string rule() {
    return color::DIM + "  \xe2\x94\x80\xe2\x94\x80\xe2\x94\x80\xe2\x94\x80\xe2\x94\x80\xe2\x94\x80\xe2\x94\x80\xe2\x94\x80\xe2\x94\x80\xe2\x94\x80\xe2\x94\x80\xe2\x94\x80\xe2\x94\x80\xe2\x94\x80\xe2\x94\x80\xe2\x94\x80\xe2\x94\x80\xe2\x94\x80\xe2\x94\x80\xe2\x94\x80\xe2\x94\x80\xe2\x94\x80\xe2\x94\x80\xe2\x94\x80\xe2\x94\x80\xe2\x94\x80\xe2\x94\x80\xe2\x94\x80\xe2\x94\x80\xe2\x94\x80\xe2\x94\x80\xe2\x94\x80\xe2\x94\x80\xe2\x94\x80\xe2\x94\x80\xe2\x94\x80\xe2\x94\x80\xe2\x94\x80\xe2\x94\x80\xe2\x94\x80\xe2\x94\x80\xe2\x94\x80\xe2\x94\x80\xe2\x94\x80" + color::RESET + "\n";
}

// Clears the screen, then title and rule
inline std::string banner() {
    return
        "\033[2J\033[H\n"
        + color::GREEN_BRAND + color::BOLD
        + "  droidlink\n"
        + color::RESET + color::DIM + "  v" + std::string(DROIDLINK_VERSION) + "\n"
        + "  Remote control for Android TV and Fire TV"
        + color::RESET + "\n\n"
        + rule();
}

// Section header with a blank line on each side
inline std::string section(const std::string& title) {
    return "\n" + color::SLATE + color::BOLD + "  " + title + color::RESET + "\n\n";
}

// Rule between content blocks
inline std::string divider() {
    return "\n" + rule() + "\n";
}

// ── Status indicators ───────────────────────────────────

inline std::string ok(const std::string& msg) {
    return color::GREEN + "    + " + color::RESET + msg + "\n";
}

inline std::string fail(const std::string& msg) {
    return color::RED + "    x " + color::RESET + msg + "\n";
}

inline std::string info(const std::string& msg) {
    return color::SLATE + "    ~ " + color::RESET + msg + "\n";
}

inline std::string warn(const std::string& msg) {
    return color::YELLOW + "    ! " + color::RESET + msg + "\n";
}

inline std::string step(const std::string& msg) {
    return color::SLATE + "    > " + color::RESET + msg + "\n";
}

// Subtle log line for internal status (dimmer than program output)
inline std::string log(const std::string& msg) {
    return "\033[38;2;80;80;80m    \xc2\xb7 " + msg + "\033[0m\n";
}

// Key-value row for dashboard/status panels
inline std::string kv(const std::string& key, const std::string& value) {
    return color::DIM + fmt::format("    {:<10}", key) + color::RESET + value + "\n";
}

} // namespace theme
