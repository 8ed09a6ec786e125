#pragma once

// ── Ports ───────────────────────────────────────────────────
constexpr int DEFAULT_DEVICE_PORT        = 5555;
constexpr int DEFAULT_PROXY_PORT         = 22;

// ── Timeouts ────────────────────────────────────────────────
constexpr int DEFAULT_TIMEOUT_SECS       = 10;    // Connect and per-command I/O deadline
constexpr int DEFAULT_POLL_INTERVAL_SECS = 10;    // Seconds between refresh() calls
constexpr int KEYGEN_TIMEOUT_MS          = 30000; // ssh-keygen must finish within this

// ── Buffer sizes ────────────────────────────────────────────
constexpr int SSH_READ_BUF_SIZE          = 4096;

// ── Audio ───────────────────────────────────────────────────
constexpr int MAX_VOLUME_LEVEL           = 15;    // STREAM_MUSIC steps on most devices

// ── Commands ────────────────────────────────────────────────
// Launch an app by package name: fmt::format(CMD_LAUNCH_APP, package)
constexpr const char* CMD_LAUNCH_APP =
    "monkey -p {} -c android.intent.category.LAUNCHER 1";

// Force-stop an app by package name
constexpr const char* CMD_STOP_APP = "am force-stop {}";

// Send a key event: fmt::format(CMD_KEY_EVENT, code)
constexpr const char* CMD_KEY_EVENT = "input keyevent {}";

// Device properties, one per line: serial, manufacturer, model, version, wifi MAC
constexpr const char* CMD_DEVICE_PROPERTIES =
    "getprop ro.serialno && "
    "getprop ro.product.manufacturer && "
    "getprop ro.product.model && "
    "getprop ro.build.version.release && "
    "cat /sys/class/net/wlan0/address";

// Prints "<state> <current_app> <volume> <muted>" on one line.
// The state token is computed on the device; "-" marks a missing field.
constexpr const char* CMD_UPDATE =
    "if ! dumpsys power | grep 'Display Power' | grep -q 'state=ON'; then s=off; "
    "elif ! dumpsys power | grep mWakefulness | grep -q Awake; then s=standby; "
    "else case \"$(dumpsys media_session | grep -m 1 'state=PlaybackState {state=' "
    "| sed 's/.*{state=\\([0-9]*\\).*/\\1/')\" in "
    "3) s=playing;; 2) s=paused;; *) s=idle;; esac; fi; "
    "a=$(dumpsys window windows | grep -m 1 mCurrentFocus "
    "| sed 's/.* \\([^ /}]*\\)\\/.*/\\1/'); "
    "v=$(settings get system volume_music_speaker); "
    "m=$(dumpsys audio | grep -c 'Muted: true'); "
    "echo \"$s ${a:--} ${v:--} ${m:-0}\"";

// Appended to CMD_UPDATE on Fire TV when sources are requested:
// one running app package per line
constexpr const char* CMD_RUNNING_APPS =
    "; ps | grep u0_a | awk '{print $NF}'";

// Relay-side adb invocations (proxy backend)
constexpr const char* CMD_RELAY_CONNECT = "adb connect {}";
constexpr const char* CMD_RELAY_DEVICES = "adb devices";
constexpr const char* CMD_RELAY_SHELL   = "adb -s {} shell {}";

// Pseudo-command returning the current status as text
constexpr const char* CMD_GET_PROPERTIES = "GET_PROPERTIES";
