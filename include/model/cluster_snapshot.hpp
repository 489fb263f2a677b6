#pragma once

#include <cstdint>
#include <string>
#include <variant>

namespace cluster_dial::model {

// Indicator roles. Each metric owns exactly one, for the lifetime of the process.
enum class indicator : std::uint8_t {
    CPU = 0,
    MEMORY = 1,
    DISK = 2,
};

enum class loop_state : std::uint8_t {
    INITIALIZING = 0,
    RUNNING = 1,
    DEBUG_CYCLE = 2,
    ERROR_DISPLAY = 3,
    SHUTTING_DOWN = 4,
};

enum class fetch_error_kind : std::uint8_t {
    TRANSPORT = 0,
    HTTP_STATUS = 1,
    MALFORMED_PAYLOAD = 2,
    NOT_CONFIGURED = 3,
};

struct metric {
    std::string name;
    int percent;  // always within [0, 100]
    indicator led;
};

// One complete reading. Built fresh every cycle; there is no partial snapshot.
struct cluster_snapshot {
    metric cpu;
    metric mem;
    metric disk;
};

struct fetch_error {
    fetch_error_kind kind;
    std::string reason;
};

using fetch_result = std::variant<cluster_snapshot, fetch_error>;

inline const char* to_string(const loop_state state) noexcept {
    switch (state) {
        case loop_state::INITIALIZING:
            return "initializing";
        case loop_state::RUNNING:
            return "running";
        case loop_state::DEBUG_CYCLE:
            return "debug_cycle";
        case loop_state::ERROR_DISPLAY:
            return "error_display";
        case loop_state::SHUTTING_DOWN:
            return "shutting_down";
    }
    return "unknown";
}

inline const char* to_string(const fetch_error_kind kind) noexcept {
    switch (kind) {
        case fetch_error_kind::TRANSPORT:
            return "transport";
        case fetch_error_kind::HTTP_STATUS:
            return "http_status";
        case fetch_error_kind::MALFORMED_PAYLOAD:
            return "malformed_payload";
        case fetch_error_kind::NOT_CONFIGURED:
            return "not_configured";
    }
    return "unknown";
}

}  // namespace cluster_dial::model
