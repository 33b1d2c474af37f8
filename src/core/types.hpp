#pragma once

#include <string>
#include <optional>
#include <vector>
#include <map>
#include <cstdint>

// Result type for operations that can fail
template <typename T>
struct Result {
    bool success;
    T value;
    std::string error;

    static Result<T> Ok(T val) {
        return {true, std::move(val), ""};
    }

    static Result<T> Err(const std::string& err) {
        return {false, T{}, err};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// Specialization for void
template <>
struct Result<void> {
    bool success;
    std::string error;

    static Result<void> Ok() {
        return {true, ""};
    }

    static Result<void> Err(const std::string& err) {
        return {false, err};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// How a command invocation ended, before looking at its exit code
enum class CommandStatus {
    Completed,
    SpawnFailed,
    TimedOut,
    ConnectFailed,
    AuthFailed,
    ChannelFailed,
};

// Local or remote command execution result
struct CommandResult {
    int exit_code = -1;
    std::string stdout_data;
    std::string stderr_data;
    CommandStatus status = CommandStatus::Completed;

    bool success() const { return status == CommandStatus::Completed && exit_code == 0; }
    bool failed() const { return !success(); }

    std::string get_output() const {
        return stdout_data.empty() ? stderr_data : stdout_data;
    }
};

// ── Scheduler facts ─────────────────────────────────────────

struct Job {
    std::string id;
    std::string partition;
    std::string name;
};

enum class NodeToken {
    Idle,
    Allocated,
    Mixed,
    Down,
    Unknown,
};

struct NodeState {
    std::string node_id;
    NodeToken token = NodeToken::Unknown;
};

// ── Derived state ───────────────────────────────────────────

// Replaced wholesale every tick, never patched in place.
struct CanonicalSnapshot {
    bool classical_active = false;
    bool quantum_active = false;
    std::map<std::string, bool> node_active;

    bool operator==(const CanonicalSnapshot& o) const {
        return classical_active == o.classical_active &&
               quantum_active == o.quantum_active &&
               node_active == o.node_active;
    }
};

struct Rgb {
    uint8_t r = 0;
    uint8_t g = 0;
    uint8_t b = 0;

    bool operator==(const Rgb& o) const { return r == o.r && g == o.g && b == o.b; }
    bool operator!=(const Rgb& o) const { return !(*this == o); }
};

// Text for the pixel matrix: one color per glyph, drawn from a fixed column.
struct MatrixText {
    std::string text;
    std::vector<Rgb> colors;
    int x_offset = 0;

    bool operator==(const MatrixText& o) const {
        return text == o.text && colors == o.colors && x_offset == o.x_offset;
    }
    bool operator!=(const MatrixText& o) const { return !(*this == o); }
};

struct DisplayDirectives {
    bool indicator_a = false;    // classical partition
    bool indicator_b = false;    // quantum partition
    std::optional<MatrixText> matrix_text;
    std::map<std::string, bool> node_lights;

    bool operator==(const DisplayDirectives& o) const {
        return indicator_a == o.indicator_a && indicator_b == o.indicator_b &&
               matrix_text == o.matrix_text && node_lights == o.node_lights;
    }
};
