// Shared types between the transport layer, the CLI session and the driver.
// Kept as plain structs so the driver can fill them straight from QSettings.
#pragma once
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace sroscli {

// Host key validation policy against known_hosts.
enum class KnownHostsPolicy {
    Strict,     // Exact match required.
    AcceptNew,  // TOFU: new hosts accepted and saved; key changes rejected.
    Off         // No verification (not recommended).
};

// Timing and echo knobs shared by every read on a channel.
struct ChannelTuning {
    double global_delay_factor = 1.0; // multiplier for settle delays
    bool cmd_verify = true;           // wait for the command echo before the prompt
    int read_timeout_ms = 10000;      // default deadline for a single read
};

// Answers keyboard-interactive prompts. Returns true and fills "responses"
// (one per prompt) when it could answer; otherwise the backend falls back
// to the user/password heuristic.
using KbdIntPromptsCB = std::function<bool(const std::string& name,
                                           const std::string& instruction,
                                           const std::vector<std::string>& prompts,
                                           std::vector<std::string>& responses)>;

struct SessionOptions {
    std::string host;
    std::uint16_t port = 22;
    std::string username;

    std::optional<std::string> password;
    std::optional<std::string> private_key_path;
    std::optional<std::string> private_key_passphrase;

    std::optional<std::string> known_hosts_path; // default: ~/.ssh/known_hosts
    KnownHostsPolicy known_hosts_policy = KnownHostsPolicy::Strict;

    // Called for unknown hosts under AcceptNew. true = accept and save.
    std::function<bool(const std::string& host,
                       std::uint16_t port,
                       const std::string& algorithm,
                       const std::string& fingerprint)> hostkey_confirm_cb;

    KbdIntPromptsCB keyboard_interactive_cb;

    std::string term_type = "vt100";
    unsigned int term_width = 512;

    ChannelTuning tuning;
};

// Per-session behaviour of CliSession on top of the channel tuning.
struct CliOptions {
    double settle_delay_s = 0.3;      // scaled by global_delay_factor after setup commands
    int exit_config_max_attempts = 2; // discard/quit-config rounds before giving up
    unsigned int terminal_width = 512;
};

enum class CliErrorKind {
    None,
    Preparation,      // initial prompt capture failed
    ExitConfig,       // configuration mode still active after exit
    Parse,            // expected pattern absent from device output
    UnexpectedOutput, // output matches neither branch of a boolean check
    IO,               // remote file absent
    Timeout,          // read deadline elapsed
    Channel           // transport failure, not connected, bad pattern
};

struct CliError {
    CliErrorKind kind = CliErrorKind::None;
    std::string message;

    bool isSet() const { return kind != CliErrorKind::None; }
    void clear() {
        kind = CliErrorKind::None;
        message.clear();
    }
};

const char* cliErrorKindName(CliErrorKind kind);

enum class CliMode { Classical, ModelDriven };

enum class ConfigState { Operational, ConfigEntering, ConfigActive, ConfigDirty, ConfigExiting };

enum class TransferDirection { Put, Get };

struct TransferSpec {
    TransferDirection direction = TransferDirection::Put;
    std::string source_file;
    std::string dest_file;
    std::string file_system = "cf3:";
};

} // namespace sroscli
