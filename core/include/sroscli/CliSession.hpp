// Session state on top of a connected Channel: base prompt, CLI personality
// and the configuration-mode protocol of the device.
#pragma once
#include "Channel.hpp"
#include "CliPersonality.hpp"
#include "SessionTypes.hpp"
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace sroscli {

class CliSession {
public:
    // The channel must outlive the session and be connected before prepare()
    explicit CliSession(Channel& channel, CliOptions opt = {});

    CliSession(const CliSession&) = delete;
    CliSession& operator=(const CliSession&) = delete;

    // Flush banner, capture and classify the prompt, disable paging, drain.
    // Runs once per session: the personality never changes afterwards.
    bool prepare(CliError& err);
    bool isPrepared() const { return static_cast<bool>(personality_); }

    const std::string& basePrompt() const { return basePrompt_; }
    const std::string& rawPrompt() const { return rawPrompt_; }
    // Replace the anchor used by every prompt read
    void setBasePrompt(const std::string& prompt);

    // Empty / nullptr until prepare() succeeded
    std::optional<CliMode> mode() const {
        if (!personality_)
            return std::nullopt;
        return personality_->mode();
    }
    const CliPersonality* personality() const { return personality_.get(); }

    // No privileged mode on this platform
    std::string enable() { return {}; }
    std::string exitEnableMode() { return {}; }
    bool checkEnableMode() const { return true; }

    bool enterConfig(std::string& out, CliError& err,
                     const std::string& command = "edit-config exclusive",
                     const std::string& pattern = R"(\(ex\)\[)");
    bool checkConfigActive(bool& active, CliError& err);
    bool exitConfig(std::string& out, CliError& err);
    bool commit(std::string& out, CliError& err);
    bool discard(std::string& out, CliError& err);

    // exitAfter defaults to the personality's choice (stay in config on
    // the model-driven CLI, leave it on the classical one)
    bool sendConfigSet(const std::vector<std::string>& commands,
                       std::string& out,
                       CliError& err,
                       std::optional<bool> exitAfter = std::nullopt);

    bool saveConfig(std::string& out, CliError& err);

    // Echo, trailing prompt and context decoration removed
    bool sendCommand(const std::string& command, std::string& out, CliError& err);
    std::string stripPrompt(const std::string& output) const;

    // Best effort: leave config mode, send exitCommand, disconnect. Never fails.
    void cleanup(const std::string& exitCommand = "logout");

    Channel& channel() { return channel_; }

private:
    Channel& channel_;
    CliOptions opt_;
    std::unique_ptr<CliPersonality> personality_;
    std::string rawPrompt_;
    std::string basePrompt_;

    bool testChannelRead(CliError& err);
    bool exitAll(std::string& out, CliError& err);
    // Write command, then read its echo and the prompt (or only the prompt
    // when echo verification is off)
    bool sendAwaitEcho(const std::string& command, std::string& out, CliError& err);
    bool requirePrepared(CliError& err) const;
};

} // namespace sroscli
