// Configuration-mode protocol. State is never stored: every decision is
// taken from the output of the exchange that just happened.
#include "sroscli/CliSession.hpp"
#include "sroscli/PromptText.hpp"
#include "sroscli/RuntimeLogging.hpp"

#include <QLoggingCategory>

#include <chrono>
#include <thread>

Q_LOGGING_CATEGORY(scSession, "sroscli.session")

namespace sroscli {

namespace {

// Model-driven prompt line, e.g. "A:admin@node-1# "
const char* const kModelDrivenPromptPattern = R"(@[^\n]*#[ \t]*$)";

const char* configStateName(ConfigState s) {
    switch (s) {
    case ConfigState::Operational:
        return "Operational";
    case ConfigState::ConfigEntering:
        return "ConfigEntering";
    case ConfigState::ConfigActive:
        return "ConfigActive";
    case ConfigState::ConfigDirty:
        return "ConfigDirty";
    case ConfigState::ConfigExiting:
        return "ConfigExiting";
    }
    return "?";
}

} // namespace

CliSession::CliSession(Channel& channel, CliOptions opt)
    : channel_(channel), opt_(opt) {}

bool CliSession::requirePrepared(CliError& err) const {
    if (personality_)
        return true;
    err = {CliErrorKind::Preparation, "Session not prepared"};
    return false;
}

bool CliSession::testChannelRead(CliError& err) {
    std::string out;
    CliError readErr;
    if (channel_.readUntilPattern(prompt::kAnyPromptPattern, out, readErr) && !prompt::trim(out).empty())
        return true;
    if (readErr.kind == CliErrorKind::Channel) {
        err = {CliErrorKind::Preparation, "Channel read failed: " + readErr.message};
        return false;
    }
    // Quiet device: ask for a prompt once
    readErr.clear();
    out.clear();
    if (!channel_.writeRaw("\n", readErr) ||
        !channel_.readUntilPattern(prompt::kAnyPromptPattern, out, readErr)) {
        err = {CliErrorKind::Preparation, "No output from device: " + readErr.message};
        return false;
    }
    if (prompt::trim(out).empty()) {
        err = {CliErrorKind::Preparation, "Empty output from device"};
        return false;
    }
    return true;
}

bool CliSession::prepare(CliError& err) {
    if (personality_) {
        err = {CliErrorKind::Preparation, "Session already prepared"};
        return false;
    }
    if (!channel_.isConnected()) {
        err = {CliErrorKind::Preparation, "Channel not connected"};
        return false;
    }
    if (!testChannelRead(err))
        return false;

    std::string raw;
    CliError promptErr;
    if (!channel_.findPrompt(raw, promptErr)) {
        err = {CliErrorKind::Preparation, "Unable to capture prompt: " + promptErr.message};
        return false;
    }

    // Classified from the untouched prompt, before normalization
    std::unique_ptr<CliPersonality> personality = makePersonality(prompt::classifyPrompt(raw));
    rawPrompt_ = raw;

    std::string base;
    if (!prompt::normalizeBasePrompt(raw, base))
        qWarning(scSession) << "Prompt has an unexpected format, using it as is:" << raw.c_str();
    setBasePrompt(base);
    qInfo(scSession) << "Detected" << personality->name() << "CLI, base prompt" << basePrompt_.c_str();

    for (const std::string& cmd : personality->sessionSetupCommands(opt_.terminal_width)) {
        std::string out;
        if (!channel_.sendCommand(cmd, out, err))
            return false;
    }

    const double settle = opt_.settle_delay_s * channel_.tuning().global_delay_factor;
    if (settle > 0)
        std::this_thread::sleep_for(std::chrono::milliseconds(static_cast<long long>(settle * 1000.0)));
    if (!channel_.clearBuffer(err))
        return false;

    personality_ = std::move(personality);
    return true;
}

void CliSession::setBasePrompt(const std::string& prompt) {
    basePrompt_ = prompt;
    channel_.setBasePrompt(prompt);
}

bool CliSession::enterConfig(std::string& out, CliError& err,
                             const std::string& command,
                             const std::string& pattern) {
    out.clear();
    if (!requirePrepared(err))
        return false;
    // Classical CLI has no separate configuration mode
    if (!personality_->hasCandidateConfig())
        return true;

    qDebug(scSession) << configStateName(ConfigState::Operational) << "->"
                      << configStateName(ConfigState::ConfigEntering);
    if (!channel_.writeRaw(command + "\n", err))
        return false;
    std::string matched;
    if (!channel_.readUntilPattern(pattern, matched, err))
        return false;
    std::string rest;
    if (!channel_.readUntilPrompt(rest, err))
        return false;
    out = matched + rest;
    qDebug(scSession) << "->" << configStateName(prompt::configStateFromOutput(out));
    return true;
}

bool CliSession::checkConfigActive(bool& active, CliError& err) {
    active = false;
    if (!requirePrepared(err))
        return false;
    if (!personality_->hasCandidateConfig())
        return true;
    std::string out;
    if (!channel_.writeRaw("\n", err) || !channel_.readUntilPrompt(out, err))
        return false;
    active = personality_->configContextActive(out);
    return true;
}

bool CliSession::exitAll(std::string& out, CliError& err) {
    // Reading up to the echo keeps the buffer in step with the device
    return channel_.sendCommand("exit all", out, err);
}

bool CliSession::exitConfig(std::string& out, CliError& err) {
    out.clear();
    if (!requirePrepared(err))
        return false;

    std::string latest;
    if (!exitAll(latest, err))
        return false;
    out += latest;

    int rounds = 0;
    while (personality_->configContextActive(latest) && rounds < opt_.exit_config_max_attempts) {
        ++rounds;
        qDebug(scSession) << configStateName(prompt::configStateFromOutput(latest)) << "->"
                          << configStateName(ConfigState::ConfigExiting) << "round" << rounds;
        if (personality_->uncommittedChanges(latest)) {
            qWarning(scSession) << "Uncommitted changes! Discarding changes!";
            std::string discarded;
            if (!discard(discarded, err))
                return false;
            out += discarded;
        }
        if (!channel_.sendCommand("quit-config", latest, err))
            return false;
        out += latest;
    }

    bool active = false;
    if (!checkConfigActive(active, err))
        return false;
    if (active) {
        qWarning(scSession) << "Still in configuration mode after" << rounds << "exit rounds";
        err = {CliErrorKind::ExitConfig, "Failed to exit configuration mode"};
        return false;
    }
    return true;
}

bool CliSession::commit(std::string& out, CliError& err) {
    out.clear();
    if (!requirePrepared(err))
        return false;
    // commit is only accepted from the root context
    if (!exitAll(out, err))
        return false;
    if (!personality_->hasCandidateConfig() || !personality_->uncommittedChanges(out))
        return true;

    qInfo(scSession) << "Applying uncommitted changes";
    const std::string cmd = "commit";
    if (!channel_.writeRaw(cmd + "\n", err))
        return false;
    std::string fresh;
    if (channel_.tuning().cmd_verify &&
        !channel_.readUntilPattern(prompt::escapeRegex(cmd), fresh, err))
        return false;
    // commit may print progress before the prompt comes back
    if (fresh.find(prompt::kModelDrivenMarker) == std::string::npos) {
        std::string tail;
        if (!channel_.readUntilPattern(kModelDrivenPromptPattern, tail, err))
            return false;
        fresh += tail;
    }
    out += fresh;
    qDebug(scSession) << "commit transcript" << loggableTranscript(fresh).c_str();
    return true;
}

bool CliSession::discard(std::string& out, CliError& err) {
    out.clear();
    if (!requirePrepared(err))
        return false;
    if (!personality_->hasCandidateConfig())
        return true;
    return channel_.sendCommand("discard", out, err);
}

bool CliSession::sendConfigSet(const std::vector<std::string>& commands,
                               std::string& out,
                               CliError& err,
                               std::optional<bool> exitAfter) {
    out.clear();
    if (!requirePrepared(err))
        return false;
    const bool leave = exitAfter.value_or(personality_->exitConfigAfterSet());

    bool active = false;
    if (!checkConfigActive(active, err))
        return false;
    std::string text;
    if (!active) {
        if (!enterConfig(text, err))
            return false;
        out += text;
    }
    for (const std::string& cmd : commands) {
        if (prompt::trim(cmd).empty())
            continue;
        if (!channel_.sendCommand(cmd, text, err))
            return false;
        out += text;
    }
    if (leave) {
        if (!exitConfig(text, err))
            return false;
        out += text;
    }
    return true;
}

bool CliSession::saveConfig(std::string& out, CliError& err) {
    out.clear();
    if (!requirePrepared(err))
        return false;
    // Raw transcript, echo and prompt included
    return channel_.sendCommand("/admin save", out, err);
}

bool CliSession::sendCommand(const std::string& command, std::string& out, CliError& err) {
    out.clear();
    if (!requirePrepared(err))
        return false;
    std::string raw;
    if (!channel_.sendCommand(command, raw, err))
        return false;
    out = stripPrompt(prompt::stripCommandEcho(raw, command));
    return true;
}

std::string CliSession::stripPrompt(const std::string& output) const {
    const std::string stripped = prompt::stripTrailingPrompt(output, basePrompt_);
    if (!personality_)
        return stripped;
    return personality_->stripDecoration(stripped);
}

void CliSession::cleanup(const std::string& exitCommand) {
    if (personality_ && channel_.isConnected()) {
        CliError ignored;
        bool active = false;
        if (!checkConfigActive(active, ignored)) {
            qDebug(scSession) << "cleanup: config check failed:" << ignored.message.c_str();
        } else if (active) {
            std::string out;
            if (!exitConfig(out, ignored))
                qDebug(scSession) << "cleanup: exit config failed:" << ignored.message.c_str();
        }
    }
    // Final write is never confirmed: the device closes the session on logout
    CliError writeErr;
    if (!channel_.writeRaw(exitCommand + "\n", writeErr))
        qDebug(scSession) << "cleanup: logout not sent:" << writeErr.message.c_str();
    channel_.disconnect();
}

} // namespace sroscli
