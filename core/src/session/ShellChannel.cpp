// Buffered prompt primitives: every read accumulates into one buffer and
// consumes it up to the end of the first match.
#include "sroscli/ShellChannel.hpp"
#include "sroscli/PromptText.hpp"
#include "sroscli/RuntimeLogging.hpp"

#include <QLoggingCategory>

#include <algorithm>
#include <chrono>
#include <regex>

Q_LOGGING_CATEGORY(scChannel, "sroscli.channel")

namespace sroscli {

namespace {
constexpr int kPollSliceMs = 50;
constexpr int kMaxDrainRounds = 64;
} // namespace

std::string ShellChannel::promptPattern() const {
    if (basePrompt_.empty())
        return R"([#>][ \t]*$)";
    return prompt::escapeRegex(basePrompt_) + R"([^\n]*[#>][ \t]*$)";
}

bool ShellChannel::readUntilPattern(const std::string& pattern,
                                    std::string& out,
                                    CliError& err,
                                    int timeoutMs) {
    if (!isConnected()) {
        err = {CliErrorKind::Channel, "Not connected"};
        return false;
    }
    std::regex re;
    try {
        re.assign(pattern);
    } catch (const std::regex_error& e) {
        err = {CliErrorKind::Channel, "Invalid read pattern '" + pattern + "': " + e.what()};
        return false;
    }

    using clock = std::chrono::steady_clock;
    const int budget = timeoutMs < 0 ? tuning_.read_timeout_ms : timeoutMs;
    const auto deadline = clock::now() + std::chrono::milliseconds(budget);

    for (;;) {
        std::smatch m;
        if (std::regex_search(buffer_, m, re)) {
            const std::size_t end = static_cast<std::size_t>(m.position(0) + m.length(0));
            out = buffer_.substr(0, end);
            buffer_.erase(0, end);
            qDebug(scChannel) << "read matched" << pattern.c_str()
                              << loggableTranscript(out).c_str();
            return true;
        }
        const auto now = clock::now();
        if (now >= deadline) {
            qWarning(scChannel) << "read timed out after" << budget << "ms waiting for"
                                << pattern.c_str();
            err = {CliErrorKind::Timeout, "Timed out waiting for pattern: " + pattern};
            return false;
        }
        const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
        const int waitMs = std::min(static_cast<int>(left.count()), kPollSliceMs);
        std::string chunk;
        if (!readSome(chunk, waitMs, err))
            return false;
        if (!chunk.empty())
            buffer_ = prompt::normalizeTerminalOutput(buffer_ + chunk);
    }
}

bool ShellChannel::readUntilPrompt(std::string& out, CliError& err, int timeoutMs) {
    return readUntilPattern(promptPattern(), out, err, timeoutMs);
}

bool ShellChannel::writeRaw(const std::string& data, CliError& err) {
    if (!isConnected()) {
        err = {CliErrorKind::Channel, "Not connected"};
        return false;
    }
    qDebug(scChannel) << "write" << loggableTranscript(data).c_str();
    return writeSome(data, err);
}

bool ShellChannel::sendCommand(const std::string& command, std::string& out, CliError& err) {
    if (!writeRaw(command + "\n", err))
        return false;
    std::string echo;
    if (tuning_.cmd_verify && !prompt::trim(command).empty()) {
        if (!readUntilPattern(prompt::escapeRegex(prompt::trim(command)), echo, err))
            return false;
    }
    std::string rest;
    if (!readUntilPrompt(rest, err))
        return false;
    out = echo + rest;
    return true;
}

bool ShellChannel::findPrompt(std::string& found, CliError& err) {
    if (!writeRaw("\n", err))
        return false;
    std::string out;
    if (!readUntilPattern(prompt::kAnyPromptPattern, out, err))
        return false;
    found = prompt::lastLine(out);
    if (found.empty()) {
        err = {CliErrorKind::Channel, "Unable to find prompt"};
        return false;
    }
    return true;
}

bool ShellChannel::clearBuffer(CliError& err) {
    if (!isConnected()) {
        err = {CliErrorKind::Channel, "Not connected"};
        return false;
    }
    std::size_t dropped = buffer_.size();
    for (int i = 0; i < kMaxDrainRounds; ++i) {
        std::string chunk;
        if (!readSome(chunk, 0, err))
            return false;
        if (chunk.empty())
            break;
        dropped += chunk.size();
    }
    buffer_.clear();
    if (dropped > 0)
        qDebug(scChannel) << "cleared" << dropped << "buffered bytes";
    return true;
}

} // namespace sroscli
