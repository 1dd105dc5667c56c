// Abstract interactive channel to a device CLI. Concrete backends (libssh2,
// mock) implement this API so CliSession stays decoupled from the transport.
#pragma once
#include "SessionTypes.hpp"
#include <string>

namespace sroscli {

class Channel {
public:
    virtual ~Channel() = default;

    // Connect and disconnect
    virtual bool connect(const SessionOptions& opt, std::string& err) = 0;
    virtual void disconnect() = 0;
    virtual bool isConnected() const = 0;

    // Block until "pattern" (ECMAScript regex) matches the buffered output.
    // "out" receives everything up to the end of the match; the rest stays
    // buffered. timeoutMs < 0 uses tuning().read_timeout_ms.
    virtual bool readUntilPattern(const std::string& pattern,
                                  std::string& out,
                                  CliError& err,
                                  int timeoutMs = -1) = 0;

    // Same as readUntilPattern with the prompt pattern (base prompt once known).
    virtual bool readUntilPrompt(std::string& out, CliError& err, int timeoutMs = -1) = 0;

    // Send bytes as-is (no newline added)
    virtual bool writeRaw(const std::string& data, CliError& err) = 0;

    // Write command + newline, wait for echo (if enabled) and prompt. Raw output.
    virtual bool sendCommand(const std::string& command, std::string& out, CliError& err) = 0;

    // Send a newline and return the last non-empty line that came back
    virtual bool findPrompt(std::string& prompt, CliError& err) = 0;

    virtual void setBasePrompt(const std::string& prompt) = 0;
    virtual const std::string& basePrompt() const = 0;

    // Drop buffered and pending output
    virtual bool clearBuffer(CliError& err) = 0;

    virtual const ChannelTuning& tuning() const = 0;
};

} // namespace sroscli
