// Prompt/pattern primitives shared by every backend. Subclasses only move
// bytes (readSome/writeSome); buffering, regex matching and deadlines live here.
#pragma once
#include "Channel.hpp"
#include <string>

namespace sroscli {

class ShellChannel : public Channel {
public:
    bool readUntilPattern(const std::string& pattern,
                          std::string& out,
                          CliError& err,
                          int timeoutMs = -1) override;
    bool readUntilPrompt(std::string& out, CliError& err, int timeoutMs = -1) override;
    bool writeRaw(const std::string& data, CliError& err) override;
    bool sendCommand(const std::string& command, std::string& out, CliError& err) override;
    bool findPrompt(std::string& prompt, CliError& err) override;

    void setBasePrompt(const std::string& prompt) override { basePrompt_ = prompt; }
    const std::string& basePrompt() const override { return basePrompt_; }

    bool clearBuffer(CliError& err) override;

    const ChannelTuning& tuning() const override { return tuning_; }
    void setTuning(const ChannelTuning& t) { tuning_ = t; }

    // Regex the prompt read waits for: base prompt anchored at the end of
    // the buffer, or a bare "#"/">" terminator before the base is known.
    std::string promptPattern() const;

protected:
    // Append whatever arrives within waitMs to "chunk" (may stay empty).
    // Returns false only on transport failure.
    virtual bool readSome(std::string& chunk, int waitMs, CliError& err) = 0;
    virtual bool writeSome(const std::string& data, CliError& err) = 0;

    // Forget buffered output (called by backends on connect/disconnect)
    void resetBuffer() { buffer_.clear(); }

private:
    std::string buffer_;
    std::string basePrompt_;
    ChannelTuning tuning_;
};

} // namespace sroscli
