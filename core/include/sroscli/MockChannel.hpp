#pragma once
#include "ShellChannel.hpp"
#include <deque>
#include <map>
#include <string>
#include <vector>

namespace sroscli {

// Scripted device: every complete line written is looked up in the reply
// table and the reply is queued for reading. Replies for a command are
// consumed in order; the last one is repeated for further writes.
class MockChannel : public ShellChannel {
public:
    bool connect(const SessionOptions& opt, std::string& err) override;
    void disconnect() override;
    bool isConnected() const override { return connected_; }

    // Output delivered right after connect (login banner + first prompt)
    void setBanner(const std::string& text) { banner_ = text; }
    void respond(const std::string& command, const std::string& reply);
    // Push output that was not triggered by a write
    void inject(const std::string& text) { pending_ += text; }

    // Lines written so far, without line terminators
    const std::vector<std::string>& writes() const { return writes_; }
    // Bytes written by writeRaw that never got a newline
    const std::string& partialWrite() const { return line_; }

protected:
    bool readSome(std::string& chunk, int waitMs, CliError& err) override;
    bool writeSome(const std::string& data, CliError& err) override;

private:
    bool connected_ = false;
    SessionOptions lastOpt_{};
    std::string banner_;
    std::string pending_;
    std::string line_;
    std::vector<std::string> writes_;
    std::map<std::string, std::deque<std::string>> replies_;
};

} // namespace sroscli
