#pragma once
#include "ShellChannel.hpp"
#include <cstdint>
#include <string>

// Forward declarations of the libssh2 internal types
struct _LIBSSH2_SESSION;
struct _LIBSSH2_CHANNEL;

namespace sroscli {

class Libssh2Channel : public ShellChannel {
public:
    Libssh2Channel();
    ~Libssh2Channel() override;

    bool connect(const SessionOptions& opt, std::string& err) override;
    void disconnect() override;
    bool isConnected() const override { return connected_; }

protected:
    bool readSome(std::string& chunk, int waitMs, CliError& err) override;
    bool writeSome(const std::string& data, CliError& err) override;

private:
    bool connected_ = false;
    int  sock_ = -1;
    _LIBSSH2_SESSION* session_ = nullptr;
    _LIBSSH2_CHANNEL* channel_ = nullptr;

    bool tcpConnect(const std::string& host, std::uint16_t port, std::string& err);
    bool sshHandshakeAuth(const SessionOptions& opt, std::string& err);
    bool verifyHostKey(const SessionOptions& opt, std::string& err);
    bool authenticateWithAgent(const std::string& username);
    bool openShell(const SessionOptions& opt, std::string& err);
    int waitSocket(int waitMs) const;
};

} // namespace sroscli
