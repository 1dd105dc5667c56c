// libssh2 backend: TCP socket, SSH session and an interactive PTY shell.
// Includes keepalive, known_hosts validation and non-blocking shell reads.
#include "sroscli/Libssh2Channel.hpp"
#include <libssh2.h>

#include <QLoggingCategory>

#include <cerrno>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

// POSIX sockets
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <sys/select.h>
#include <sys/socket.h>
#include <sys/types.h>
#include <unistd.h>

Q_DECLARE_LOGGING_CATEGORY(scChannel)

namespace sroscli {

// libssh2 global init (once per process)
static bool g_libssh2_inited = false;

// Context for keyboard-interactive: answers user or password by prompt text
struct KbdIntCtx {
    const char* user;
    const char* pass;
    const KbdIntPromptsCB* cb; // optional caller callback
};

static char* dupResponse(const std::string& s, unsigned int& len) {
    len = 0;
    if (s.empty())
        return nullptr;
    char* buf = static_cast<char*>(std::malloc(s.size() + 1));
    if (!buf)
        return nullptr;
    std::memcpy(buf, s.data(), s.size());
    buf[s.size()] = '\0';
    len = static_cast<unsigned int>(s.size());
    return buf;
}

static void kbint_password_callback(const char* name, int name_len,
                                    const char* instruction, int instruction_len,
                                    int num_prompts,
                                    const LIBSSH2_USERAUTH_KBDINT_PROMPT* prompts,
                                    LIBSSH2_USERAUTH_KBDINT_RESPONSE* responses,
                                    void** abstract) {
    if (!abstract || !*abstract) return;
    const KbdIntCtx* ctx = static_cast<const KbdIntCtx*>(*abstract);

    if (ctx->cb && *(ctx->cb) && num_prompts > 0) {
        std::vector<std::string> ptxts;
        ptxts.reserve(static_cast<size_t>(num_prompts));
        for (int i = 0; i < num_prompts; ++i) {
            const char* pt = (prompts && prompts[i].text) ? reinterpret_cast<const char*>(prompts[i].text) : "";
            ptxts.emplace_back(pt);
        }
        std::vector<std::string> answers;
        std::string nm = (name && name_len > 0) ? std::string(name, static_cast<size_t>(name_len)) : std::string();
        std::string ins = (instruction && instruction_len > 0) ? std::string(instruction, static_cast<size_t>(instruction_len)) : std::string();
        if ((*(ctx->cb))(nm, ins, ptxts, answers) && static_cast<int>(answers.size()) >= num_prompts) {
            for (int i = 0; i < num_prompts; ++i)
                responses[i].text = dupResponse(answers[static_cast<size_t>(i)], responses[i].length);
            return;
        }
        // callback could not answer: fall back to the heuristic
    }
    for (int i = 0; i < num_prompts; ++i) {
        std::string prompt = (prompts && prompts[i].text) ? reinterpret_cast<const char*>(prompts[i].text) : "";
        for (char& c : prompt)
            if (c >= 'A' && c <= 'Z') c = static_cast<char>(c - 'A' + 'a');
        // "user"/"name" in the prompt asks for the user, anything else for the password
        const bool wantUser = prompt.find("user") != std::string::npos ||
                              prompt.find("name") != std::string::npos;
        const char* ans = wantUser ? ctx->user : ctx->pass;
        responses[i].text = dupResponse(ans ? std::string(ans) : std::string(), responses[i].length);
    }
}

static std::string lastSessionError(_LIBSSH2_SESSION* session) {
    char* emsg = nullptr;
    int emlen = 0;
    (void)libssh2_session_last_error(session, &emsg, &emlen, 0);
    return (emsg && emlen > 0) ? std::string(emsg, static_cast<size_t>(emlen)) : std::string();
}

Libssh2Channel::Libssh2Channel() {
    if (!g_libssh2_inited) {
        int rc = libssh2_init(0);
        (void)rc;
        g_libssh2_inited = true;
    }
}

Libssh2Channel::~Libssh2Channel() {
    disconnect();
}

bool Libssh2Channel::tcpConnect(const std::string& host, std::uint16_t port, std::string& err) {
    struct addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    char portStr[16];
    std::snprintf(portStr, sizeof(portStr), "%u", static_cast<unsigned>(port));

    struct addrinfo* res = nullptr;
    int gai = getaddrinfo(host.c_str(), portStr, &hints, &res);
    if (gai != 0) {
        err = std::string("getaddrinfo: ") + gai_strerror(gai);
        return false;
    }

    int s = -1;
    for (auto rp = res; rp != nullptr; rp = rp->ai_next) {
        s = ::socket(rp->ai_family, rp->ai_socktype, rp->ai_protocol);
        if (s == -1) continue;
        // TCP keepalive: long idle CLI sessions are common while an operator reviews output
        int opt = 1;
        ::setsockopt(s, SOL_SOCKET, SO_KEEPALIVE, &opt, sizeof(opt));
#ifdef __APPLE__
        int idle = 60;
        ::setsockopt(s, IPPROTO_TCP, TCP_KEEPALIVE, &idle, sizeof(idle));
#elif defined(__linux__)
        int idle = 60, intvl = 10, cnt = 3;
        ::setsockopt(s, IPPROTO_TCP, TCP_KEEPIDLE, &idle, sizeof(idle));
        ::setsockopt(s, IPPROTO_TCP, TCP_KEEPINTVL, &intvl, sizeof(intvl));
        ::setsockopt(s, IPPROTO_TCP, TCP_KEEPCNT, &cnt, sizeof(cnt));
#endif
        if (::connect(s, rp->ai_addr, rp->ai_addrlen) == 0) {
            sock_ = s;
            freeaddrinfo(res);
            return true;
        }
        ::close(s);
        s = -1;
    }
    freeaddrinfo(res);
    err = "Unable to connect to host/port";
    return false;
}

bool Libssh2Channel::verifyHostKey(const SessionOptions& opt, std::string& err) {
    if (opt.known_hosts_policy == KnownHostsPolicy::Off)
        return true;

    LIBSSH2_KNOWNHOSTS* nh = libssh2_knownhost_init(session_);
    if (!nh) {
        err = "Unable to initialize known_hosts";
        return false;
    }

    std::string khPath;
    if (opt.known_hosts_path.has_value()) {
        khPath = *opt.known_hosts_path;
    } else {
        const char* home = std::getenv("HOME");
        if (home) khPath = std::string(home) + "/.ssh/known_hosts";
    }

    bool khLoaded = false;
    if (!khPath.empty())
        khLoaded = (libssh2_knownhost_readfile(nh, khPath.c_str(), LIBSSH2_KNOWNHOST_FILE_OPENSSH) >= 0);
    if (!khLoaded && opt.known_hosts_policy == KnownHostsPolicy::Strict) {
        libssh2_knownhost_free(nh);
        err = "known_hosts missing or unreadable (strict policy)";
        return false;
    }

    size_t keylen = 0;
    int keytype = 0;
    const char* hostkey = libssh2_session_hostkey(session_, &keylen, &keytype);
    if (!hostkey || keylen == 0) {
        libssh2_knownhost_free(nh);
        err = "Unable to read host key";
        return false;
    }

    int alg = 0;
    std::string algName;
    switch (keytype) {
        case LIBSSH2_HOSTKEY_TYPE_RSA:
            alg = LIBSSH2_KNOWNHOST_KEY_SSHRSA;
            algName = "RSA";
            break;
        case LIBSSH2_HOSTKEY_TYPE_DSS:
            alg = LIBSSH2_KNOWNHOST_KEY_SSHDSS;
            algName = "DSA";
            break;
#ifdef LIBSSH2_KNOWNHOST_KEY_ECDSA_256
        case LIBSSH2_HOSTKEY_TYPE_ECDSA_256:
            alg = LIBSSH2_KNOWNHOST_KEY_ECDSA_256;
            algName = "ECDSA-256";
            break;
        case LIBSSH2_HOSTKEY_TYPE_ECDSA_384:
            alg = LIBSSH2_KNOWNHOST_KEY_ECDSA_384;
            algName = "ECDSA-384";
            break;
        case LIBSSH2_HOSTKEY_TYPE_ECDSA_521:
            alg = LIBSSH2_KNOWNHOST_KEY_ECDSA_521;
            algName = "ECDSA-521";
            break;
#endif
#ifdef LIBSSH2_KNOWNHOST_KEY_ED25519
        case LIBSSH2_HOSTKEY_TYPE_ED25519:
            alg = LIBSSH2_KNOWNHOST_KEY_ED25519;
            algName = "ED25519";
            break;
#endif
        default:
            algName = "UNKNOWN";
            break;
    }

    const int typemask_plain = LIBSSH2_KNOWNHOST_TYPE_PLAIN | LIBSSH2_KNOWNHOST_KEYENC_RAW | alg;
    const int typemask_hash = LIBSSH2_KNOWNHOST_TYPE_SHA1 | LIBSSH2_KNOWNHOST_KEYENC_RAW | alg;

    struct libssh2_knownhost* host = nullptr;
    int check = libssh2_knownhost_checkp(nh, opt.host.c_str(), opt.port,
                                         hostkey, keylen, typemask_plain, &host);
    if (check != LIBSSH2_KNOWNHOST_CHECK_MATCH)
        check = libssh2_knownhost_checkp(nh, opt.host.c_str(), opt.port,
                                         hostkey, keylen, typemask_hash, &host);

    if (check == LIBSSH2_KNOWNHOST_CHECK_MATCH) {
        libssh2_knownhost_free(nh);
        return true;
    }

    if (opt.known_hosts_policy == KnownHostsPolicy::AcceptNew && check == LIBSSH2_KNOWNHOST_CHECK_NOTFOUND) {
        std::string fpStr;
#ifdef LIBSSH2_HOSTKEY_HASH_SHA256
        const int hashType = LIBSSH2_HOSTKEY_HASH_SHA256;
        const int hashLen = 32;
        const char* hashName = "SHA256:";
#else
        const int hashType = LIBSSH2_HOSTKEY_HASH_SHA1;
        const int hashLen = 20;
        const char* hashName = "SHA1:";
#endif
        const unsigned char* h = reinterpret_cast<const unsigned char*>(
            libssh2_hostkey_hash(session_, hashType));
        if (h) {
            std::ostringstream oss;
            oss << hashName;
            for (int i = 0; i < hashLen; ++i) {
                if (i) oss << ':';
                char b[4];
                std::snprintf(b, sizeof(b), "%02X", static_cast<unsigned>(h[i]));
                oss << b;
            }
            fpStr = oss.str();
        }
        const bool confirmed = opt.hostkey_confirm_cb &&
                               opt.hostkey_confirm_cb(opt.host, opt.port, algName, fpStr);
        if (!confirmed) {
            libssh2_knownhost_free(nh);
            err = "Unknown host: fingerprint not confirmed";
            return false;
        }
        if (khPath.empty()) {
            libssh2_knownhost_free(nh);
            err = "known_hosts path not defined";
            return false;
        }
        const int addMask = LIBSSH2_KNOWNHOST_TYPE_PLAIN | LIBSSH2_KNOWNHOST_KEYENC_RAW | alg;
        const int addrc = libssh2_knownhost_addc(nh, opt.host.c_str(), nullptr,
                                                 hostkey, keylen, nullptr, 0, addMask, nullptr);
        if (addrc != 0 || libssh2_knownhost_writefile(nh, khPath.c_str(), LIBSSH2_KNOWNHOST_FILE_OPENSSH) != 0) {
            libssh2_knownhost_free(nh);
            err = "Unable to add host to known_hosts";
            return false;
        }
        qInfo(scChannel) << "Added" << opt.host.c_str() << algName.c_str() << "key to known_hosts";
        libssh2_knownhost_free(nh);
        return true;
    }

    libssh2_knownhost_free(nh);
    // Only Strict fails on mismatch/notfound; AcceptNew handled NOTFOUND above
    if (opt.known_hosts_policy == KnownHostsPolicy::Strict || check == LIBSSH2_KNOWNHOST_CHECK_MISMATCH) {
        err = (check == LIBSSH2_KNOWNHOST_CHECK_MISMATCH)
                  ? "Host key does not match known_hosts"
                  : "Host unknown in known_hosts";
        return false;
    }
    return true;
}

bool Libssh2Channel::authenticateWithAgent(const std::string& username) {
    bool authed = false;
    LIBSSH2_AGENT* agent = libssh2_agent_init(session_);
    if (agent && libssh2_agent_connect(agent) == 0) {
        if (libssh2_agent_list_identities(agent) == 0) {
            struct libssh2_agent_publickey* identity = nullptr;
            struct libssh2_agent_publickey* prev = nullptr;
            int tries = 0;
            const int kMaxAgentTries = 3; // devices lock out after a few failed keys
            while (libssh2_agent_get_identity(agent, &identity, prev) == 0 && tries < kMaxAgentTries) {
                prev = identity;
                ++tries;
                int arc = -1;
                for (;;) {
                    arc = libssh2_agent_userauth(agent, username.c_str(), identity);
                    if (arc != LIBSSH2_ERROR_EAGAIN) break;
                    std::this_thread::sleep_for(std::chrono::milliseconds(50));
                }
                if (arc == 0) {
                    authed = true;
                    break;
                }
            }
        }
    }
    if (agent) {
        libssh2_agent_disconnect(agent);
        libssh2_agent_free(agent);
    }
    return authed;
}

bool Libssh2Channel::sshHandshakeAuth(const SessionOptions& opt, std::string& err) {
    session_ = libssh2_session_init();
    if (!session_) {
        err = "libssh2_session_init failed";
        return false;
    }

    if (libssh2_session_handshake(session_, sock_) != 0) {
        err = "SSH handshake failed: " + lastSessionError(session_);
        return false;
    }

    // Blocking mode until the shell is up
    libssh2_session_set_blocking(session_, 1);
    libssh2_session_set_timeout(session_, 20000);
    libssh2_keepalive_config(session_, 1, 30);

    if (!verifyHostKey(opt, err))
        return false;

    // Authentication order:
    // 1) private key file if given
    // 2) password, then keyboard-interactive if offered
    // 3) ssh-agent as last resort
    if (opt.private_key_path.has_value()) {
        const char* passphrase = opt.private_key_passphrase ? opt.private_key_passphrase->c_str() : nullptr;
        int rc = libssh2_userauth_publickey_fromfile(session_, opt.username.c_str(), nullptr,
                                                     opt.private_key_path->c_str(), passphrase);
        if (rc != 0) {
            err = "Public key authentication failed: " + lastSessionError(session_);
            return false;
        }
        return true;
    }

    std::string authlist;
    auto loadAuthList = [&]() {
        if (!authlist.empty()) return;
        char* methods = libssh2_userauth_list(session_, opt.username.c_str(),
                                              static_cast<unsigned>(opt.username.size()));
        authlist = methods ? std::string(methods) : std::string();
    };
    auto hasMethod = [&](const char* m) { return authlist.find(m) != std::string::npos; };

    if (opt.password.has_value()) {
        int rc_pw = -1;
        for (;;) {
            rc_pw = libssh2_userauth_password(session_, opt.username.c_str(), opt.password->c_str());
            if (rc_pw != LIBSSH2_ERROR_EAGAIN) break;
            std::this_thread::sleep_for(std::chrono::milliseconds(50));
        }
        if (rc_pw == 0)
            return true;
        // Server closed after the password attempt: nothing else will work
        if (rc_pw == LIBSSH2_ERROR_SOCKET_DISCONNECT ||
            rc_pw == LIBSSH2_ERROR_SOCKET_SEND ||
            rc_pw == LIBSSH2_ERROR_SOCKET_RECV) {
            err = "Server closed the connection after password authentication";
            return false;
        }

        loadAuthList();
        int rc_kbd = -1;
        if (hasMethod("keyboard-interactive")) {
            KbdIntCtx ctx{opt.username.c_str(), opt.password->c_str(), &opt.keyboard_interactive_cb};
            void** abs = libssh2_session_abstract(session_);
            if (abs) *abs = &ctx;
            for (;;) {
                rc_kbd = libssh2_userauth_keyboard_interactive(session_, opt.username.c_str(), kbint_password_callback);
                if (rc_kbd != LIBSSH2_ERROR_EAGAIN) break;
                std::this_thread::sleep_for(std::chrono::milliseconds(50));
            }
            if (abs) *abs = nullptr;
        }
        if (rc_kbd == 0)
            return true;
        if (hasMethod("publickey") && authenticateWithAgent(opt.username))
            return true;

        const std::string lastErr = lastSessionError(session_);
        err = std::string("Password/keyboard-interactive authentication failed") +
              (authlist.empty() ? std::string() : (" (methods: " + authlist + ")")) +
              (lastErr.empty() ? std::string() : (": " + lastErr)) +
              " [rc_pw=" + std::to_string(rc_pw) + ", rc_kbd=" + std::to_string(rc_kbd) + "]";
        return false;
    }

    loadAuthList();
    if (hasMethod("publickey") && authenticateWithAgent(opt.username))
        return true;
    err = "No credentials: key, agent and password unavailable";
    return false;
}

bool Libssh2Channel::openShell(const SessionOptions& opt, std::string& err) {
    channel_ = libssh2_channel_open_session(session_);
    if (!channel_) {
        err = "Unable to open session channel: " + lastSessionError(session_);
        return false;
    }
    // Wide PTY: narrow terminals make the device wrap lines and break prompt matching
    if (libssh2_channel_request_pty_ex(channel_, opt.term_type.c_str(),
                                       static_cast<unsigned int>(opt.term_type.size()),
                                       nullptr, 0, static_cast<int>(opt.term_width), 24, 0, 0) != 0) {
        err = "PTY request failed: " + lastSessionError(session_);
        return false;
    }
    if (libssh2_channel_shell(channel_) != 0) {
        err = "Shell request failed: " + lastSessionError(session_);
        return false;
    }
    // Reads poll with their own deadline from here on
    libssh2_session_set_blocking(session_, 0);
    return true;
}

bool Libssh2Channel::connect(const SessionOptions& opt, std::string& err) {
    if (connected_) {
        err = "Already connected";
        return false;
    }
    setTuning(opt.tuning);
    resetBuffer();
    if (!tcpConnect(opt.host, opt.port, err) ||
        !sshHandshakeAuth(opt, err) ||
        !openShell(opt, err)) {
        disconnect();
        return false;
    }
    connected_ = true;
    qInfo(scChannel) << "Shell open on" << opt.host.c_str() << "port" << opt.port;
    return true;
}

void Libssh2Channel::disconnect() {
    if (channel_) {
        libssh2_session_set_blocking(session_, 1);
        libssh2_channel_close(channel_);
        libssh2_channel_free(channel_);
        channel_ = nullptr;
    }
    if (session_) {
        libssh2_session_disconnect(session_, "bye");
        libssh2_session_free(session_);
        session_ = nullptr;
    }
    if (sock_ != -1) {
        ::close(sock_);
        sock_ = -1;
    }
    connected_ = false;
}

int Libssh2Channel::waitSocket(int waitMs) const {
    struct timeval timeout;
    timeout.tv_sec = waitMs / 1000;
    timeout.tv_usec = (waitMs % 1000) * 1000;

    fd_set fd;
    FD_ZERO(&fd);
    FD_SET(sock_, &fd);
    fd_set* readfd = nullptr;
    fd_set* writefd = nullptr;

    const int dir = libssh2_session_block_directions(session_);
    if (dir & LIBSSH2_SESSION_BLOCK_INBOUND)
        readfd = &fd;
    if (dir & LIBSSH2_SESSION_BLOCK_OUTBOUND)
        writefd = &fd;
    // No direction pending: wait for incoming data
    if (!readfd && !writefd)
        readfd = &fd;
    return ::select(sock_ + 1, readfd, writefd, nullptr, &timeout);
}

bool Libssh2Channel::readSome(std::string& chunk, int waitMs, CliError& err) {
    if (!connected_ || !channel_) {
        err = {CliErrorKind::Channel, "Not connected"};
        return false;
    }
    char buf[4096];
    for (;;) {
        const ssize_t n = libssh2_channel_read(channel_, buf, sizeof(buf));
        if (n > 0) {
            chunk.append(buf, static_cast<size_t>(n));
            continue;
        }
        if (n != 0 && n != LIBSSH2_ERROR_EAGAIN) {
            err = {CliErrorKind::Channel, "Channel read failed: " + lastSessionError(session_)};
            return false;
        }
        if (!chunk.empty())
            return true;
        if (libssh2_channel_eof(channel_)) {
            err = {CliErrorKind::Channel, "Channel closed by the device"};
            return false;
        }
        if (waitMs <= 0)
            return true;
        if (waitSocket(waitMs) < 0) {
            err = {CliErrorKind::Channel, std::string("select failed: ") + std::strerror(errno)};
            return false;
        }
        waitMs = 0; // one more read after the wait, then report what we have
    }
}

bool Libssh2Channel::writeSome(const std::string& data, CliError& err) {
    if (!connected_ || !channel_) {
        err = {CliErrorKind::Channel, "Not connected"};
        return false;
    }
    using clock = std::chrono::steady_clock;
    const auto deadline = clock::now() + std::chrono::milliseconds(tuning().read_timeout_ms);
    std::size_t sent = 0;
    while (sent < data.size()) {
        const ssize_t n = libssh2_channel_write(channel_, data.data() + sent, data.size() - sent);
        if (n > 0) {
            sent += static_cast<std::size_t>(n);
            continue;
        }
        if (n != LIBSSH2_ERROR_EAGAIN) {
            err = {CliErrorKind::Channel, "Channel write failed: " + lastSessionError(session_)};
            return false;
        }
        if (clock::now() >= deadline) {
            err = {CliErrorKind::Timeout, "Timed out writing to channel"};
            return false;
        }
        (void)waitSocket(100);
    }
    return true;
}

} // namespace sroscli
