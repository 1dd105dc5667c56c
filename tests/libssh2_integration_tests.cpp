// Integration tests for Libssh2Channel + CliSession against a real SR OS node.
// The test is skipped (exit code 77) unless required SROSCLI_IT_* env vars
// exist. Nothing is committed: the candidate is discarded on exit.
#include "sroscli/CliSession.hpp"
#include "sroscli/Libssh2Channel.hpp"
#include "sroscli/PromptText.hpp"
#include "sroscli/TransferVerifier.hpp"

#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>

namespace fs = std::filesystem;

namespace {

constexpr int kSkipExitCode = 77;

struct TestContext {
    int failures = 0;

    void check(bool cond, const std::string &msg) {
        if (!cond) {
            ++failures;
            std::cerr << "[FAIL] " << msg << "\n";
        }
    }
};

std::optional<std::string> envValue(const char *key) {
    const char *raw = std::getenv(key);
    if (!raw || !*raw)
        return std::nullopt;
    return std::string(raw);
}

bool parsePort(const std::optional<std::string> &raw, std::uint16_t &out) {
    if (!raw.has_value()) {
        out = 22;
        return true;
    }
    try {
        const int n = std::stoi(*raw);
        if (n < 1 || n > 65535)
            return false;
        out = static_cast<std::uint16_t>(n);
        return true;
    } catch (const std::invalid_argument &) {
        return false;
    } catch (const std::out_of_range &) {
        return false;
    }
}

} // namespace

int main() {
    const auto host = envValue("SROSCLI_IT_HOST");
    const auto user = envValue("SROSCLI_IT_USER");
    const auto pass = envValue("SROSCLI_IT_PASS");
    const auto keyPath = envValue("SROSCLI_IT_KEY");
    const auto keyPassphrase = envValue("SROSCLI_IT_KEY_PASSPHRASE");
    const std::string fileSystem = envValue("SROSCLI_IT_FILE_SYSTEM").value_or("cf3:");

    if (!host.has_value() || !user.has_value() ||
        (!pass.has_value() && !keyPath.has_value())) {
        std::cout << "[SKIP] sroscli_ssh_integration_tests requires env vars: "
                  << "SROSCLI_IT_HOST, SROSCLI_IT_USER and one auth method "
                  << "(SROSCLI_IT_PASS or SROSCLI_IT_KEY)\n";
        return kSkipExitCode;
    }
    if (keyPath.has_value() && !fs::exists(*keyPath)) {
        std::cerr << "[FAIL] SROSCLI_IT_KEY does not exist: " << *keyPath << "\n";
        return EXIT_FAILURE;
    }

    std::uint16_t port = 22;
    if (!parsePort(envValue("SROSCLI_IT_PORT"), port)) {
        std::cerr << "[FAIL] SROSCLI_IT_PORT is invalid\n";
        return EXIT_FAILURE;
    }

    TestContext t;
    sroscli::SessionOptions opt;
    opt.host = *host;
    opt.port = port;
    opt.username = *user;
    if (pass.has_value())
        opt.password = *pass;
    if (keyPath.has_value()) {
        opt.private_key_path = *keyPath;
        if (keyPassphrase.has_value())
            opt.private_key_passphrase = *keyPassphrase;
    }
    opt.known_hosts_policy = sroscli::KnownHostsPolicy::Off;
    opt.tuning.read_timeout_ms = 20000;

    sroscli::Libssh2Channel channel;
    sroscli::CliSession session(channel);
    std::string err;
    sroscli::CliError cerr;

    const bool connected = channel.connect(opt, err);
    t.check(connected, std::string("connect should succeed: ") + err);
    if (t.failures == 0) {
        t.check(session.prepare(cerr),
                std::string("prepare should succeed: ") + cerr.message);
    }
    if (t.failures == 0) {
        t.check(!session.basePrompt().empty(), "base prompt should be detected");
        t.check(session.basePrompt().find('#') == std::string::npos,
                "base prompt should not keep the terminator");
        std::cout << "[INFO] " << session.personality()->name() << " CLI, base prompt "
                  << session.basePrompt() << "\n";
    }
    if (t.failures == 0) {
        std::string out;
        cerr.clear();
        t.check(session.sendCommand("show uptime", out, cerr),
                std::string("show uptime should succeed: ") + cerr.message);
        t.check(out.find(session.basePrompt() + "#") == std::string::npos,
                "command output should not contain the prompt");
    }
    if (t.failures == 0) {
        std::string first;
        std::string second;
        cerr.clear();
        t.check(session.exitConfig(first, cerr),
                std::string("exitConfig should succeed: ") + cerr.message);
        cerr.clear();
        t.check(session.exitConfig(second, cerr),
                std::string("second exitConfig should succeed: ") + cerr.message);
        t.check(!sroscli::prompt::inConfigContext(second),
                "no config context after exitConfig");
    }
    if (t.failures == 0 && session.mode() == sroscli::CliMode::ModelDriven) {
        std::string out;
        cerr.clear();
        t.check(session.enterConfig(out, cerr),
                std::string("enterConfig should succeed: ") + cerr.message);
        bool active = false;
        cerr.clear();
        t.check(session.checkConfigActive(active, cerr) && active,
                "config mode should be active after enterConfig");
        cerr.clear();
        t.check(session.exitConfig(out, cerr),
                std::string("exitConfig from config should succeed: ") + cerr.message);
    }
    if (t.failures == 0) {
        sroscli::TransferSpec spec;
        spec.file_system = fileSystem;
        sroscli::TransferVerifier verifier(session, spec);
        std::uint64_t freeBytes = 0;
        cerr.clear();
        t.check(verifier.remoteSpaceAvailable(freeBytes, cerr),
                std::string("free space should parse: ") + cerr.message);
        t.check(freeBytes > 0, "file system should report free space");
    }

    // Always leave the node as found, whatever failed above.
    session.cleanup();

    if (t.failures != 0) {
        std::cerr << "[FAILURES] " << t.failures << "\n";
        return EXIT_FAILURE;
    }
    std::cout << "[OK] sroscli_ssh_integration_tests\n";
    return EXIT_SUCCESS;
}
