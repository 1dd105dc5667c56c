// Post-transfer checks driven through the device CLI. The platform has no
// remote hash command: "checksum" comparison is a file size comparison.
#pragma once
#include "CliSession.hpp"
#include "SessionTypes.hpp"
#include <cstdint>
#include <string>

namespace sroscli {

class TransferVerifier {
public:
    // The session must be prepared and outlive the verifier
    TransferVerifier(CliSession& session, TransferSpec spec);

    const TransferSpec& spec() const { return spec_; }

    // "//" on the model-driven CLI, empty otherwise. No device interaction.
    std::string commandPrefix() const;

    bool remoteSpaceAvailable(std::uint64_t& bytes, CliError& err,
                              const std::string& pattern = R"((\d+)\s+\w+\s+free)");
    // Put: remote free space >= local source size.
    // Get: local free space >= remote source size.
    bool verifySpaceAvailable(bool& enough, CliError& err);

    bool checkFileExists(bool& exists, CliError& err);

    bool remoteFileSize(const std::string& remoteFile, std::uint64_t& size, CliError& err);
    // Destination file for Put, source file for Get
    bool remoteFileSize(std::uint64_t& size, CliError& err);

    bool verifyFile(bool& match, CliError& err);

    // Size equality only; see class comment
    bool compareChecksum(bool& match, CliError& err);

    static bool localFileSize(const std::string& path, std::uint64_t& size, CliError& err);

private:
    CliSession& session_;
    TransferSpec spec_;

    std::string dirCommand(const std::string& target) const;
};

} // namespace sroscli
