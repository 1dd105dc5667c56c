#include "sroscli/TransferVerifier.hpp"
#include "sroscli/PromptText.hpp"

#include <QLoggingCategory>

#include <filesystem>
#include <system_error>

Q_LOGGING_CATEGORY(scTransfer, "sroscli.transfer")

namespace fs = std::filesystem;

namespace sroscli {

namespace {

std::string joinRemotePath(const std::string& base, const std::string& name) {
    if (base.empty())
        return name;
    if (base.back() == '/')
        return base + name;
    return base + "/" + name;
}

// The listing shows the bare file name even when asked for "dir/file"
std::string listingName(const std::string& file) {
    const std::size_t slash = file.find_last_of('/');
    return slash == std::string::npos ? file : file.substr(slash + 1);
}

} // namespace

TransferVerifier::TransferVerifier(CliSession& session, TransferSpec spec)
    : session_(session), spec_(std::move(spec)) {}

std::string TransferVerifier::commandPrefix() const {
    const CliPersonality* personality = session_.personality();
    if (!personality)
        return {};
    return personality->classicCommandPrefix();
}

std::string TransferVerifier::dirCommand(const std::string& target) const {
    return commandPrefix() + "file dir " + target;
}

bool TransferVerifier::remoteSpaceAvailable(std::uint64_t& bytes, CliError& err,
                                            const std::string& pattern) {
    // "               3 Dir(s)               961531904 bytes free."
    std::string out;
    if (!session_.sendCommand(dirCommand(spec_.file_system), out, err))
        return false;
    return prompt::parseFreeSpace(out, pattern, bytes, err);
}

bool TransferVerifier::verifySpaceAvailable(bool& enough, CliError& err) {
    enough = false;
    if (spec_.direction == TransferDirection::Put) {
        std::uint64_t need = 0;
        std::uint64_t avail = 0;
        if (!localFileSize(spec_.source_file, need, err) || !remoteSpaceAvailable(avail, err))
            return false;
        enough = avail >= need;
        qInfo(scTransfer) << "remote space" << static_cast<qulonglong>(avail) << "needed"
                          << static_cast<qulonglong>(need);
        return true;
    }

    std::uint64_t need = 0;
    if (!remoteFileSize(spec_.source_file, need, err))
        return false;
    fs::path dir = fs::path(spec_.dest_file).parent_path();
    if (dir.empty())
        dir = ".";
    std::error_code ec;
    const fs::space_info info = fs::space(dir, ec);
    if (ec) {
        err = {CliErrorKind::IO, "Unable to query local free space: " + ec.message()};
        return false;
    }
    enough = info.available >= need;
    qInfo(scTransfer) << "local space" << static_cast<qulonglong>(info.available) << "needed"
                      << static_cast<qulonglong>(need);
    return true;
}

bool TransferVerifier::checkFileExists(bool& exists, CliError& err) {
    exists = false;
    if (spec_.direction == TransferDirection::Get) {
        std::error_code ec;
        exists = fs::exists(spec_.dest_file, ec);
        if (ec) {
            err = {CliErrorKind::IO, "Unable to check local file: " + ec.message()};
            return false;
        }
        return true;
    }

    std::string out;
    if (!session_.sendCommand(dirCommand(joinRemotePath(spec_.file_system, spec_.dest_file)), out, err))
        return false;
    switch (prompt::classifyListing(out, listingName(spec_.dest_file))) {
    case prompt::ListingPresence::Missing:
        return true;
    case prompt::ListingPresence::Present:
        exists = true;
        return true;
    case prompt::ListingPresence::Unknown:
        break;
    }
    err = {CliErrorKind::UnexpectedOutput, "Unexpected output from check_file_exists"};
    return false;
}

bool TransferVerifier::remoteFileSize(const std::string& remoteFile, std::uint64_t& size, CliError& err) {
    size = 0;
    std::string out;
    if (!session_.sendCommand(dirCommand(joinRemotePath(spec_.file_system, remoteFile)), out, err))
        return false;
    if (out.find(prompt::kFileNotFound) != std::string::npos) {
        err = {CliErrorKind::IO, "Unable to find file on remote system: " + remoteFile};
        return false;
    }
    // "10/16/2019  10:00p                6738 {filename}"
    return prompt::parseListingSize(out, listingName(remoteFile), size, err);
}

bool TransferVerifier::remoteFileSize(std::uint64_t& size, CliError& err) {
    return remoteFileSize(spec_.direction == TransferDirection::Put ? spec_.dest_file
                                                                    : spec_.source_file,
                          size, err);
}

bool TransferVerifier::verifyFile(bool& match, CliError& err) {
    match = false;
    std::uint64_t local = 0;
    std::uint64_t remote = 0;
    if (spec_.direction == TransferDirection::Put) {
        if (!localFileSize(spec_.source_file, local, err) ||
            !remoteFileSize(spec_.dest_file, remote, err))
            return false;
    } else {
        if (!remoteFileSize(spec_.source_file, remote, err) ||
            !localFileSize(spec_.dest_file, local, err))
            return false;
    }
    match = local == remote;
    if (!match)
        qWarning(scTransfer) << "size mismatch: local" << static_cast<qulonglong>(local)
                             << "remote" << static_cast<qulonglong>(remote);
    return true;
}

bool TransferVerifier::compareChecksum(bool& match, CliError& err) {
    qDebug(scTransfer) << "no remote hash command on this platform, comparing sizes";
    return verifyFile(match, err);
}

bool TransferVerifier::localFileSize(const std::string& path, std::uint64_t& size, CliError& err) {
    std::error_code ec;
    const std::uintmax_t n = fs::file_size(path, ec);
    if (ec) {
        err = {CliErrorKind::IO, "Unable to read local file size of " + path + ": " + ec.message()};
        return false;
    }
    size = static_cast<std::uint64_t>(n);
    return true;
}

} // namespace sroscli
