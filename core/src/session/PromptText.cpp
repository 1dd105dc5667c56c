#include "sroscli/PromptText.hpp"
#include <cctype>
#include <regex>
#include <stdexcept>

namespace sroscli {
namespace prompt {

const char* const kConfigMarker = "(ex)[";
const char* const kDirtyConfigMarker = "*(ex)[";
const char* const kFileNotFound = "File Not Found";
const char* const kAnyPromptPattern = R"([#>$][ \t]*$)";

namespace {

// optional '*', lazy core, optional '@' marker, ">..." navigation, '#'.
// One optional suffix group: ".*" already spans nested ">a>b" levels.
const std::regex& basePromptRe() {
    static const std::regex re(R"(^\*?(.*?)@?(>.*)?#)");
    return re;
}

// "!" (changed), "*" (uncommitted), (ex|gl|pr|ro) context tag, [path]
const std::regex& contextDecorationRe() {
    static const std::regex re(R"([\r\n]*!?\*?(\((ex|gl|pr|ro)\))?\[\S*\][\r\n]*)");
    return re;
}

bool toUnsigned(const std::string& digits, std::uint64_t& value, CliError& err) {
    try {
        std::size_t used = 0;
        const unsigned long long v = std::stoull(digits, &used);
        if (used != digits.size()) {
            err = {CliErrorKind::Parse, "Not a number: " + digits};
            return false;
        }
        value = static_cast<std::uint64_t>(v);
        return true;
    } catch (const std::invalid_argument&) {
        err = {CliErrorKind::Parse, "Not a number: " + digits};
    } catch (const std::out_of_range&) {
        err = {CliErrorKind::Parse, "Number out of range: " + digits};
    }
    return false;
}

} // namespace

CliMode classifyPrompt(const std::string& rawPrompt) {
    return rawPrompt.find(kModelDrivenMarker) != std::string::npos
               ? CliMode::ModelDriven
               : CliMode::Classical;
}

bool normalizeBasePrompt(const std::string& rawPrompt, std::string& out) {
    const std::string p = trim(rawPrompt);
    std::smatch m;
    if (std::regex_search(p, m, basePromptRe()) && m[1].length() > 0) {
        out = m[1].str();
        return true;
    }
    out = rawPrompt;
    return false;
}

bool inConfigContext(const std::string& output) {
    return output.find(kConfigMarker) != std::string::npos;
}

bool hasUncommittedChanges(const std::string& output) {
    return output.find(kDirtyConfigMarker) != std::string::npos;
}

ConfigState configStateFromOutput(const std::string& output) {
    if (hasUncommittedChanges(output))
        return ConfigState::ConfigDirty;
    if (inConfigContext(output))
        return ConfigState::ConfigActive;
    return ConfigState::Operational;
}

std::string normalizeTerminalOutput(const std::string& raw) {
    std::string out;
    out.reserve(raw.size());
    std::size_t i = 0;
    while (i < raw.size()) {
        const char c = raw[i];
        if (c == '\r') {
            ++i;
            continue;
        }
        if (c != '\x1b') {
            out.push_back(c);
            ++i;
            continue;
        }
        // Incomplete sequence at the end: keep it until the rest arrives
        if (i + 1 >= raw.size()) {
            out.append(raw, i, std::string::npos);
            break;
        }
        if (raw[i + 1] != '[') {
            i += 2; // two-byte escape (ESC 7, ESC =, ...)
            continue;
        }
        std::size_t j = i + 2;
        while (j < raw.size() && raw[j] >= 0x20 && raw[j] <= 0x3f)
            ++j; // parameters and intermediates
        if (j >= raw.size()) {
            out.append(raw, i, std::string::npos);
            break;
        }
        i = j + 1; // final byte
    }
    return out;
}

std::string escapeRegex(const std::string& literal) {
    static const std::string special = R"(\^$.|?*+()[]{})";
    std::string out;
    out.reserve(literal.size() * 2);
    for (char c : literal) {
        if (special.find(c) != std::string::npos)
            out.push_back('\\');
        out.push_back(c);
    }
    return out;
}

std::string trim(const std::string& s) {
    std::size_t start = 0;
    while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start])))
        ++start;
    std::size_t end = s.size();
    while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1])))
        --end;
    return s.substr(start, end - start);
}

std::string lastLine(const std::string& output) {
    std::size_t end = output.size();
    while (end > 0) {
        const std::size_t nl = output.rfind('\n', end - 1);
        const std::size_t begin = (nl == std::string::npos) ? 0 : nl + 1;
        const std::string line = trim(output.substr(begin, end - begin));
        if (!line.empty())
            return line;
        if (nl == std::string::npos)
            break;
        end = nl;
    }
    return {};
}

std::string stripCommandEcho(const std::string& output, const std::string& command) {
    const std::string cmd = trim(command);
    if (cmd.empty())
        return output;
    // Skip blank lines left over from the previous prompt
    std::size_t begin = 0;
    while (begin < output.size() && output[begin] == '\n')
        ++begin;
    const std::size_t nl = output.find('\n', begin);
    const std::string first = output.substr(begin, nl == std::string::npos ? std::string::npos : nl - begin);
    if (first.find(cmd) == std::string::npos)
        return output;
    return nl == std::string::npos ? std::string() : output.substr(nl + 1);
}

std::string stripTrailingPrompt(const std::string& output, const std::string& basePrompt) {
    if (basePrompt.empty())
        return output;
    std::size_t end = output.size();
    while (end > 0 && std::isspace(static_cast<unsigned char>(output[end - 1])))
        --end;
    const std::size_t nl = (end == 0) ? std::string::npos : output.rfind('\n', end - 1);
    const std::size_t begin = (nl == std::string::npos) ? 0 : nl + 1;
    if (output.substr(begin, end - begin).find(basePrompt) != std::string::npos) {
        return nl == std::string::npos ? std::string() : output.substr(0, nl);
    }
    return output;
}

std::string stripContextDecoration(const std::string& output) {
    return std::regex_replace(output, contextDecorationRe(), "");
}

bool parseFreeSpace(const std::string& output, const std::string& pattern,
                    std::uint64_t& bytes, CliError& err) {
    std::regex re;
    try {
        re.assign(pattern);
    } catch (const std::regex_error& e) {
        err = {CliErrorKind::Parse, "Invalid free space pattern: " + std::string(e.what())};
        return false;
    }
    std::smatch m;
    if (!std::regex_search(output, m, re) || m.size() < 2) {
        err = {CliErrorKind::Parse, "Free space not found in dir output"};
        return false;
    }
    return toUnsigned(m[1].str(), bytes, err);
}

bool parseListingSize(const std::string& output, const std::string& fileName,
                      std::uint64_t& size, CliError& err) {
    const std::regex re(R"(\S+\s+\S+\s+(\d+)\s+)" + escapeRegex(fileName) + R"((?=\s|$))");
    std::smatch m;
    if (!std::regex_search(output, m, re)) {
        err = {CliErrorKind::Parse, "Filename entry not found in dir output: " + fileName};
        return false;
    }
    return toUnsigned(m[1].str(), size, err);
}

ListingPresence classifyListing(const std::string& output, const std::string& fileName) {
    if (output.find(kFileNotFound) != std::string::npos)
        return ListingPresence::Missing;
    if (!fileName.empty() && output.find(fileName) != std::string::npos)
        return ListingPresence::Present;
    return ListingPresence::Unknown;
}

} // namespace prompt

} // namespace sroscli
