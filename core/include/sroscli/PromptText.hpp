// Pure text functions: captured device output in, state fragment out.
// Nothing here touches a channel, so every rule can be checked against
// literal transcripts.
#pragma once
#include "SessionTypes.hpp"
#include <cstdint>
#include <string>

namespace sroscli {
namespace prompt {

// Character that marks the model-driven CLI in a prompt ("A:admin@node-1#")
constexpr char kModelDrivenMarker = '@';

// Fragment shown in front of the context path while in exclusive candidate
// mode; with a leading '*' the candidate holds uncommitted changes.
extern const char* const kConfigMarker;      // "(ex)["
extern const char* const kDirtyConfigMarker; // "*(ex)["
extern const char* const kFileNotFound;      // "File Not Found"

// Any shell prompt terminator at the end of the buffer, before the base
// prompt is known
extern const char* const kAnyPromptPattern;  // "[#>$][ \t]*$"

// Model-driven iff the raw prompt contains the marker
CliMode classifyPrompt(const std::string& rawPrompt);

// Strip the leading '*', a trailing '@' marker, ">..." navigation suffixes
// and the '#' terminator. On no match "out" is the raw prompt and the
// function returns false.
bool normalizeBasePrompt(const std::string& rawPrompt, std::string& out);

bool inConfigContext(const std::string& output);
bool hasUncommittedChanges(const std::string& output);
ConfigState configStateFromOutput(const std::string& output);

// Drop carriage returns and ANSI CSI escape sequences
std::string normalizeTerminalOutput(const std::string& raw);

std::string escapeRegex(const std::string& literal);

// Last non-empty line with surrounding whitespace removed
std::string lastLine(const std::string& output);
std::string trim(const std::string& s);

// Remove the first line if it carries the echoed command
std::string stripCommandEcho(const std::string& output, const std::string& command);
// Remove the last line if it contains the base prompt
std::string stripTrailingPrompt(const std::string& output, const std::string& basePrompt);
// Remove model-driven context breadcrumbs such as "*(ex)[/configure]"
std::string stripContextDecoration(const std::string& output);

// "   3 Dir(s)   961531904 bytes free." -> 961531904
bool parseFreeSpace(const std::string& output, const std::string& pattern,
                    std::uint64_t& bytes, CliError& err);
// "10/16/2019  10:00p   6738 config.cfg" -> 6738
bool parseListingSize(const std::string& output, const std::string& fileName,
                      std::uint64_t& size, CliError& err);

enum class ListingPresence { Missing, Present, Unknown };
ListingPresence classifyListing(const std::string& output, const std::string& fileName);

} // namespace prompt
} // namespace sroscli
