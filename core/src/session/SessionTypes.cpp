#include "sroscli/SessionTypes.hpp"

namespace sroscli {

const char* cliErrorKindName(CliErrorKind kind) {
    switch (kind) {
    case CliErrorKind::None:
        return "None";
    case CliErrorKind::Preparation:
        return "PreparationError";
    case CliErrorKind::ExitConfig:
        return "ExitConfigError";
    case CliErrorKind::Parse:
        return "ParseError";
    case CliErrorKind::UnexpectedOutput:
        return "UnexpectedOutputError";
    case CliErrorKind::IO:
        return "IOError";
    case CliErrorKind::Timeout:
        return "TimeoutError";
    case CliErrorKind::Channel:
        return "ChannelError";
    }
    return "Unknown";
}

} // namespace sroscli
