// Everything that differs between the classical and the model-driven CLI.
// CliSession asks its personality instead of testing the prompt marker.
#pragma once
#include "SessionTypes.hpp"
#include <memory>
#include <string>
#include <vector>

namespace sroscli {

class CliPersonality {
public:
    virtual ~CliPersonality() = default;

    virtual CliMode mode() const = 0;
    virtual const char* name() const = 0;

    // Paging/width commands sent once by CliSession::prepare()
    virtual std::vector<std::string> sessionSetupCommands(unsigned int terminalWidth) const = 0;

    // Candidate configuration (edit-config/commit/discard/quit-config)
    virtual bool hasCandidateConfig() const = 0;

    // Default for CliSession::sendConfigSet when the caller does not choose
    virtual bool exitConfigAfterSet() const = 0;

    // Forces classical interpretation of legacy commands ("file dir", ...)
    virtual std::string classicCommandPrefix() const = 0;

    virtual bool configContextActive(const std::string& output) const = 0;
    virtual bool uncommittedChanges(const std::string& output) const = 0;

    // Applied after generic prompt stripping
    virtual std::string stripDecoration(const std::string& output) const = 0;
};

class ClassicalPersonality : public CliPersonality {
public:
    CliMode mode() const override { return CliMode::Classical; }
    const char* name() const override { return "classical"; }
    std::vector<std::string> sessionSetupCommands(unsigned int terminalWidth) const override;
    bool hasCandidateConfig() const override { return false; }
    bool exitConfigAfterSet() const override { return true; }
    std::string classicCommandPrefix() const override { return {}; }
    bool configContextActive(const std::string&) const override { return false; }
    bool uncommittedChanges(const std::string&) const override { return false; }
    std::string stripDecoration(const std::string& output) const override { return output; }
};

class ModelDrivenPersonality : public CliPersonality {
public:
    CliMode mode() const override { return CliMode::ModelDriven; }
    const char* name() const override { return "model-driven"; }
    std::vector<std::string> sessionSetupCommands(unsigned int terminalWidth) const override;
    bool hasCandidateConfig() const override { return true; }
    bool exitConfigAfterSet() const override { return false; }
    std::string classicCommandPrefix() const override { return "//"; }
    bool configContextActive(const std::string& output) const override;
    bool uncommittedChanges(const std::string& output) const override;
    std::string stripDecoration(const std::string& output) const override;
};

std::unique_ptr<CliPersonality> makePersonality(CliMode mode);

} // namespace sroscli
