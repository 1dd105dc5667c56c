#include "sroscli/CliPersonality.hpp"
#include "sroscli/PromptText.hpp"

namespace sroscli {

// Both paging syntaxes are sent: which one a node accepts depends on the
// release, the other one is rejected harmlessly.
std::vector<std::string> ClassicalPersonality::sessionSetupCommands(unsigned int) const {
    return {"environment no more", "//environment more false"};
}

std::vector<std::string> ModelDrivenPersonality::sessionSetupCommands(unsigned int terminalWidth) const {
    return {"environment more false",
            "//environment no more",
            "environment console width " + std::to_string(terminalWidth)};
}

bool ModelDrivenPersonality::configContextActive(const std::string& output) const {
    return prompt::inConfigContext(output);
}

bool ModelDrivenPersonality::uncommittedChanges(const std::string& output) const {
    return prompt::hasUncommittedChanges(output);
}

std::string ModelDrivenPersonality::stripDecoration(const std::string& output) const {
    return prompt::stripContextDecoration(output);
}

std::unique_ptr<CliPersonality> makePersonality(CliMode mode) {
    if (mode == CliMode::ModelDriven)
        return std::make_unique<ModelDrivenPersonality>();
    return std::make_unique<ClassicalPersonality>();
}

} // namespace sroscli
