#include "hooks/command_notifier.h"

#include "logging/logger.h"

#include <sstream>

namespace somaplay {
namespace hooks {

std::vector<std::string> splitCommand(const std::string& command) {
    std::vector<std::string> parts;
    std::istringstream iss(command);
    std::string word;
    while (iss >> word) {
        parts.push_back(word);
    }
    return parts;
}

CommandNotifier::CommandNotifier(process::ChildReaper& reaper, const std::string& command)
    : reaper_(reaper), argv_(splitCommand(command)) {
    if (argv_.empty()) {
        LOG_WARN("[Notify] Empty notify command; custom notifications disabled");
    }
}

std::vector<std::string> CommandNotifier::buildCommand(const std::string& title) const {
    std::vector<std::string> args = argv_;
    args.push_back(title);
    return args;
}

void CommandNotifier::notify(const std::string& title, const std::string& /*iconPath*/) {
    if (argv_.empty()) {
        return;
    }
    reaper_.reapFinished();

    auto pid = process::spawnProcess(buildCommand(title));
    if (!pid) {
        LOG_WARN("[Notify] Command '{}' failed for '{}'", argv_.front(), title);
        return;
    }
    reaper_.track(*pid);
}

}  // namespace hooks
}  // namespace somaplay
