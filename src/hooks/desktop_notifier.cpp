#include "hooks/desktop_notifier.h"

#include "logging/logger.h"

namespace somaplay {
namespace hooks {

DesktopNotifier::DesktopNotifier(process::ChildReaper& reaper, std::string executable)
    : reaper_(reaper), executable_(std::move(executable)) {}

std::vector<std::string> DesktopNotifier::buildCommand(const std::string& title,
                                                       const std::string& iconPath) const {
    std::vector<std::string> args = {executable_, "-a", "somaplay"};
    if (!iconPath.empty()) {
        args.push_back("-i");
        args.push_back(iconPath);
    }
    args.push_back(title);
    return args;
}

void DesktopNotifier::notify(const std::string& title, const std::string& iconPath) {
    reaper_.reapFinished();

    auto pid = process::spawnProcess(buildCommand(title, iconPath));
    if (!pid) {
        LOG_WARN("[Notify] {} failed for '{}'", executable_, title);
        return;
    }
    reaper_.track(*pid);
}

}  // namespace hooks
}  // namespace somaplay
