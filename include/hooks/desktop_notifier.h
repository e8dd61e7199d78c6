#pragma once

#include "process/spawn.h"
#include "stream/session_hooks.h"

#include <string>
#include <vector>

namespace somaplay {
namespace hooks {

// notify-send -a somaplay [-i <icon>] <title>
class DesktopNotifier : public stream::TrackNotifier {
   public:
    explicit DesktopNotifier(process::ChildReaper& reaper, std::string executable = "notify-send");

    void notify(const std::string& title, const std::string& iconPath) override;

    std::vector<std::string> buildCommand(const std::string& title,
                                          const std::string& iconPath) const;

   private:
    process::ChildReaper& reaper_;
    std::string executable_;
};

}  // namespace hooks
}  // namespace somaplay
