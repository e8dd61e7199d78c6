#pragma once

#include "process/spawn.h"
#include "stream/session_hooks.h"

#include <string>
#include <vector>

namespace somaplay {
namespace hooks {

// Runs a user-configured command with the track title appended as the last
// argument. The command is split on whitespace; no shell is involved.
class CommandNotifier : public stream::TrackNotifier {
   public:
    CommandNotifier(process::ChildReaper& reaper, const std::string& command);

    void notify(const std::string& title, const std::string& iconPath) override;

    bool valid() const {
        return !argv_.empty();
    }
    std::vector<std::string> buildCommand(const std::string& title) const;

   private:
    process::ChildReaper& reaper_;
    std::vector<std::string> argv_;
};

std::vector<std::string> splitCommand(const std::string& command);

}  // namespace hooks
}  // namespace somaplay
