#include "stream/station_id.h"

#include <algorithm>
#include <cctype>

namespace somaplay {
namespace stream {

namespace {

std::string toLower(std::string_view s) {
    std::string out{s};
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

}  // namespace

std::vector<std::string> defaultStationIds() {
    return {"SomaFM"};
}

bool isStationId(std::string_view title, const std::vector<std::string>& knownIds) {
    const std::string lowerTitle = toLower(title);
    for (const auto& id : knownIds) {
        if (id.empty()) {
            continue;
        }
        if (lowerTitle.find(toLower(id)) != std::string::npos) {
            return true;
        }
    }
    return false;
}

}  // namespace stream
}  // namespace somaplay
