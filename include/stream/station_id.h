#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace somaplay {
namespace stream {

// Identifiers whose presence in a title marks a station ID jingle.
std::vector<std::string> defaultStationIds();

// True when any known ID occurs in the title, ignoring ASCII case.
// Empty IDs never match.
bool isStationId(std::string_view title, const std::vector<std::string>& knownIds);

}  // namespace stream
}  // namespace somaplay
