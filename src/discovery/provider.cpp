#include "discovery/provider.hpp"

#include <algorithm>

namespace devkit::discovery {

void sort_commands(std::vector<DiscoveredCommand>& commands) {
    std::stable_sort(commands.begin(), commands.end(),
                     [](const DiscoveredCommand& a, const DiscoveredCommand& b) {
                         return a.id() < b.id();
                     });
}

} // namespace devkit::discovery
