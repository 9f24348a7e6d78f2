//! # Discovery Engine
//!
//! Runs registered providers in order and caches the combined catalog for the
//! engine's lifetime.
//!
//! ```cpp
//! auto engine = DiscoveryEngine::with_default_providers();
//! const auto& commands = engine.discover(ctx); // runs providers
//! engine.discover(ctx);                        // same list, from cache
//! engine.refresh();                            // next discover() rescans
//! ```
//!
//! A provider that is unavailable is skipped silently; one that fails is
//! skipped with a debug-level log record. Ids are unique within one pass:
//! a later command reusing an id is dropped.

#ifndef DEVKIT_DISCOVERY_ENGINE_HPP
#define DEVKIT_DISCOVERY_ENGINE_HPP

#include "common.hpp"
#include "discovery/provider.hpp"

#include <optional>
#include <vector>

namespace devkit::discovery {

class DiscoveryEngine {
public:
    DiscoveryEngine() = default;

    /// Engine with npm, cargo, make, scripts and compose providers, in that order.
    static DiscoveryEngine with_default_providers();

    void register_provider(Box<CommandProvider> provider);

    /// The cached catalog, building it first if needed.
    const std::vector<DiscoveredCommand>& discover(const Context& ctx);

    /// Drops the cache.
    void refresh() {
        cache_.reset();
    }

    bool has_cache() const {
        return cache_.has_value();
    }

    size_t provider_count() const {
        return providers_.size();
    }

private:
    std::vector<Box<CommandProvider>> providers_;
    std::optional<std::vector<DiscoveredCommand>> cache_;
};

/// Commands of `category`, preserving order.
std::vector<const DiscoveredCommand*>
commands_in_category(const std::vector<DiscoveredCommand>& commands, catalog::Category category);

} // namespace devkit::discovery

#endif // DEVKIT_DISCOVERY_ENGINE_HPP
