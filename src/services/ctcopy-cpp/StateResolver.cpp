#include "StateResolver.hpp"

StateResolver::StateResolver(EndpointClient& source)
    : source_(source) {}

ResolvedState StateResolver::Resolve(const std::string& sourceName, const StateOverrides& overrides) const {
    ResolvedState resolved;
    resolved.state = IsSnapshotName(sourceName)
        ? source_.SnapshotInfo(sourceName).state
        : source_.ContainerInfo(sourceName).state;

    ApplyOverrides(resolved.state, overrides);

    // The base image lives under a volatile key but always travels to the
    // destination, so it is captured before stripping.
    const auto baseImage = resolved.state.config.find(kBaseImageKey);
    if (baseImage != resolved.state.config.end()) {
        resolved.baseImage = baseImage->second;
    }

    if (!overrides.keepVolatile) {
        StripVolatile(resolved.state.config);
    }

    return resolved;
}

void StateResolver::ApplyOverrides(ReplicableState& state, const StateOverrides& overrides) {
    state.profiles.insert(state.profiles.end(), overrides.profiles.begin(), overrides.profiles.end());

    for (const auto& [key, value] : overrides.config) {
        state.config[key] = value;
    }
}

void StateResolver::StripVolatile(ConfigMap& config) {
    for (auto it = config.begin(); it != config.end();) {
        if (it->first.rfind(kVolatilePrefix, 0) == 0) {
            it = config.erase(it);
        } else {
            ++it;
        }
    }
}
