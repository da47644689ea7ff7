#pragma once

#include "CopyTypes.hpp"
#include "EndpointClient.hpp"

#include <string>
#include <utility>
#include <vector>

struct ResolvedState {
    ReplicableState state;
    std::string baseImage;
};

struct StateOverrides {
    std::vector<std::string> profiles;
    std::vector<std::pair<std::string, std::string>> config;
    bool keepVolatile = false;
};

class StateResolver {
public:
    static constexpr const char* kVolatilePrefix = "volatile";
    static constexpr const char* kBaseImageKey = "volatile.base_image";

    explicit StateResolver(EndpointClient& source);

    ResolvedState Resolve(const std::string& sourceName, const StateOverrides& overrides) const;

    static void ApplyOverrides(ReplicableState& state, const StateOverrides& overrides);
    static void StripVolatile(ConfigMap& config);

private:
    EndpointClient& source_;
};
