#include "CopyError.hpp"
#include "FakeEndpointClient.hpp"
#include "StateResolver.hpp"

#include <iostream>
#include <string>

namespace {
int Fail(const std::string& message) {
    std::cerr << message << std::endl;
    return 1;
}
} // namespace

int main() {
    FakeEndpointClient source("alpha");
    source.containers["web"] = MakeEntity(
        {"default"},
        {{"limits.cpu", "2"},
         {"volatile.base_image", "sha256-abc"},
         {"volatile.eth0.hwaddr", "00:16:3e:00:00:01"},
         {"user.note", "keep"}});
    source.containers["web/snap0"] = MakeEntity(
        {"default", "snapshot-only"},
        {{"volatile.base_image", "sha256-old"}});

    StateResolver resolver(source);

    StateOverrides overrides;
    overrides.profiles = {"web", "default"};
    overrides.config = {{"limits.cpu", "4"}, {"limits.memory", "1GB"}, {"limits.memory", "2GB"}};

    const ResolvedState resolved = resolver.Resolve("web", overrides);
    if (resolved.baseImage != "sha256-abc") {
        return Fail("Base image not captured: " + resolved.baseImage);
    }
    if (resolved.state.config.count("volatile.base_image") != 0
        || resolved.state.config.count("volatile.eth0.hwaddr") != 0) {
        return Fail("Volatile keys should be stripped by default.");
    }
    if (resolved.state.config.at("limits.cpu") != "4") {
        return Fail("Config override did not replace the fetched value.");
    }
    if (resolved.state.config.at("limits.memory") != "2GB") {
        return Fail("Repeated config override should keep the last value.");
    }
    if (resolved.state.config.at("user.note") != "keep") {
        return Fail("Unrelated config key was lost.");
    }
    const std::vector<std::string> expectedProfiles{"default", "web", "default"};
    if (resolved.state.profiles != expectedProfiles) {
        return Fail("Profiles should be appended without deduplication.");
    }
    if (resolved.state.architecture != "x86_64" || resolved.state.devices.count("root") == 0) {
        return Fail("Architecture or devices not carried over.");
    }

    StateOverrides keep;
    keep.keepVolatile = true;
    const ResolvedState kept = resolver.Resolve("web", keep);
    if (kept.state.config.count("volatile.eth0.hwaddr") == 0 || kept.baseImage != "sha256-abc") {
        return Fail("Volatile keys should survive when preservation is requested.");
    }

    const ResolvedState snapshot = resolver.Resolve("web/snap0", StateOverrides{});
    if (snapshot.baseImage != "sha256-old" || snapshot.state.profiles.size() != 2) {
        return Fail("Snapshot lookup did not return the snapshot state.");
    }

    ConfigMap config{{"volatile", "x"}, {"volatileish", "y"}, {"security.nesting", "true"}};
    StateResolver::StripVolatile(config);
    if (config.size() != 1 || config.count("security.nesting") == 0) {
        return Fail("StripVolatile should remove every key with the volatile prefix.");
    }

    try {
        resolver.Resolve("missing", StateOverrides{});
        return Fail("Resolving a missing container should throw.");
    } catch (const CopyError& ex) {
        if (ex.Kind() != ErrorKind::NotFound) {
            return Fail(std::string("Unexpected error kind for missing container: ") + CopyError::KindName(ex.Kind()));
        }
    }

    return 0;
}
