#include "ProfileChecker.hpp"

#include "CopyError.hpp"

#include <iostream>
#include <set>

ProfileChecker::ProfileChecker(EndpointClient& destination)
    : destination_(destination) {}

void ProfileChecker::Check(const std::vector<std::string>& profiles) const {
    const std::vector<std::string> missing = MissingProfiles(profiles, destination_.ListProfiles());
    if (missing.empty()) {
        return;
    }

    for (const auto& profile : missing) {
        std::cerr << "[Copy] Profile " << profile << " does not exist on " << destination_.Name() << std::endl;
    }
    throw CopyError(ErrorKind::ProfileMismatch, "not all the profiles from the source exist on the target");
}

std::vector<std::string> ProfileChecker::MissingProfiles(
    const std::vector<std::string>& profiles,
    const std::vector<std::string>& available) {
    const std::set<std::string> known(available.begin(), available.end());
    std::set<std::string> reported;
    std::vector<std::string> missing;
    for (const auto& profile : profiles) {
        if (known.count(profile) == 0 && reported.insert(profile).second) {
            missing.push_back(profile);
        }
    }
    return missing;
}
