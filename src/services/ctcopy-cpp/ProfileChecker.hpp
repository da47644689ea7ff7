#pragma once

#include "EndpointClient.hpp"

#include <string>
#include <vector>

class ProfileChecker {
public:
    explicit ProfileChecker(EndpointClient& destination);

    // Throws ErrorKind::ProfileMismatch when any profile is unknown at the destination.
    void Check(const std::vector<std::string>& profiles) const;

    static std::vector<std::string> MissingProfiles(
        const std::vector<std::string>& profiles,
        const std::vector<std::string>& available);

private:
    EndpointClient& destination_;
};
