#pragma once

#include "CopyTypes.hpp"
#include "EndpointClient.hpp"
#include "RemoteConfig.hpp"

#include <ostream>

// Copies a container or snapshot: a local copy when both locators name the
// same remote, a migration between the two remotes otherwise.
class CopyCommand {
public:
    CopyCommand(const RemoteConfig& config, ClientFactory factory, std::ostream& output);

    void Run(const CopyRequest& request);

private:
    const RemoteConfig& config_;
    ClientFactory factory_;
    std::ostream& output_;
};
