#pragma once

#include "CopyTypes.hpp"

#include <functional>
#include <memory>
#include <string>
#include <vector>

// One container-management endpoint. Failures are reported by throwing
// CopyError; MigrateFrom throws ErrorKind::Handshake for any rejection.
class EndpointClient {
public:
    virtual ~EndpointClient() = default;

    virtual const std::string& Name() const = 0;

    virtual EntityInfo ContainerInfo(const std::string& name) = 0;
    virtual EntityInfo SnapshotInfo(const std::string& name) = 0;
    virtual std::vector<std::string> ListProfiles() = 0;

    virtual OperationInfo LocalCopy(const LocalCopyRequest& request) = 0;
    virtual MigrationSession NegotiateMigrationSession(const std::string& name, bool stateful, bool containerOnly) = 0;
    virtual std::vector<std::string> Addresses() = 0;
    virtual std::string Certificate() = 0;
    virtual OperationInfo MigrateFrom(const MigrationRequest& request) = 0;

    // Blocks until the operation is terminal. Throws ErrorKind::Upstream
    // carrying the operation's error text when it did not succeed.
    virtual OperationInfo WaitForCompletion(const std::string& operation) = 0;
    virtual OperationInfo GetOperation(const std::string& operation) = 0;
};

using ClientFactory = std::function<std::unique_ptr<EndpointClient>(const std::string& endpoint)>;
