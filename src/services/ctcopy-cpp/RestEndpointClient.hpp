#pragma once

#include "EndpointClient.hpp"
#include "RemoteConfig.hpp"

#include <nlohmann/json.hpp>

#include <map>
#include <optional>
#include <string>
#include <vector>

// EndpointClient speaking the /1.0 REST API over HTTPS or a unix socket.
class RestEndpointClient : public EndpointClient {
public:
    explicit RestEndpointClient(Remote remote);

    const std::string& Name() const override;

    EntityInfo ContainerInfo(const std::string& name) override;
    EntityInfo SnapshotInfo(const std::string& name) override;
    std::vector<std::string> ListProfiles() override;

    OperationInfo LocalCopy(const LocalCopyRequest& request) override;
    MigrationSession NegotiateMigrationSession(const std::string& name, bool stateful, bool containerOnly) override;
    std::vector<std::string> Addresses() override;
    std::string Certificate() override;
    OperationInfo MigrateFrom(const MigrationRequest& request) override;

    OperationInfo WaitForCompletion(const std::string& operation) override;
    OperationInfo GetOperation(const std::string& operation) override;

    static std::string ContainerPath(const std::string& name);
    static EntityInfo DecodeEntity(const nlohmann::json& metadata);
    static OperationInfo DecodeOperation(const nlohmann::json& metadata);
    static std::map<std::string, std::string> DecodeSecrets(const nlohmann::json& metadata);
    static nlohmann::json BuildLocalCopyBody(const LocalCopyRequest& request);
    static nlohmann::json BuildMigrateFromBody(const MigrationRequest& request);

private:
    struct ServerInfo {
        std::vector<std::string> addresses;
        std::string certificate;
    };

    enum class Method {
        Get,
        Post
    };

    nlohmann::json Request(
        Method method,
        const std::string& path,
        const nlohmann::json* body,
        const std::string& spanName,
        bool unbounded = false) const;
    OperationInfo AsyncOperation(const nlohmann::json& envelope) const;
    const ServerInfo& Server();

    Remote remote_;
    std::string baseUrl_;
    std::string socketPath_;
    std::optional<ServerInfo> server_;
};
