#include "CopyError.hpp"
#include "RestEndpointClient.hpp"

#include <nlohmann/json.hpp>

#include <iostream>
#include <string>

namespace {
int Fail(const std::string& message) {
    std::cerr << message << std::endl;
    return 1;
}
} // namespace

int main() {
    if (RestEndpointClient::ContainerPath("web") != "/1.0/containers/web") {
        return Fail("Unexpected container path.");
    }
    if (RestEndpointClient::ContainerPath("web/snap0") != "/1.0/containers/web/snapshots/snap0") {
        return Fail("Unexpected snapshot path.");
    }

    const auto container = nlohmann::json::parse(R"({
        "architecture": "x86_64",
        "config": {"limits.cpu": "2", "volatile.base_image": "sha256-abc"},
        "devices": {"root": {"path": "/", "type": "disk"}},
        "profiles": ["default", "web"],
        "ephemeral": true,
        "status": "Running"
    })");
    const EntityInfo entity = RestEndpointClient::DecodeEntity(container);
    if (entity.state.architecture != "x86_64" || !entity.ephemeral
        || entity.state.config.at("volatile.base_image") != "sha256-abc"
        || entity.state.devices.at("root").at("type") != "disk"
        || entity.state.profiles.size() != 2) {
        return Fail("Container record decoded incorrectly.");
    }

    try {
        RestEndpointClient::DecodeEntity(nlohmann::json::parse(R"({"config": {"limits.cpu": 2}})"));
        return Fail("Non-string config values should be rejected.");
    } catch (const CopyError& ex) {
        if (ex.Kind() != ErrorKind::Decode) {
            return Fail("Unexpected error kind for malformed container record.");
        }
    }

    const auto operation = nlohmann::json::parse(R"({
        "id": "2a5b4c",
        "class": "websocket",
        "status": "Running",
        "resources": {"containers": ["/1.0/containers/web"]},
        "metadata": {"control": "s1", "fs": "s2", "progress": 40},
        "err": ""
    })");
    const OperationInfo info = RestEndpointClient::DecodeOperation(operation);
    if (info.path != "/1.0/operations/2a5b4c" || info.status != "Running" || info.Succeeded()) {
        return Fail("Operation record decoded incorrectly.");
    }
    if (info.resources.at("containers").front() != "/1.0/containers/web") {
        return Fail("Operation resources decoded incorrectly.");
    }

    const auto secrets = RestEndpointClient::DecodeSecrets(nlohmann::json::parse(R"({"control": "s1", "fs": "s2"})"));
    if (secrets.size() != 2 || secrets.at("control") != "s1") {
        return Fail("Secrets decoded incorrectly.");
    }
    try {
        RestEndpointClient::DecodeSecrets(operation["metadata"]);
        return Fail("Non-string secrets should be rejected.");
    } catch (const CopyError& ex) {
        if (ex.Kind() != ErrorKind::Decode) {
            return Fail("Unexpected error kind for non-string secret.");
        }
    }

    LocalCopyRequest copy;
    copy.sourceName = "web/snap0";
    copy.config = {{"limits.cpu", "2"}};
    copy.profiles = {"default"};
    copy.containerOnly = true;
    const nlohmann::json copyBody = RestEndpointClient::BuildLocalCopyBody(copy);
    if (copyBody.contains("name") || copyBody["source"]["type"] != "copy"
        || copyBody["source"]["source"] != "web/snap0" || copyBody["source"]["container_only"] != true) {
        return Fail("Unexpected local copy body: " + copyBody.dump());
    }

    MigrationRequest migration;
    migration.destName = "web";
    migration.sourceOperationUrl = "https://10.0.0.1:8443/1.0/operations/src-1";
    migration.certificate = "PEM";
    migration.secrets = {{"control", "s1"}};
    migration.state.architecture = "x86_64";
    migration.baseImage = "sha256-abc";
    migration.stateful = true;
    const nlohmann::json migrateBody = RestEndpointClient::BuildMigrateFromBody(migration);
    const auto& source = migrateBody["source"];
    if (migrateBody["name"] != "web" || source["type"] != "migration" || source["mode"] != "pull"
        || source["operation"] != migration.sourceOperationUrl || source["base-image"] != "sha256-abc"
        || source["secrets"]["control"] != "s1" || source["live"] != true || source["certificate"] != "PEM") {
        return Fail("Unexpected migration body: " + migrateBody.dump());
    }

    return 0;
}
