#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

using ConfigMap = std::map<std::string, std::string>;
using DeviceMap = std::map<std::string, std::map<std::string, std::string>>;

struct EntityReference {
    std::string endpoint;
    std::string name;
};

struct ReplicableState {
    std::string architecture;
    DeviceMap devices;
    ConfigMap config;
    std::vector<std::string> profiles;
};

struct EntityInfo {
    ReplicableState state;
    bool ephemeral = false;
};

// Snapshot of an asynchronous operation as reported by an endpoint.
struct OperationInfo {
    std::string id;
    std::string path;
    std::string status;
    std::string error;
    std::map<std::string, std::vector<std::string>> resources;

    bool Succeeded() const { return status == "Success"; }
};

struct MigrationSession {
    std::map<std::string, std::string> secrets;
    std::string operation;
    std::string sourceEndpoint;
    std::string destEndpoint;
};

struct LocalCopyRequest {
    std::string sourceName;
    std::string destName;
    ConfigMap config;
    std::vector<std::string> profiles;
    bool ephemeral = false;
    bool containerOnly = false;
};

struct MigrationRequest {
    std::string destName;
    std::string sourceOperationUrl;
    std::string certificate;
    std::map<std::string, std::string> secrets;
    ReplicableState state;
    std::string baseImage;
    bool ephemeral = false;
    bool stateful = false;
    bool containerOnly = false;
};

// Everything one invocation asks for; threaded through the whole call chain.
struct CopyRequest {
    std::string sourceLocator;
    std::string destLocator;
    std::vector<std::string> profiles;
    std::vector<std::pair<std::string, std::string>> configOverrides;
    std::optional<bool> ephemeral;
    bool keepVolatile = false;
    bool stateful = false;
    bool containerOnly = false;
};

inline bool IsSnapshotName(const std::string& name) {
    return name.find('/') != std::string::npos;
}
