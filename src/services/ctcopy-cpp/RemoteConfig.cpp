#include "RemoteConfig.hpp"

#include "CopyError.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <system_error>
#include <utility>

namespace {
constexpr const char* kConfigFileName = "config.json";
constexpr const char* kClientCertName = "client.crt";
constexpr const char* kClientKeyName = "client.key";
constexpr const char* kServerCertDir = "servercerts";

bool IsTlsAddress(const std::string& addr) {
    return addr.rfind("https://", 0) == 0;
}

std::string ExistingFile(const std::filesystem::path& path) {
    std::error_code error;
    return std::filesystem::is_regular_file(path, error) ? path.string() : std::string();
}

TlsSettings BuildTlsSettings(const std::string& configDir, const std::string& remoteName, const std::string& addr) {
    TlsSettings tls;
    tls.enabled = IsTlsAddress(addr);
    if (!tls.enabled || configDir.empty()) {
        return tls;
    }

    const std::filesystem::path dir(configDir);
    tls.certPath = ExistingFile(dir / kClientCertName);
    tls.keyPath = ExistingFile(dir / kClientKeyName);
    tls.caPath = ExistingFile(dir / kServerCertDir / (remoteName + ".crt"));
    return tls;
}
} // namespace

std::string GetEnvOrDefault(const char* name, const std::string& defaultValue) {
    const char* value = std::getenv(name);
    return value ? std::string(value) : defaultValue;
}

bool GetEnvBool(const char* name, bool defaultValue) {
    const char* value = std::getenv(name);
    if (!value) {
        return defaultValue;
    }

    std::string normalized(value);
    std::transform(normalized.begin(), normalized.end(), normalized.begin(), [](unsigned char ch) {
        return static_cast<char>(std::tolower(ch));
    });

    if (normalized == "1" || normalized == "true" || normalized == "yes") {
        return true;
    }
    if (normalized == "0" || normalized == "false" || normalized == "no") {
        return false;
    }

    return defaultValue;
}

RemoteConfig::RemoteConfig()
    : defaultRemote_(kLocalRemote) {
    Remote local;
    local.name = kLocalRemote;
    local.addr = kLocalSocket;
    remotes_[local.name] = std::move(local);
}

RemoteConfig RemoteConfig::Load(const std::string& configDir) {
    const std::filesystem::path path = std::filesystem::path(configDir) / kConfigFileName;

    std::error_code error;
    if (configDir.empty() || !std::filesystem::exists(path, error)) {
        return RemoteConfig();
    }

    std::ifstream input(path);
    if (!input) {
        throw CopyError(ErrorKind::Config, "unable to read " + path.string());
    }

    std::ostringstream text;
    text << input.rdbuf();
    return FromJson(text.str(), configDir);
}

RemoteConfig RemoteConfig::FromJson(const std::string& text, const std::string& configDir) {
    auto json = nlohmann::json::parse(text, nullptr, false);
    if (json.is_discarded() || !json.is_object()) {
        throw CopyError(ErrorKind::Config, "config file is not a JSON object");
    }

    RemoteConfig config;

    if (json.contains("remotes")) {
        const auto& remotes = json["remotes"];
        if (!remotes.is_object()) {
            throw CopyError(ErrorKind::Config, "\"remotes\" must be an object");
        }

        for (auto it = remotes.begin(); it != remotes.end(); ++it) {
            const std::string& name = it.key();
            const auto& item = it.value();
            if (!item.is_object() || !item.contains("addr") || !item["addr"].is_string()) {
                throw CopyError(ErrorKind::Config, "remote " + name + " has no addr");
            }

            Remote remote;
            remote.name = name;
            remote.addr = item["addr"].get<std::string>();
            remote.tls = BuildTlsSettings(configDir, name, remote.addr);
            remote.tls.verifyPeer = item.value("verify-peer", true);
            remote.tls.verifyHost = item.value("verify-host", false);
            config.AddRemote(std::move(remote));
        }
    }

    const std::string defaultRemote = json.value("default-remote", std::string(kLocalRemote));
    if (!config.HasRemote(defaultRemote)) {
        throw CopyError(ErrorKind::Config, "default remote " + defaultRemote + " is not configured");
    }
    config.defaultRemote_ = defaultRemote;
    return config;
}

std::string RemoteConfig::DefaultConfigDir() {
    const std::string explicitDir = GetEnvOrDefault("CTCOPY_CONF", "");
    if (!explicitDir.empty()) {
        return explicitDir;
    }

    const std::string home = GetEnvOrDefault("HOME", "");
    if (home.empty()) {
        return {};
    }
    return (std::filesystem::path(home) / ".config" / "ctcopy").string();
}

void RemoteConfig::SetDefaultRemote(const std::string& remote) {
    if (!HasRemote(remote)) {
        throw CopyError(ErrorKind::Config, "remote " + remote + " doesn't exist");
    }
    defaultRemote_ = remote;
}

void RemoteConfig::AddRemote(Remote remote) {
    std::string name = remote.name;
    remotes_[name] = std::move(remote);
}

bool RemoteConfig::HasRemote(const std::string& name) const {
    return remotes_.count(name) != 0;
}

const Remote& RemoteConfig::GetRemote(const std::string& name) const {
    const auto it = remotes_.find(name);
    if (it == remotes_.end()) {
        throw CopyError(ErrorKind::Config, "remote " + name + " doesn't exist");
    }
    return it->second;
}

EntityReference RemoteConfig::ParseLocator(const std::string& locator) const {
    EntityReference ref;
    const auto colon = locator.find(':');
    if (colon == std::string::npos) {
        ref.endpoint = defaultRemote_;
        ref.name = locator;
        return ref;
    }

    ref.endpoint = locator.substr(0, colon);
    ref.name = locator.substr(colon + 1);
    if (ref.endpoint.empty()) {
        ref.endpoint = defaultRemote_;
    }
    return ref;
}
