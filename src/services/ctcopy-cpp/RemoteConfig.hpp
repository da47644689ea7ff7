#pragma once

#include "CopyTypes.hpp"

#include <map>
#include <string>

struct TlsSettings {
    bool enabled = false;
    std::string certPath;
    std::string keyPath;
    std::string caPath;
    bool verifyPeer = true;
    bool verifyHost = false;
};

struct Remote {
    std::string name;
    std::string addr;
    TlsSettings tls;
};

class RemoteConfig {
public:
    static constexpr const char* kLocalRemote = "local";
    static constexpr const char* kLocalSocket = "unix:///var/lib/lxd/unix.socket";

    RemoteConfig();

    // Reads <configDir>/config.json when present; otherwise keeps the built-in defaults.
    static RemoteConfig Load(const std::string& configDir);
    static RemoteConfig FromJson(const std::string& text, const std::string& configDir);
    static std::string DefaultConfigDir();

    const std::string& DefaultRemote() const { return defaultRemote_; }
    void SetDefaultRemote(const std::string& remote);
    void AddRemote(Remote remote);

    bool HasRemote(const std::string& name) const;
    const Remote& GetRemote(const std::string& name) const;

    // "remote:name" splits at the first colon; no colon or an empty remote
    // selects the default remote.
    EntityReference ParseLocator(const std::string& locator) const;

private:
    std::string defaultRemote_;
    std::map<std::string, Remote> remotes_;
};

std::string GetEnvOrDefault(const char* name, const std::string& defaultValue);
bool GetEnvBool(const char* name, bool defaultValue);
