#include "RestEndpointClient.hpp"

#include "CopyError.hpp"
#include "Tracing.hpp"

#include <cpr/cpr.h>
#include <cpr/ssl_options.h>

#include <chrono>
#include <iostream>
#include <utility>

namespace {
constexpr auto kConnectTimeout = std::chrono::seconds(3);
constexpr auto kRequestTimeout = std::chrono::seconds(30);
constexpr const char* kApiRoot = "/1.0";
constexpr const char* kUnixScheme = "unix://";
constexpr const char* kUnixBaseUrl = "http://unix.socket";

std::string BuildUrl(const std::string& baseUrl, const std::string& path) {
    if (baseUrl.empty()) {
        return path;
    }

    if (baseUrl.back() == '/') {
        return baseUrl.substr(0, baseUrl.size() - 1) + path;
    }

    return baseUrl + path;
}

cpr::SslOptions BuildSslOptions(const TlsSettings& settings) {
    return cpr::Ssl(
        cpr::ssl::CaInfo{settings.caPath},
        cpr::ssl::CertFile{settings.certPath},
        cpr::ssl::KeyFile{settings.keyPath},
        cpr::ssl::VerifyPeer{settings.verifyPeer},
        cpr::ssl::VerifyHost{settings.verifyHost});
}

const char* MethodName(bool post) {
    return post ? "POST" : "GET";
}

std::string LastPathSegment(std::string path) {
    while (!path.empty() && path.back() == '/') {
        path.pop_back();
    }

    const auto lastSlash = path.find_last_of('/');
    return lastSlash == std::string::npos ? path : path.substr(lastSlash + 1);
}

nlohmann::json MetadataOf(const nlohmann::json& envelope) {
    const auto it = envelope.find("metadata");
    return it == envelope.end() ? nlohmann::json() : *it;
}

std::string EnvelopeError(const nlohmann::json& envelope, long statusCode) {
    if (envelope.is_object() && envelope.contains("error") && envelope["error"].is_string()) {
        const std::string message = envelope["error"].get<std::string>();
        if (!message.empty()) {
            return message;
        }
    }
    return "HTTP " + std::to_string(statusCode);
}
} // namespace

RestEndpointClient::RestEndpointClient(Remote remote)
    : remote_(std::move(remote)) {
    if (remote_.addr.rfind(kUnixScheme, 0) == 0) {
        socketPath_ = remote_.addr.substr(std::char_traits<char>::length(kUnixScheme));
        baseUrl_ = kUnixBaseUrl;
    } else {
        baseUrl_ = remote_.addr;
    }
}

const std::string& RestEndpointClient::Name() const {
    return remote_.name;
}

EntityInfo RestEndpointClient::ContainerInfo(const std::string& name) {
    const nlohmann::json envelope = Request(Method::Get, ContainerPath(name), nullptr, "endpoint.container_info");
    return DecodeEntity(MetadataOf(envelope));
}

EntityInfo RestEndpointClient::SnapshotInfo(const std::string& name) {
    const nlohmann::json envelope = Request(Method::Get, ContainerPath(name), nullptr, "endpoint.snapshot_info");
    return DecodeEntity(MetadataOf(envelope));
}

std::vector<std::string> RestEndpointClient::ListProfiles() {
    const nlohmann::json envelope =
        Request(Method::Get, std::string(kApiRoot) + "/profiles", nullptr, "endpoint.list_profiles");

    const nlohmann::json metadata = MetadataOf(envelope);
    if (!metadata.is_array()) {
        throw CopyError(ErrorKind::Decode, "profile listing is not an array");
    }

    std::vector<std::string> profiles;
    for (const auto& item : metadata) {
        if (!item.is_string()) {
            throw CopyError(ErrorKind::Decode, "profile listing contains a non-string entry");
        }
        profiles.push_back(LastPathSegment(item.get<std::string>()));
    }
    return profiles;
}

OperationInfo RestEndpointClient::LocalCopy(const LocalCopyRequest& request) {
    const nlohmann::json body = BuildLocalCopyBody(request);
    const nlohmann::json envelope =
        Request(Method::Post, std::string(kApiRoot) + "/containers", &body, "endpoint.local_copy");
    return AsyncOperation(envelope);
}

MigrationSession RestEndpointClient::NegotiateMigrationSession(const std::string& name, bool stateful, bool containerOnly) {
    nlohmann::json body = {{"migration", true}};
    if (!IsSnapshotName(name)) {
        body["live"] = stateful;
        body["container_only"] = containerOnly;
    }

    const nlohmann::json envelope = Request(Method::Post, ContainerPath(name), &body, "endpoint.migration_source");
    const OperationInfo operation = AsyncOperation(envelope);

    MigrationSession session;
    session.operation = operation.path;
    session.secrets = DecodeSecrets(MetadataOf(envelope).value("metadata", nlohmann::json::object()));
    session.sourceEndpoint = remote_.name;
    return session;
}

std::vector<std::string> RestEndpointClient::Addresses() {
    return Server().addresses;
}

std::string RestEndpointClient::Certificate() {
    return Server().certificate;
}

OperationInfo RestEndpointClient::MigrateFrom(const MigrationRequest& request) {
    const nlohmann::json body = BuildMigrateFromBody(request);
    try {
        const nlohmann::json envelope =
            Request(Method::Post, std::string(kApiRoot) + "/containers", &body, "endpoint.migrate_from");
        return AsyncOperation(envelope);
    } catch (const CopyError& error) {
        throw CopyError(ErrorKind::Handshake, error.what());
    } catch (const nlohmann::json::exception& ex) {
        throw CopyError(ErrorKind::Handshake, remote_.name + ": malformed migration response: " + ex.what());
    }
}

OperationInfo RestEndpointClient::WaitForCompletion(const std::string& operation) {
    const nlohmann::json envelope = Request(Method::Get, operation + "/wait", nullptr, "endpoint.wait", true);
    OperationInfo info = DecodeOperation(MetadataOf(envelope));
    info.path = operation;

    if (!info.Succeeded()) {
        throw CopyError(ErrorKind::Upstream, info.error.empty() ? "operation " + info.status : info.error);
    }
    return info;
}

OperationInfo RestEndpointClient::GetOperation(const std::string& operation) {
    const nlohmann::json envelope = Request(Method::Get, operation, nullptr, "endpoint.get_operation");
    OperationInfo info = DecodeOperation(MetadataOf(envelope));
    info.path = operation;
    return info;
}

std::string RestEndpointClient::ContainerPath(const std::string& name) {
    const std::string root = std::string(kApiRoot) + "/containers/";
    const auto slash = name.find('/');
    if (slash == std::string::npos) {
        return root + name;
    }
    return root + name.substr(0, slash) + "/snapshots/" + name.substr(slash + 1);
}

EntityInfo RestEndpointClient::DecodeEntity(const nlohmann::json& metadata) {
    if (!metadata.is_object()) {
        throw CopyError(ErrorKind::Decode, "container record is not an object");
    }

    EntityInfo info;
    try {
        info.state.architecture = metadata.value("architecture", std::string());
        info.state.config = metadata.value("config", ConfigMap());
        info.state.devices = metadata.value("devices", DeviceMap());
        info.state.profiles = metadata.value("profiles", std::vector<std::string>());
        info.ephemeral = metadata.value("ephemeral", false);
    } catch (const nlohmann::json::exception& ex) {
        throw CopyError(ErrorKind::Decode, std::string("malformed container record: ") + ex.what());
    }
    return info;
}

OperationInfo RestEndpointClient::DecodeOperation(const nlohmann::json& metadata) {
    if (!metadata.is_object()) {
        throw CopyError(ErrorKind::Decode, "operation record is not an object");
    }

    OperationInfo info;
    try {
        info.id = metadata.value("id", std::string());
        info.status = metadata.value("status", std::string());
        info.error = metadata.value("err", std::string());
        if (metadata.contains("resources") && metadata["resources"].is_object()) {
            info.resources = metadata["resources"].get<std::map<std::string, std::vector<std::string>>>();
        }
    } catch (const nlohmann::json::exception& ex) {
        throw CopyError(ErrorKind::Decode, std::string("malformed operation record: ") + ex.what());
    }

    if (!info.id.empty()) {
        info.path = std::string(kApiRoot) + "/operations/" + info.id;
    }
    return info;
}

std::map<std::string, std::string> RestEndpointClient::DecodeSecrets(const nlohmann::json& metadata) {
    if (!metadata.is_object()) {
        throw CopyError(ErrorKind::Decode, "migration secrets are not an object");
    }

    std::map<std::string, std::string> secrets;
    for (auto it = metadata.begin(); it != metadata.end(); ++it) {
        if (!it.value().is_string()) {
            throw CopyError(ErrorKind::Decode, "migration secret " + it.key() + " is not a string");
        }
        secrets[it.key()] = it.value().get<std::string>();
    }
    return secrets;
}

nlohmann::json RestEndpointClient::BuildLocalCopyBody(const LocalCopyRequest& request) {
    nlohmann::json body = {
        {"config", request.config},
        {"profiles", request.profiles},
        {"ephemeral", request.ephemeral},
        {"source", {
            {"type", "copy"},
            {"source", request.sourceName},
            {"container_only", request.containerOnly}
        }}
    };
    if (!request.destName.empty()) {
        body["name"] = request.destName;
    }
    return body;
}

nlohmann::json RestEndpointClient::BuildMigrateFromBody(const MigrationRequest& request) {
    nlohmann::json body = {
        {"architecture", request.state.architecture},
        {"config", request.state.config},
        {"devices", request.state.devices},
        {"profiles", request.state.profiles},
        {"ephemeral", request.ephemeral},
        {"source", {
            {"type", "migration"},
            {"mode", "pull"},
            {"operation", request.sourceOperationUrl},
            {"certificate", request.certificate},
            {"secrets", request.secrets},
            {"base-image", request.baseImage},
            {"live", request.stateful},
            {"container_only", request.containerOnly}
        }}
    };
    if (!request.destName.empty()) {
        body["name"] = request.destName;
    }
    return body;
}

nlohmann::json RestEndpointClient::Request(
    Method method,
    const std::string& path,
    const nlohmann::json* body,
    const std::string& spanName,
    bool unbounded) const {
    const bool post = method == Method::Post;
    const std::string url = BuildUrl(baseUrl_, path);

    ScopedSpan span(spanName);
    span.Set("http.method", MethodName(post));
    span.Set("http.url", url);
    span.Set("ctcopy.endpoint", remote_.name);

    cpr::Session session;
    session.SetUrl(cpr::Url{url});
    cpr::Header headers{{"traceparent", span.TraceParent()}};
    if (body != nullptr) {
        headers["Content-Type"] = "application/json";
        session.SetBody(cpr::Body{body->dump()});
    }
    session.SetHeader(headers);
    session.SetConnectTimeout(cpr::ConnectTimeout{kConnectTimeout});
    if (!unbounded) {
        session.SetTimeout(cpr::Timeout{kRequestTimeout});
    }
    if (!socketPath_.empty()) {
        session.SetUnixSocket(cpr::UnixSocket{socketPath_});
    } else if (remote_.tls.enabled) {
        session.SetSslOptions(BuildSslOptions(remote_.tls));
    }

    const cpr::Response response = post ? session.Post() : session.Get();
    span.Set("http.status_code", static_cast<int64_t>(response.status_code));

    if (response.error.code != cpr::ErrorCode::OK) {
        std::cerr << "[Endpoint] " << MethodName(post) << " " << url << " failed: " << response.error.message << std::endl;
        throw CopyError(ErrorKind::Upstream, remote_.name + ": " + response.error.message);
    }

    auto envelope = nlohmann::json::parse(response.text, nullptr, false);
    if (response.status_code == 404) {
        throw CopyError(ErrorKind::NotFound, EnvelopeError(envelope, response.status_code));
    }

    if (envelope.is_discarded() || !envelope.is_object()) {
        std::cerr << "[Endpoint] " << MethodName(post) << " " << url
                  << " returned a malformed body (HTTP " << response.status_code << ")" << std::endl;
        throw CopyError(ErrorKind::Decode, remote_.name + ": malformed response body");
    }

    if (response.status_code >= 400 || envelope.value("type", std::string()) == "error") {
        std::cerr << "[Endpoint] " << MethodName(post) << " " << url << " failed with HTTP " << response.status_code << std::endl;
        throw CopyError(ErrorKind::Upstream, EnvelopeError(envelope, response.status_code));
    }

    span.Succeed();
    return envelope;
}

OperationInfo RestEndpointClient::AsyncOperation(const nlohmann::json& envelope) const {
    if (envelope.value("type", std::string()) != "async") {
        throw CopyError(ErrorKind::Decode, remote_.name + ": expected an asynchronous operation");
    }

    OperationInfo info = DecodeOperation(MetadataOf(envelope));
    const std::string operation = envelope.value("operation", std::string());
    if (!operation.empty()) {
        info.path = operation;
    }
    if (info.path.empty()) {
        throw CopyError(ErrorKind::Decode, remote_.name + ": operation response carries no operation");
    }
    return info;
}

const RestEndpointClient::ServerInfo& RestEndpointClient::Server() {
    if (server_) {
        return *server_;
    }

    const nlohmann::json envelope = Request(Method::Get, kApiRoot, nullptr, "endpoint.server_info");
    ServerInfo info;
    try {
        const auto environment = MetadataOf(envelope).value("environment", nlohmann::json::object());
        info.addresses = environment.value("addresses", std::vector<std::string>());
        info.certificate = environment.value("certificate", std::string());
    } catch (const nlohmann::json::exception& ex) {
        throw CopyError(ErrorKind::Decode, std::string("malformed server record: ") + ex.what());
    }

    server_ = std::move(info);
    return *server_;
}
