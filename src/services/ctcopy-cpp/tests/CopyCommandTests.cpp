#include "CopyCommand.hpp"
#include "CopyError.hpp"
#include "FakeEndpointClient.hpp"
#include "RemoteConfig.hpp"

#include <iostream>
#include <map>
#include <memory>
#include <sstream>
#include <string>

namespace {
int Fail(const std::string& message) {
    std::cerr << message << std::endl;
    return 1;
}

const char* kConfigJson = R"({
    "default-remote": "alpha",
    "remotes": {
        "alpha": {"addr": "https://alpha.example:8443"},
        "beta": {"addr": "https://beta.example:8443"}
    }
})";

struct Harness {
    Harness()
        : config(RemoteConfig::FromJson(kConfigJson, "")),
          alpha("alpha"),
          beta("beta") {
        alpha.containers["web"] = MakeEntity(
            {"default"},
            {{"limits.cpu", "2"}, {"volatile.base_image", "sha256-abc"}, {"volatile.idmap.next", "[]"}});
        alpha.session.operation = "/1.0/operations/src-1";
        alpha.session.secrets = {{"control", "c"}, {"fs", "f"}};
        alpha.addresses = {"10.0.0.1:8443"};
        beta.profiles = {"default", "web"};
    }

    ClientFactory Factory() {
        return [this](const std::string& endpoint) -> std::unique_ptr<EndpointClient> {
            config.GetRemote(endpoint);
            ++connections[endpoint];
            if (endpoint == "alpha") {
                return std::make_unique<BorrowedClient>(alpha);
            }
            return std::make_unique<BorrowedClient>(beta);
        };
    }

    CopyError RunExpectingError(const CopyRequest& request) {
        CopyCommand command(config, Factory(), output);
        try {
            command.Run(request);
        } catch (const CopyError& ex) {
            return ex;
        }
        return CopyError(ErrorKind::Upstream, "no error raised");
    }

    RemoteConfig config;
    FakeEndpointClient alpha;
    FakeEndpointClient beta;
    std::map<std::string, int> connections;
    std::ostringstream output;
};

CopyRequest Request(const std::string& source, const std::string& dest) {
    CopyRequest request;
    request.sourceLocator = source;
    request.destLocator = dest;
    return request;
}
} // namespace

int main() {
    {
        Harness harness;
        const CopyError error = harness.RunExpectingError(Request("web", "alpha:web"));
        if (error.Kind() != ErrorKind::SameName) {
            return Fail(std::string("Expected same-name failure, got: ") + error.what());
        }
        if (!harness.connections.empty()) {
            return Fail("Same-name copy must fail before any client is created.");
        }
    }

    {
        Harness harness;
        const CopyError error = harness.RunExpectingError(Request("alpha:web", "alpha:"));
        if (error.Kind() != ErrorKind::SameName) {
            return Fail("A destination without a name should reuse the source name.");
        }
    }

    {
        Harness harness;
        const CopyError error = harness.RunExpectingError(Request("alpha:", ""));
        if (error.Kind() != ErrorKind::Argument) {
            return Fail("Missing source name should be an argument error.");
        }
    }

    {
        Harness harness;
        const CopyError error = harness.RunExpectingError(Request("gamma:web", "beta:"));
        if (error.Kind() != ErrorKind::Config) {
            return Fail(std::string("Unknown remote should be a config error, got: ") + error.what());
        }
    }

    {
        Harness harness;
        harness.alpha.containers["web"].state.profiles.push_back("gpu");
        const CopyError error = harness.RunExpectingError(Request("alpha:web", "beta:web"));
        if (error.Kind() != ErrorKind::ProfileMismatch) {
            return Fail(std::string("Expected profile mismatch, got: ") + error.what());
        }
        if (harness.alpha.negotiations != 0) {
            return Fail("No migration session should be negotiated on profile mismatch.");
        }
    }

    {
        Harness harness;
        CopyRequest request = Request("web", "");
        request.profiles = {"web"};
        request.configOverrides = {{"limits.memory", "512MB"}};
        CopyCommand command(harness.config, harness.Factory(), harness.output);
        command.Run(request);

        if (harness.output.str() != "Container name is: web-copy\n") {
            return Fail("Unexpected local copy output: " + harness.output.str());
        }
        if (harness.connections.count("beta") != 0) {
            return Fail("Local copy should not contact another remote.");
        }
        if (harness.alpha.negotiations != 0 || harness.alpha.localCopies.size() != 1) {
            return Fail("Omitted destination should always run a local copy.");
        }

        const EntityInfo copy = harness.alpha.ContainerInfo("web-copy");
        if (copy.state.config.at("limits.cpu") != "2" || copy.state.config.at("limits.memory") != "512MB") {
            return Fail("Copied container lacks merged config.");
        }
        if (copy.state.config.count("volatile.idmap.next") != 0 || copy.state.config.count("volatile.base_image") != 0) {
            return Fail("Volatile keys leaked into the local copy.");
        }
        if (copy.state.profiles != std::vector<std::string>{"default", "web"}) {
            return Fail("Copied container lacks merged profiles.");
        }
    }

    {
        Harness harness;
        CopyRequest request = Request("alpha:web", "beta:");
        request.keepVolatile = true;
        CopyCommand command(harness.config, harness.Factory(), harness.output);
        command.Run(request);

        if (!harness.output.str().empty()) {
            return Fail("Migration to an explicit destination should print nothing.");
        }
        if (harness.beta.handshakes.size() != 1) {
            return Fail("Expected a single handshake.");
        }
        const MigrationRequest& handshake = harness.beta.handshakes.front();
        if (handshake.destName != "web") {
            return Fail("Destination name should default to the source name.");
        }
        if (handshake.baseImage != "sha256-abc" || handshake.state.config.count("volatile.idmap.next") == 0) {
            return Fail("Preserved volatile keys should reach the destination.");
        }
        if (handshake.ephemeral) {
            return Fail("Ephemeral flag should follow the source container.");
        }
        if (harness.beta.profileListings != 1) {
            return Fail("Destination profiles should be checked once.");
        }
    }

    return 0;
}
