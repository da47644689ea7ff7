#include "CommandLine.hpp"
#include "CopyCommand.hpp"
#include "CopyError.hpp"
#include "RemoteConfig.hpp"
#include "RestEndpointClient.hpp"
#include "Tracing.hpp"

#include <exception>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

namespace {
TraceConfig LoadTraceConfig() {
    TraceConfig config;
    config.enabled = GetEnvBool("CTCOPY_OTEL_ENABLED", false);
    config.endpoint = GetEnvOrDefault("CTCOPY_OTEL_ENDPOINT", "");
    config.serviceName = GetEnvOrDefault("CTCOPY_OTEL_SERVICE", "ctcopy");
    return config;
}

RemoteConfig LoadRemoteConfig() {
    RemoteConfig config = RemoteConfig::Load(RemoteConfig::DefaultConfigDir());
    const std::string remote = GetEnvOrDefault("CTCOPY_REMOTE", "");
    if (!remote.empty()) {
        config.SetDefaultRemote(remote);
    }
    return config;
}

int Fail(const std::string& message) {
    std::cerr << "Error: " << message << std::endl;
    return 1;
}
} // namespace

int main(int argc, char** argv) {
    const std::vector<std::string> args(argv + 1, argv + argc);

    ParsedCommandLine commandLine;
    try {
        commandLine = ParseCommandLine(args);
    } catch (const CopyError& ex) {
        std::cerr << UsageText();
        return Fail(ex.what());
    }

    if (commandLine.help) {
        std::cout << UsageText();
        return 0;
    }

    Tracer::Instance().Configure(LoadTraceConfig());

    int status = 0;
    try {
        const RemoteConfig config = LoadRemoteConfig();
        CopyCommand command(
            config,
            [&config](const std::string& endpoint) -> std::unique_ptr<EndpointClient> {
                return std::make_unique<RestEndpointClient>(config.GetRemote(endpoint));
            },
            std::cout);
        command.Run(commandLine.request);
    } catch (const CopyError& ex) {
        status = Fail(ex.what());
    } catch (const std::exception& ex) {
        status = Fail(ex.what());
    }

    Tracer::Instance().Shutdown();
    return status;
}
