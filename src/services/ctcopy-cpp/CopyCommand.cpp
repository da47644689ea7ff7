#include "CopyCommand.hpp"

#include "CopyError.hpp"
#include "LocalCopyExecutor.hpp"
#include "MigrationOrchestrator.hpp"
#include "ProfileChecker.hpp"
#include "ResultReporter.hpp"
#include "StateResolver.hpp"
#include "Tracing.hpp"

#include <memory>
#include <utility>

namespace {
std::unique_ptr<EndpointClient> Connect(const ClientFactory& factory, const std::string& endpoint) {
    std::unique_ptr<EndpointClient> client = factory(endpoint);
    if (!client) {
        throw CopyError(ErrorKind::Config, "no client available for remote " + endpoint);
    }
    return client;
}
} // namespace

CopyCommand::CopyCommand(const RemoteConfig& config, ClientFactory factory, std::ostream& output)
    : config_(config),
      factory_(std::move(factory)),
      output_(output) {}

void CopyCommand::Run(const CopyRequest& request) {
    const EntityReference source = config_.ParseLocator(request.sourceLocator);
    EntityReference dest = request.destLocator.empty()
        ? EntityReference{source.endpoint, std::string()}
        : config_.ParseLocator(request.destLocator);

    if (source.name.empty()) {
        throw CopyError(ErrorKind::Argument, "you must specify a source container name");
    }

    if (dest.name.empty() && !request.destLocator.empty()) {
        dest.name = source.name;
    }

    const bool sameEndpoint = source.endpoint == dest.endpoint;
    if (sameEndpoint && source.name == dest.name) {
        throw CopyError(ErrorKind::SameName, "can't copy to the same container name");
    }

    ScopedSpan span("ctcopy.copy");
    span.Set("ctcopy.source", source.endpoint + ":" + source.name);
    span.Set("ctcopy.destination", dest.endpoint + ":" + dest.name);

    std::unique_ptr<EndpointClient> sourceClient = Connect(factory_, source.endpoint);

    StateOverrides overrides;
    overrides.profiles = request.profiles;
    overrides.config = request.configOverrides;
    overrides.keepVolatile = request.keepVolatile;
    const ResolvedState resolved = StateResolver(*sourceClient).Resolve(source.name, overrides);

    ResultReporter reporter(output_);
    const bool reportName = request.destLocator.empty();

    if (sameEndpoint) {
        LocalCopyOptions options;
        options.sourceName = source.name;
        options.destName = dest.name;
        options.ephemeral = request.ephemeral.value_or(false);
        options.containerOnly = request.containerOnly;
        options.reportName = reportName;

        LocalCopyExecutor(*sourceClient, reporter).Run(options, resolved);
        span.Succeed();
        return;
    }

    std::unique_ptr<EndpointClient> destClient = Connect(factory_, dest.endpoint);
    ProfileChecker(*destClient).Check(resolved.state.profiles);

    MigrationOptions options;
    options.sourceName = source.name;
    options.destName = dest.name;
    options.ephemeral = request.ephemeral;
    options.stateful = request.stateful;
    options.containerOnly = request.containerOnly;
    options.reportName = reportName;

    MigrationOrchestrator(*sourceClient, *destClient, reporter).Run(options, resolved);
    span.Succeed();
}
