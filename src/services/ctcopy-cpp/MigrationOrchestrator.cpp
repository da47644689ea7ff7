#include "MigrationOrchestrator.hpp"

#include "Tracing.hpp"

#include <exception>
#include <functional>
#include <iostream>
#include <vector>

namespace {
constexpr std::size_t kWaiterCount = 2;

void WaitSide(EndpointClient& client, const std::string& operation, MigrationSide side, OutcomeChannel& channel) {
    SideOutcome outcome;
    outcome.side = side;
    try {
        outcome.operation = client.WaitForCompletion(operation);
        outcome.ok = true;
    } catch (const std::exception& ex) {
        outcome.error = ex.what();
    }
    channel.Send(std::move(outcome));
}

std::string ParentContainer(const std::string& name) {
    const auto slash = name.find('/');
    return slash == std::string::npos ? name : name.substr(0, slash);
}

const char* AttemptStatusName(AttemptStatus status) {
    switch (status) {
    case AttemptStatus::Success:
        return "success";
    case AttemptStatus::Retryable:
        return "retryable";
    case AttemptStatus::Fatal:
        return "fatal";
    }
    return "unknown";
}
} // namespace

MigrationOrchestrator::MigrationOrchestrator(EndpointClient& source, EndpointClient& destination, ResultReporter& reporter)
    : source_(source),
      destination_(destination),
      reporter_(reporter) {}

void MigrationOrchestrator::Run(const MigrationOptions& options, const ResolvedState& resolved) {
    ScopedSpan span("ctcopy.migration");
    span.Set("ctcopy.source", source_.Name() + ":" + options.sourceName);
    span.Set("ctcopy.destination", destination_.Name());
    span.SetFlag("ctcopy.stateful", options.stateful);

    const bool ephemeral = ResolveEphemeral(options);
    const MigrationSession session = Negotiate(options);
    const std::vector<std::string> addresses = source_.Addresses();
    span.Set("ctcopy.candidate_addresses", static_cast<int64_t>(addresses.size()));

    MigrationRequest request;
    request.destName = options.destName;
    request.certificate = source_.Certificate();
    request.secrets = session.secrets;
    request.state = resolved.state;
    request.baseImage = resolved.baseImage;
    request.ephemeral = ephemeral;
    request.stateful = options.stateful;
    request.containerOnly = options.containerOnly;

    std::string lastError;
    for (const auto& address : addresses) {
        const AttemptResult result = Attempt(address, request, session);

        if (result.status == AttemptStatus::Success) {
            if (options.reportName) {
                reporter_.ReportCreated(result.destination);
            }
            span.Succeed();
            return;
        }

        if (result.status == AttemptStatus::Fatal) {
            throw CopyError(ErrorKind::SourceMigration, "Migration failed on source host: " + result.error);
        }

        std::cerr << "[Migration] " << session.sourceEndpoint << " -> " << session.destEndpoint
                  << " via " << address << " failed (" << CopyError::KindName(result.kind) << "): "
                  << result.error << std::endl;
        lastError = result.error;
    }

    FailExhausted(session, lastError);
}

AttemptResult MigrationOrchestrator::Attempt(
    const std::string& address,
    const MigrationRequest& request,
    const MigrationSession& session) {
    ScopedSpan span("ctcopy.migration.attempt");
    span.Set("net.peer.address", address);

    MigrationRequest attempt = request;
    attempt.sourceOperationUrl = SourceOperationUrl(address, session.operation);

    AttemptResult result;
    OperationInfo accepted;
    try {
        accepted = destination_.MigrateFrom(attempt);
    } catch (const std::exception& error) {
        result.status = AttemptStatus::Retryable;
        result.kind = ErrorKind::Handshake;
        result.error = error.what();
        span.Set("ctcopy.attempt.status", AttemptStatusName(result.status));
        return result;
    }

    auto [destination, source] = AwaitBothSides(accepted.path, session.operation);

    if (!destination.ok) {
        result.status = AttemptStatus::Retryable;
        result.kind = ErrorKind::DestinationOperation;
        result.error = destination.error;
    } else if (!source.ok) {
        result.status = AttemptStatus::Fatal;
        result.kind = ErrorKind::SourceMigration;
        result.error = source.error;
    } else {
        result.status = AttemptStatus::Success;
        result.destination = std::move(destination.operation);
        span.Succeed();
    }

    span.Set("ctcopy.attempt.status", AttemptStatusName(result.status));
    return result;
}

std::string MigrationOrchestrator::SourceOperationUrl(const std::string& address, const std::string& operation) {
    return "https://" + address + operation;
}

bool MigrationOrchestrator::ResolveEphemeral(const MigrationOptions& options) const {
    if (options.ephemeral.has_value()) {
        return *options.ephemeral;
    }

    return source_.ContainerInfo(ParentContainer(options.sourceName)).ephemeral;
}

MigrationSession MigrationOrchestrator::Negotiate(const MigrationOptions& options) const {
    MigrationSession session = source_.NegotiateMigrationSession(options.sourceName, options.stateful, options.containerOnly);
    session.sourceEndpoint = source_.Name();
    session.destEndpoint = destination_.Name();
    return session;
}

std::pair<SideOutcome, SideOutcome> MigrationOrchestrator::AwaitBothSides(
    const std::string& destOperation,
    const std::string& sourceOperation) {
    OutcomeChannel channel(kWaiterCount);

    WaiterThread destWaiter(WaitSide, std::ref(destination_), destOperation, MigrationSide::Destination, std::ref(channel));
    WaiterThread sourceWaiter(WaitSide, std::ref(source_), sourceOperation, MigrationSide::Source, std::ref(channel));

    SideOutcome destination;
    SideOutcome source;
    for (std::size_t i = 0; i < kWaiterCount; ++i) {
        SideOutcome outcome = channel.Receive();
        if (outcome.side == MigrationSide::Source) {
            source = std::move(outcome);
        } else {
            destination = std::move(outcome);
        }
    }

    destWaiter.Join();
    sourceWaiter.Join();
    return {std::move(destination), std::move(source)};
}

void MigrationOrchestrator::FailExhausted(const MigrationSession& session, const std::string& lastError) const {
    std::string sourceError;
    try {
        sourceError = source_.GetOperation(session.operation).error;
    } catch (const std::exception& error) {
        std::cerr << "[Migration] Unable to query operation " << session.operation
                  << " on " << session.sourceEndpoint << ": " << error.what() << std::endl;
    }

    if (!sourceError.empty()) {
        throw CopyError(ErrorKind::SourceMigration, "Migration failed on source host: " + sourceError);
    }

    const std::string reason = lastError.empty() ? "no candidate address was available" : lastError;
    throw CopyError(ErrorKind::DestinationMigration, "Migration failed on target host: " + reason);
}
