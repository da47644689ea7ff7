#pragma once

#include "CopyError.hpp"
#include "EndpointClient.hpp"
#include "OutcomeChannel.hpp"
#include "ResultReporter.hpp"
#include "StateResolver.hpp"

#include <optional>
#include <string>
#include <utility>

struct MigrationOptions {
    std::string sourceName;
    std::string destName;
    // Unset means "inherit from the source container".
    std::optional<bool> ephemeral;
    bool stateful = false;
    bool containerOnly = false;
    bool reportName = false;
};

enum class AttemptStatus {
    Success,
    Retryable,
    Fatal
};

struct AttemptResult {
    AttemptStatus status = AttemptStatus::Retryable;
    ErrorKind kind = ErrorKind::Handshake;
    std::string error;
    OperationInfo destination;
};

class MigrationOrchestrator {
public:
    MigrationOrchestrator(EndpointClient& source, EndpointClient& destination, ResultReporter& reporter);

    void Run(const MigrationOptions& options, const ResolvedState& resolved);

    // One handshake against one candidate address, followed by the joint wait
    // on both operations when the destination accepts.
    AttemptResult Attempt(const std::string& address, const MigrationRequest& request, const MigrationSession& session);

    static std::string SourceOperationUrl(const std::string& address, const std::string& operation);

private:
    bool ResolveEphemeral(const MigrationOptions& options) const;
    MigrationSession Negotiate(const MigrationOptions& options) const;
    std::pair<SideOutcome, SideOutcome> AwaitBothSides(const std::string& destOperation, const std::string& sourceOperation);
    [[noreturn]] void FailExhausted(const MigrationSession& session, const std::string& lastError) const;

    EndpointClient& source_;
    EndpointClient& destination_;
    ResultReporter& reporter_;
};
