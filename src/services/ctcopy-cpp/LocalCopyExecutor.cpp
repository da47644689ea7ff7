#include "LocalCopyExecutor.hpp"

#include "CopyError.hpp"
#include "Tracing.hpp"

LocalCopyExecutor::LocalCopyExecutor(EndpointClient& endpoint, ResultReporter& reporter)
    : endpoint_(endpoint),
      reporter_(reporter) {}

void LocalCopyExecutor::Run(const LocalCopyOptions& options, const ResolvedState& resolved) {
    if (options.sourceName == options.destName) {
        throw CopyError(ErrorKind::SameName, "can't copy to the same container name");
    }

    ScopedSpan span("ctcopy.local_copy");
    span.Set("ctcopy.endpoint", endpoint_.Name());
    span.Set("ctcopy.source", options.sourceName);
    span.SetFlag("ctcopy.container_only", options.containerOnly);

    LocalCopyRequest request;
    request.sourceName = options.sourceName;
    request.destName = options.destName;
    request.config = resolved.state.config;
    request.profiles = resolved.state.profiles;
    request.ephemeral = options.ephemeral;
    request.containerOnly = options.containerOnly;

    const OperationInfo started = endpoint_.LocalCopy(request);
    const OperationInfo completed = endpoint_.WaitForCompletion(started.path);

    if (options.reportName) {
        reporter_.ReportCreated(completed);
    }
    span.Succeed();
}
