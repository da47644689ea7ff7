#pragma once

#include "EndpointClient.hpp"
#include "ResultReporter.hpp"
#include "StateResolver.hpp"

#include <string>

struct LocalCopyOptions {
    std::string sourceName;
    std::string destName;
    bool ephemeral = false;
    bool containerOnly = false;
    // Set when the caller named no destination and expects the generated name.
    bool reportName = false;
};

class LocalCopyExecutor {
public:
    LocalCopyExecutor(EndpointClient& endpoint, ResultReporter& reporter);

    void Run(const LocalCopyOptions& options, const ResolvedState& resolved);

private:
    EndpointClient& endpoint_;
    ResultReporter& reporter_;
};
