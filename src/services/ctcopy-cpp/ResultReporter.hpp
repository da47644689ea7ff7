#pragma once

#include "CopyTypes.hpp"

#include <ostream>
#include <string>

class ResultReporter {
public:
    explicit ResultReporter(std::ostream& output);

    // Name of the container the operation created: the last path segment of
    // the first "containers" resource.
    static std::string CreatedName(const OperationInfo& operation);

    void ReportCreated(const OperationInfo& operation);

private:
    std::ostream& output_;
};
