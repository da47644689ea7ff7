#pragma once

#include "CopyTypes.hpp"

#include <string>
#include <vector>

struct ParsedCommandLine {
    CopyRequest request;
    bool help = false;
};

ParsedCommandLine ParseCommandLine(const std::vector<std::string>& args);
std::string UsageText();
