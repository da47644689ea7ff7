#include "ResultReporter.hpp"

#include "CopyError.hpp"

namespace {
constexpr const char* kMissingResourceMessage = "didn't get any affected image, container or snapshot from server";
} // namespace

ResultReporter::ResultReporter(std::ostream& output)
    : output_(output) {}

std::string ResultReporter::CreatedName(const OperationInfo& operation) {
    const auto it = operation.resources.find("containers");
    if (it == operation.resources.end() || it->second.empty()) {
        throw CopyError(ErrorKind::MissingResource, kMissingResourceMessage);
    }

    std::string path = it->second.front();
    while (!path.empty() && path.back() == '/') {
        path.pop_back();
    }

    const auto lastSlash = path.find_last_of('/');
    const std::string name = lastSlash == std::string::npos ? path : path.substr(lastSlash + 1);
    if (name.empty()) {
        throw CopyError(ErrorKind::MissingResource, kMissingResourceMessage);
    }
    return name;
}

void ResultReporter::ReportCreated(const OperationInfo& operation) {
    output_ << "Container name is: " << CreatedName(operation) << std::endl;
}
