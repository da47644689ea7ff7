#pragma once

#include <stdexcept>
#include <string>

enum class ErrorKind {
    Argument,
    Config,
    SameName,
    NotFound,
    ProfileMismatch,
    Handshake,
    DestinationOperation,
    SourceMigration,
    DestinationMigration,
    MissingResource,
    Decode,
    Upstream
};

class CopyError : public std::runtime_error {
public:
    CopyError(ErrorKind kind, const std::string& message);

    ErrorKind Kind() const { return kind_; }

    static const char* KindName(ErrorKind kind);

private:
    ErrorKind kind_;
};
