#include "CopyError.hpp"

CopyError::CopyError(ErrorKind kind, const std::string& message)
    : std::runtime_error(message),
      kind_(kind) {}

const char* CopyError::KindName(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::Argument:
        return "argument";
    case ErrorKind::Config:
        return "config";
    case ErrorKind::SameName:
        return "same-name";
    case ErrorKind::NotFound:
        return "not-found";
    case ErrorKind::ProfileMismatch:
        return "profile-mismatch";
    case ErrorKind::Handshake:
        return "handshake";
    case ErrorKind::DestinationOperation:
        return "destination-operation";
    case ErrorKind::SourceMigration:
        return "source-migration";
    case ErrorKind::DestinationMigration:
        return "destination-migration";
    case ErrorKind::MissingResource:
        return "missing-resource";
    case ErrorKind::Decode:
        return "decode";
    case ErrorKind::Upstream:
        return "upstream";
    }
    return "unknown";
}
