#include "genrs.hpp"

const char* error_kind_name(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::InvalidLength:           return "InvalidLength";
        case ErrorKind::UnknownPreset:           return "UnknownPreset";
        case ErrorKind::UnknownFormat:           return "UnknownFormat";
        case ErrorKind::UnknownMode:             return "UnknownMode";
        case ErrorKind::UnsupportedUuidVersion:  return "UnsupportedUuidVersion";
        case ErrorKind::MissingNamespaceOrName:  return "MissingNamespaceOrName";
        case ErrorKind::InvalidNamespace:        return "InvalidNamespace";
        case ErrorKind::RandomSourceUnavailable: return "RandomSourceUnavailable";
        case ErrorKind::DigestFailure:           return "DigestFailure";
    }
    return "Unknown";
}
