#include "util/result.hpp"

namespace piprov {

const char* ErrorKindName(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None:              return "Ok";
        case ErrorKind::Resolution:        return "ResolutionError";
        case ErrorKind::AssetNotFound:     return "AssetNotFoundError";
        case ErrorKind::InsufficientSpace: return "InsufficientSpaceError";
        case ErrorKind::Download:          return "DownloadError";
        case ErrorKind::ChecksumMismatch:  return "ChecksumMismatchError";
        case ErrorKind::Extraction:        return "ExtractionError";
        case ErrorKind::DiskNotFound:      return "DiskNotFoundError";
        case ErrorKind::UnsafeTarget:      return "UnsafeTargetError";
        case ErrorKind::UserAborted:       return "UserAborted";
        case ErrorKind::Flash:             return "FlashError";
        case ErrorKind::MountTimeout:      return "MountTimeoutError";
        case ErrorKind::Config:            return "ConfigError";
        case ErrorKind::Io:                return "IoError";
        case ErrorKind::Usage:             return "UsageError";
    }
    return "Error";
}

} // namespace piprov
