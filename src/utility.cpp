#include "memobuild/utility.hpp"

namespace memobuild {

std::string_view to_string(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::FilesystemError:
        return "FilesystemError";
    case ErrorKind::CyclicDependency:
        return "CyclicDependency";
    case ErrorKind::UnknownInput:
        return "UnknownInput";
    case ErrorKind::CacheMiss:
        return "CacheMiss";
    case ErrorKind::CASIntegrityFailure:
        return "CASIntegrityFailure";
    case ErrorKind::NetworkError:
        return "NetworkError";
    case ErrorKind::RunnerError:
        return "RunnerError";
    case ErrorKind::InvalidState:
        return "InvalidState";
    case ErrorKind::ParseError:
        return "ParseError";
    case ErrorKind::Cancelled:
        return "Cancelled";
    case ErrorKind::StorageError:
        return "StorageError";
    }
    return "Unknown";
}

} // namespace memobuild
