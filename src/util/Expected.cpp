#include "util/Expected.hpp"

namespace gitcl {

const char* errorCodeName(ErrorCode code) {
    switch (code) {
        case ErrorCode::None: return "none";
        case ErrorCode::InvalidArgs: return "invalid-args";
        case ErrorCode::NotARepository: return "not-a-repository";
        case ErrorCode::IoError: return "io-error";
        case ErrorCode::CorruptObject: return "corrupt-object";
        case ErrorCode::ObjectNotFound: return "object-not-found";
        case ErrorCode::RefNotFound: return "ref-not-found";
        case ErrorCode::DirtyWorktree: return "dirty-worktree";
        case ErrorCode::MissingChangeId: return "missing-change-id";
        case ErrorCode::AmbiguousChangeId: return "ambiguous-change-id";
        case ErrorCode::Conflict: return "conflict";
        case ErrorCode::RemoteAhead: return "remote-ahead";
        case ErrorCode::Diverged: return "diverged";
        case ErrorCode::NotFound: return "not-found";
        case ErrorCode::NetworkError: return "network-error";
        case ErrorCode::AuthFailure: return "auth-failure";
        case ErrorCode::NotReady: return "not-ready";
        case ErrorCode::ProtocolError: return "protocol-error";
        case ErrorCode::ConfigError: return "config-error";
        case ErrorCode::InvalidTransition: return "invalid-transition";
        case ErrorCode::InternalError: return "internal-error";
    }
    return "unknown";
}

}
