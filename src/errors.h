#pragma once
#include <string>

namespace mfs {

enum class ErrKind {
    None = 0,
    DependencyUnavailable,
    InsufficientFunds,
    OutputMatchFailure,
    RemoteRequestFailure,
    SessionExpired,
    UserCancelled,
    InvalidInput,
};

struct Error {
    ErrKind kind{ErrKind::None};
    std::string message;

    bool ok() const { return kind == ErrKind::None; }
    void clear() { kind = ErrKind::None; message.clear(); }
};

inline bool fail(Error& e, ErrKind kind, const std::string& msg) {
    e.kind = kind;
    e.message = msg;
    return false;
}

// Adds the caller's context in front of the message, keeping the kind.
inline bool fail_ctx(Error& e, const std::string& context) {
    e.message = context + ": " + e.message;
    return false;
}

inline const char* err_kind_name(ErrKind k) {
    switch (k) {
        case ErrKind::None:                  return "none";
        case ErrKind::DependencyUnavailable: return "dependency-unavailable";
        case ErrKind::InsufficientFunds:     return "insufficient-funds";
        case ErrKind::OutputMatchFailure:    return "output-match-failure";
        case ErrKind::RemoteRequestFailure:  return "remote-request-failure";
        case ErrKind::SessionExpired:        return "session-expired";
        case ErrKind::UserCancelled:         return "user-cancelled";
        case ErrKind::InvalidInput:          return "invalid-input";
    }
    return "unknown";
}

bool is_user_cancel_message(const std::string& msg);

}
