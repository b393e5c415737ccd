#include "types.hpp"

namespace {

struct KindName {
    ErrorKind kind;
    const char* name;
};

const KindName kKindNames[] = {
    {ErrorKind::SessionNotFound,      "SessionNotFound"},
    {ErrorKind::SessionClosed,        "SessionClosed"},
    {ErrorKind::ResourceExhausted,    "ResourceExhausted"},
    {ErrorKind::ConnectTimeout,       "ConnectTimeout"},
    {ErrorKind::PoolExhausted,        "PoolExhausted"},
    {ErrorKind::CircuitOpen,          "CircuitOpen"},
    {ErrorKind::AuthenticationFailed, "AuthenticationFailed"},
    {ErrorKind::ProtocolError,        "ProtocolError"},
    {ErrorKind::IOError,              "IOError"},
    {ErrorKind::ConfigError,          "ConfigError"},
};

} // namespace

const char* error_kind_name(ErrorKind kind) {
    for (const auto& kn : kKindNames) {
        if (kn.kind == kind) return kn.name;
    }
    return "IOError";
}
