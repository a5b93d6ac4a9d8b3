#include "migration_types.hpp"

namespace gitmigrate {

const char* failure_kind_name(FailureKind kind) {
    switch (kind) {
    case FailureKind::NONE:
        return "none";
    case FailureKind::CREDENTIAL:
        return "credential";
    case FailureKind::TRANSFER:
        return "transfer";
    case FailureKind::TIMEOUT:
        return "timeout";
    case FailureKind::UNEXPECTED:
        return "unexpected";
    }
    return "unexpected";
}

namespace {
struct AuthKindName {
    const char* operator()(const NoAuth&) const { return "none"; }
    const char* operator()(const TokenAuth&) const { return "token"; }
    const char* operator()(const BasicAuth&) const { return "basic"; }
    const char* operator()(const SshAuth&) const { return "ssh"; }
};
} // namespace

const char* auth_kind_name(const AuthCredential& cred) { return std::visit(AuthKindName{}, cred); }

const TaskOutcome* BatchResult::find(const std::string& name) const {
    for (const auto& d : details) {
        if (d.name == name)
            return &d;
    }
    return nullptr;
}

} // namespace gitmigrate
