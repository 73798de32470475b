#include "stage_result.hpp"

const char* failure_kind_name(FailureKind kind) {
    switch (kind) {
    case FailureKind::ArgumentError:
        return "ArgumentError";
    case FailureKind::MissingTool:
        return "MissingTool";
    case FailureKind::InvalidCredential:
        return "InvalidCredential";
    case FailureKind::NotAuthenticated:
        return "NotAuthenticated";
    case FailureKind::MissingArtifact:
        return "MissingArtifact";
    case FailureKind::MissingIdentity:
        return "MissingIdentity";
    case FailureKind::AlreadyExists:
        return "AlreadyExists";
    case FailureKind::RemoteError:
        return "RemoteError";
    case FailureKind::VcsError:
        return "VcsError";
    case FailureKind::PushError:
        return "PushError";
    }
    return "";
}

std::string describe(const Failure& failure) {
    return std::string("Error [") + failure_kind_name(failure.kind) + "]: " + failure.message;
}
