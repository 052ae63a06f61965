#include "strata_errors.h"

namespace strata {

const char* to_string(FailureKind kind) {
    switch (kind) {
    case FailureKind::SnapshotNotFound:   return "SnapshotNotFound";
    case FailureKind::MissingCacheGroup:  return "MissingCacheGroup";
    case FailureKind::MissingMetadata:    return "MissingMetadata";
    case FailureKind::MissingPartition:   return "MissingPartition";
    case FailureKind::CorruptPage:        return "CorruptPage";
    case FailureKind::StructureViolation: return "StructureViolation";
    case FailureKind::NodeUnreachable:    return "NodeUnreachable";
    case FailureKind::NodeTimedOut:       return "NodeTimedOut";
    case FailureKind::Cancelled:          return "Cancelled";
    case FailureKind::Internal:           return "Internal";
    }
    return "Unknown";
}

bool failure_kind_from_u8(uint8_t v, FailureKind& out) {
    if (v < static_cast<uint8_t>(FailureKind::SnapshotNotFound) ||
        v > static_cast<uint8_t>(FailureKind::Internal)) {
        return false;
    }
    out = static_cast<FailureKind>(v);
    return true;
}

StrataError::StrataError(FailureKind kind, const std::string& msg)
    : std::runtime_error(msg),
      kind_(kind) {}

FailureKind NodeFailure::kind() const {
    return root_cause().kind;
}

const FailureCause& NodeFailure::root_cause() const {
    static const FailureCause unknown{FailureKind::Internal, "unknown failure"};
    if (causes.empty()) {
        return unknown;
    }
    return causes.back();
}

bool NodeFailure::has_cause(FailureKind kind) const {
    for (const auto& c : causes) {
        if (c.kind == kind) {
            return true;
        }
    }
    return false;
}

std::string NodeFailure::message() const {
    if (causes.empty()) {
        return root_cause().message;
    }
    return causes.front().message;
}

NodeFailure NodeFailure::make(FailureKind kind, const std::string& message) {
    NodeFailure f;
    f.causes.push_back(FailureCause{kind, message});
    return f;
}

namespace {

void unwind(const std::exception& ex, std::vector<FailureCause>& out) {
    FailureKind kind = FailureKind::Internal;
    if (auto* se = dynamic_cast<const StrataError*>(&ex)) {
        kind = se->kind();
    }
    out.push_back(FailureCause{kind, ex.what()});

    try {
        std::rethrow_if_nested(ex);
    } catch (const std::exception& inner) {
        unwind(inner, out);
    } catch (...) {
        out.push_back(FailureCause{FailureKind::Internal, "non-standard exception"});
    }
}

}  // namespace

NodeFailure NodeFailure::from_exception(std::exception_ptr ep) {
    NodeFailure f;
    if (!ep) {
        return make(FailureKind::Internal, "no exception");
    }
    try {
        std::rethrow_exception(ep);
    } catch (const std::exception& ex) {
        unwind(ex, f.causes);
    } catch (...) {
        f.causes.push_back(FailureCause{FailureKind::Internal, "non-standard exception"});
    }
    return f;
}

}  // namespace strata
