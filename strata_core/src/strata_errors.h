#pragma once

#include <cstdint>
#include <exception>
#include <stdexcept>
#include <string>
#include <vector>

namespace strata {

// Failure and finding kinds of the snapshot check. Values are carried on the wire.
enum class FailureKind : uint8_t {
    SnapshotNotFound   = 1,
    MissingCacheGroup  = 2,
    MissingMetadata    = 3,
    MissingPartition   = 4,
    CorruptPage        = 5,
    StructureViolation = 6,
    NodeUnreachable    = 7,
    NodeTimedOut       = 8,
    Cancelled          = 9,
    Internal           = 10
};

const char* to_string(FailureKind kind);
bool failure_kind_from_u8(uint8_t v, FailureKind& out);

class StrataError : public std::runtime_error {
public:
    StrataError(FailureKind kind, const std::string& msg);

    FailureKind kind() const { return kind_; }

private:
    FailureKind kind_;
};

class SnapshotNotFoundError : public StrataError {
public:
    explicit SnapshotNotFoundError(const std::string& msg)
        : StrataError(FailureKind::SnapshotNotFound, msg) {}
};

// Stored page checksum differs from the recomputed one
class CorruptPageError : public StrataError {
public:
    explicit CorruptPageError(const std::string& msg)
        : StrataError(FailureKind::CorruptPage, msg) {}
};

// File or page layout is not what the page store format requires
class StructureError : public StrataError {
public:
    explicit StructureError(const std::string& msg)
        : StrataError(FailureKind::StructureViolation, msg) {}
};

class JobTimeoutError : public StrataError {
public:
    explicit JobTimeoutError(const std::string& msg)
        : StrataError(FailureKind::NodeTimedOut, msg) {}
};

class CancelledError : public StrataError {
public:
    explicit CancelledError(const std::string& msg)
        : StrataError(FailureKind::Cancelled, msg) {}
};

struct FailureCause {
    FailureKind kind;
    std::string message;

    bool operator==(const FailureCause&) const = default;
};

/*
    Failure of one node's participation in a check.

    causes[0] is the outermost context, causes.back() the root cause.
    Built from a (possibly nested) exception so it can be shipped
    between nodes and printed without the original exception types.
*/
struct NodeFailure {
    std::vector<FailureCause> causes;

    FailureKind kind() const;
    const FailureCause& root_cause() const;
    bool has_cause(FailureKind kind) const;
    std::string message() const;

    static NodeFailure make(FailureKind kind, const std::string& message);
    static NodeFailure from_exception(std::exception_ptr ep);

    bool operator==(const NodeFailure&) const = default;
};

}  // namespace strata
