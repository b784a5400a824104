#pragma once

#include <cstdint>
#include <exception>
#include <stdexcept>
#include <string>

namespace blobstrip {

// ---------------------------------------------------------------------------
// Base exception
// ---------------------------------------------------------------------------

/// Base class for all blobstrip exceptions.
class BlobstripError : public std::runtime_error {
public:
    explicit BlobstripError(const std::string& msg) : std::runtime_error(msg) {}
};

// ---------------------------------------------------------------------------
// Object graph errors (fatal for the current pass)
// ---------------------------------------------------------------------------

/// A referenced object id is absent from the store.
class MissingObjectError : public BlobstripError {
public:
    explicit MissingObjectError(const std::string& id)
        : BlobstripError("missing object: " + id), id_(id) {}
    const std::string& id() const { return id_; }
private:
    std::string id_;
};

/// A stored object could not be deserialized.
class CorruptObjectError : public BlobstripError {
public:
    CorruptObjectError(const std::string& id, const std::string& why)
        : BlobstripError("corrupt object " + id + ": " + why), id_(id) {}
    const std::string& id() const { return id_; }
private:
    std::string id_;
};

// ---------------------------------------------------------------------------
// Reference errors
// ---------------------------------------------------------------------------

/// A compare-and-swap ref update failed because the ref moved
/// concurrently.  Object writes of the pass stay valid; the whole pass
/// may be retried.
class RefConflictError : public BlobstripError {
public:
    explicit RefConflictError(const std::string& ref_name)
        : BlobstripError("ref conflict: " + ref_name +
                         " changed during the update"),
          ref_name_(ref_name) {}
    const std::string& ref_name() const { return ref_name_; }
private:
    std::string ref_name_;
};

/// Backup refs of an earlier, unconfirmed rewrite are still present.
class BackupExistsError : public BlobstripError {
public:
    explicit BackupExistsError(const std::string& ref_name)
        : BlobstripError("backup ref already exists: " + ref_name +
                         " (run gc --confirm or rollback first)"),
          ref_name_(ref_name) {}
    const std::string& ref_name() const { return ref_name_; }
private:
    std::string ref_name_;
};

/// There is no recorded rewrite to roll back.
class NothingToRollBackError : public BlobstripError {
public:
    NothingToRollBackError()
        : BlobstripError("no pending rewrite to roll back") {}
};

/// A ref name violates git's naming rules.
class InvalidRefNameError : public BlobstripError {
public:
    explicit InvalidRefNameError(const std::string& msg)
        : BlobstripError("invalid ref name: " + msg) {}
};

// ---------------------------------------------------------------------------
// Precondition errors (rejected before any mutation)
// ---------------------------------------------------------------------------

/// Non-positive threshold or malformed path predicate.
class PolicyInvalidError : public BlobstripError {
public:
    explicit PolicyInvalidError(const std::string& msg)
        : BlobstripError("invalid policy: " + msg) {}
};

/// GC invoked without confirmation or while a rewrite holds the store.
class GcPreconditionError : public BlobstripError {
public:
    explicit GcPreconditionError(const std::string& msg)
        : BlobstripError("gc refused: " + msg) {}
};

/// The store cannot be opened or locked.
class StoreUnavailableError : public BlobstripError {
public:
    explicit StoreUnavailableError(const std::string& msg)
        : BlobstripError("store unavailable: " + msg) {}
};

/// The pass was cancelled before the ref transaction started.
class CancelledError : public BlobstripError {
public:
    CancelledError() : BlobstripError("rewrite cancelled") {}
};

/// An object id string is not a valid 40-char hex SHA.
class InvalidHashError : public BlobstripError {
public:
    explicit InvalidHashError(const std::string& hash)
        : BlobstripError("invalid hash: " + hash) {}
};

/// A low-level libgit2 operation failed.
class GitError : public BlobstripError {
public:
    explicit GitError(const std::string& msg)
        : BlobstripError("git error: " + msg) {}
};

/// A filesystem I/O error occurred.
class IoError : public BlobstripError {
public:
    explicit IoError(const std::string& msg)
        : BlobstripError("io error: " + msg) {}
};

// ---------------------------------------------------------------------------
// Result codes
// ---------------------------------------------------------------------------

/// Abstract outcome of an operation.
enum class ResultCode : uint8_t {
    Success,
    SuccessDryRun,
    Failure,
    ConflictAborted,
    PolicyInvalid,
    StoreUnavailable,
    MissingObject,
    CorruptObject,
    GcRefused,
    PendingBackup,
    Cancelled,
    NothingToRollBack,
};

/// Process exit status for a result code (both success codes exit 0).
int exit_status(ResultCode code);

/// Map an in-flight exception onto its result code.
ResultCode result_code_for(const std::exception_ptr& error);

/// Short machine-readable name of a result code.
const char* result_code_name(ResultCode code);

} // namespace blobstrip
