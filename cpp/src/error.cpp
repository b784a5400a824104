#include "blobstrip/error.h"

namespace blobstrip {

ResultCode result_code_for(const std::exception_ptr& error) {
    if (!error) return ResultCode::Success;
    try {
        std::rethrow_exception(error);
    } catch (const RefConflictError&) {
        return ResultCode::ConflictAborted;
    } catch (const BackupExistsError&) {
        return ResultCode::PendingBackup;
    } catch (const PolicyInvalidError&) {
        return ResultCode::PolicyInvalid;
    } catch (const StoreUnavailableError&) {
        return ResultCode::StoreUnavailable;
    } catch (const MissingObjectError&) {
        return ResultCode::MissingObject;
    } catch (const CorruptObjectError&) {
        return ResultCode::CorruptObject;
    } catch (const GcPreconditionError&) {
        return ResultCode::GcRefused;
    } catch (const CancelledError&) {
        return ResultCode::Cancelled;
    } catch (const NothingToRollBackError&) {
        return ResultCode::NothingToRollBack;
    } catch (const std::exception&) {
        return ResultCode::Failure;
    }
}

int exit_status(ResultCode code) {
    switch (code) {
        case ResultCode::Success:
        case ResultCode::SuccessDryRun:     return 0;
        case ResultCode::Failure:           return 1;
        case ResultCode::ConflictAborted:   return 2;
        case ResultCode::PolicyInvalid:     return 3;
        case ResultCode::StoreUnavailable:  return 4;
        case ResultCode::MissingObject:     return 5;
        case ResultCode::CorruptObject:     return 6;
        case ResultCode::GcRefused:         return 7;
        case ResultCode::PendingBackup:     return 8;
        case ResultCode::Cancelled:         return 9;
        case ResultCode::NothingToRollBack: return 10;
    }
    return 1;
}

const char* result_code_name(ResultCode code) {
    switch (code) {
        case ResultCode::Success:           return "success";
        case ResultCode::SuccessDryRun:     return "success_dry_run";
        case ResultCode::Failure:           return "failure";
        case ResultCode::ConflictAborted:   return "conflict_aborted";
        case ResultCode::PolicyInvalid:     return "policy_invalid";
        case ResultCode::StoreUnavailable:  return "store_unavailable";
        case ResultCode::MissingObject:     return "missing_object";
        case ResultCode::CorruptObject:     return "corrupt_object";
        case ResultCode::GcRefused:         return "gc_refused";
        case ResultCode::PendingBackup:     return "pending_backup";
        case ResultCode::Cancelled:         return "cancelled";
        case ResultCode::NothingToRollBack: return "nothing_to_roll_back";
    }
    return "failure";
}

} // namespace blobstrip
