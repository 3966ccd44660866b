#include "bulkxfer/xfer/abort_state.h"

namespace bulkxfer {

bool AbortState::abort(ErrorCode reason, const std::string& description) {
    if (aborted_) {
        return false;
    }
    aborted_ = true;
    reason_ = reason;
    description_ = description;
    return true;
}

} // namespace bulkxfer
