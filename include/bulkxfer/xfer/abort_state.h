#ifndef BULKXFER_XFER_ABORT_STATE_H
#define BULKXFER_XFER_ABORT_STATE_H

#include "bulkxfer/base/error_code.h"
#include <string>

namespace bulkxfer {

// Monotonic abort flag with the cause of the first abort.
// Not synchronized: the owning tracker guards it.
class AbortState {
public:
    AbortState() = default;

    // Returns true only for the call that performed the transition.
    // Later calls keep the first reason and description.
    bool abort(ErrorCode reason, const std::string& description);

    bool is_aborted() const { return aborted_; }
    ErrorCode reason() const { return reason_; }
    const std::string& description() const { return description_; }

private:
    bool aborted_ = false;
    ErrorCode reason_ = ErrorCode::Success;
    std::string description_;
};

} // namespace bulkxfer

#endif // BULKXFER_XFER_ABORT_STATE_H
