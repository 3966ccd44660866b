#include "bulkxfer/base/error_code.h"

namespace bulkxfer {

namespace {

class BulkXferCategory : public std::error_category {
public:
    const char* name() const noexcept override {
        return "bulkxfer";
    }

    std::string message(int ev) const override {
        return to_string(static_cast<ErrorCode>(ev));
    }
};

const BulkXferCategory& get_category() {
    static BulkXferCategory category;
    return category;
}

} // anonymous namespace

std::error_code make_error_code(ErrorCode code) {
    return std::error_code(static_cast<int>(code), get_category());
}

std::string to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::Success: return "Success";
        case ErrorCode::InvalidArgument: return "Invalid argument";
        case ErrorCode::Timeout: return "Operation timed out";
        case ErrorCode::Cancelled: return "Operation cancelled";
        case ErrorCode::ProtocolViolation: return "Protocol violation";
        case ErrorCode::IOError: return "I/O error";
        default: return "Unknown error";
    }
}

BulkXferError::BulkXferError(ErrorCode code, const std::string& message)
    : code_(code), message_(to_string(code) + ": " + message) {}

const char* BulkXferError::what() const noexcept {
    return message_.c_str();
}

} // namespace bulkxfer
