#ifndef BULKXFER_BASE_ERROR_CODE_H
#define BULKXFER_BASE_ERROR_CODE_H

#include <string>
#include <system_error>

namespace bulkxfer {

// Error code categories
enum class ErrorCode {
    Success = 0,

    // General errors (1000-1999)
    InvalidArgument = 1001,
    Timeout = 1004,
    Cancelled = 1005,

    // Transfer errors (4000-4999)
    ProtocolViolation = 4001,

    // Storage errors (5000-5999)
    IOError = 5002
};

std::error_code make_error_code(ErrorCode code);
std::string to_string(ErrorCode code);

class BulkXferError : public std::exception {
public:
    BulkXferError(ErrorCode code, const std::string& message);

    ErrorCode code() const { return code_; }
    const char* what() const noexcept override;

private:
    ErrorCode code_;
    std::string message_;
};

} // namespace bulkxfer

namespace std {
template <>
struct is_error_code_enum<bulkxfer::ErrorCode> : true_type {};
} // namespace std

#endif // BULKXFER_BASE_ERROR_CODE_H
