#ifndef LANSHARE_BASE_ERROR_CODE_H
#define LANSHARE_BASE_ERROR_CODE_H

#include <string>
#include <system_error>

namespace lanshare {

// Error code categories
enum class ErrorCode {
    Success = 0,

    // General errors (1000-1999)
    InvalidArgument = 1001,
    NotRunning = 1002,
    ConfigError = 1003,

    // Network errors (2000-2999)
    NetworkError = 2001,
    BindFailed = 2002,
    SendFailed = 2003,
    ReceiveFailed = 2004,

    // Protocol errors (3000-3999)
    DecodeError = 3001,
    ChecksumMismatch = 3002,
    DuplicateChunk = 3003,

    // Delivery errors (4000-4999)
    NoPeersAvailable = 4001,
    PeerNotFound = 4002,
    MessageTooLarge = 4003
};

std::error_code make_error_code(ErrorCode code);
std::string to_string(ErrorCode code);

class LanShareError : public std::exception {
public:
    LanShareError(ErrorCode code, const std::string& message);

    ErrorCode code() const { return code_; }
    const char* what() const noexcept override;

private:
    ErrorCode code_;
    std::string message_;
};

} // namespace lanshare

#endif // LANSHARE_BASE_ERROR_CODE_H
