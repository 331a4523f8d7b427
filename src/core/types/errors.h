#ifndef COMFYFLOW_TYPES_ERRORS_H
#define COMFYFLOW_TYPES_ERRORS_H

#include <stdexcept>
#include <string>

namespace comfyflow {

// Graph/rule mismatch or unusable configuration; detected at load time
struct ConfigurationError : public std::runtime_error {
    using std::runtime_error::runtime_error;
};

// The remote engine reported an execution failure; message is surfaced verbatim
struct ProtocolError : public std::runtime_error {
    using std::runtime_error::runtime_error;
};

// No terminal event within the run timeout
struct TimeoutError : public std::runtime_error {
    using std::runtime_error::runtime_error;
};

// Input asset upload failed; the job ends before submission
struct UploadError : public std::runtime_error {
    using std::runtime_error::runtime_error;
};

// Await loop interrupted by a stop request
struct CanceledError : public std::runtime_error {
    using std::runtime_error::runtime_error;
};

// HTTP or event channel failure
struct TransportError : public std::runtime_error {
    TransportError(const std::string& message, long status = 0)
        : std::runtime_error(message), status(status) {}

    long status; // 0 表示没有 HTTP 状态码
};

} // namespace comfyflow

#endif // COMFYFLOW_TYPES_ERRORS_H
