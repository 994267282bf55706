#ifndef RENDEZVOUS_COMMON_ERRORS_H_
#define RENDEZVOUS_COMMON_ERRORS_H_

#include <exception>
#include <stdexcept>
#include <string>

namespace Rendezvous {

/**
 * Failure categories a run can end with
 */
enum class ErrorKind {
    kMalformedRecord,   // bad line shape or non-integer age
    kInvalidInput,      // adjustment is not an integer (or overflows an age)
    kIOError,           // read or write failure
    kTimeout            // bounded wait on the joined inputs expired
};

const char* ErrorKindName(ErrorKind kind);

/**
 * Exception type for every failure the pipeline reports to its caller.
 * Crosses asynchronous boundaries inside a std::exception_ptr.
 */
class PipelineError : public std::runtime_error {
public:
    PipelineError(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    ErrorKind kind() const { return kind_; }

private:
    ErrorKind kind_;
};

inline PipelineError MalformedRecordError(const std::string& message) {
    return PipelineError(ErrorKind::kMalformedRecord, message);
}

inline PipelineError InvalidInputError(const std::string& message) {
    return PipelineError(ErrorKind::kInvalidInput, message);
}

inline PipelineError IOError(const std::string& message) {
    return PipelineError(ErrorKind::kIOError, message);
}

inline PipelineError TimeoutError(const std::string& message) {
    return PipelineError(ErrorKind::kTimeout, message);
}

/**
 * Renders a captured failure as "<kind>: <what>" for logs and the CLI.
 * Exceptions that are not PipelineError are reported with kind "Unexpected".
 */
std::string DescribeError(const std::exception_ptr& error);

} // namespace Rendezvous

#endif // RENDEZVOUS_COMMON_ERRORS_H_
