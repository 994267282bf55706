#include "errors.h"

namespace Rendezvous {

const char* ErrorKindName(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::kMalformedRecord:
            return "MalformedRecord";
        case ErrorKind::kInvalidInput:
            return "InvalidInput";
        case ErrorKind::kIOError:
            return "IOError";
        case ErrorKind::kTimeout:
            return "Timeout";
    }
    return "Unknown";
}

std::string DescribeError(const std::exception_ptr& error) {
    if (!error) {
        return "no error";
    }
    try {
        std::rethrow_exception(error);
    } catch (const PipelineError& e) {
        return std::string(ErrorKindName(e.kind())) + ": " + e.what();
    } catch (const std::exception& e) {
        return std::string("Unexpected: ") + e.what();
    } catch (...) {
        return "Unexpected: non-standard exception";
    }
}

} // namespace Rendezvous
