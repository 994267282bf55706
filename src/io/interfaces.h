#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "../async/async_value.h"

namespace Rendezvous {

/**
 * Interface for the raw record lines of one run
 */
class ISourceProvider {
public:
    virtual ~ISourceProvider() = default;

    // Completes with the ordered lines or fails with kIOError.
    // Must not block the caller.
    virtual AsyncValue<std::vector<std::string>> FetchLines() = 0;
};

/**
 * Interface for the single age adjustment of one run
 */
class IAdjustmentProvider {
public:
    virtual ~IAdjustmentProvider() = default;

    // Completes with the adjustment or fails with kInvalidInput / kIOError.
    // Must not block the caller.
    virtual AsyncValue<int64_t> FetchAdjustment() = 0;
};

/**
 * Interface for writing the updated lines back
 */
class IRecordSink {
public:
    virtual ~IRecordSink() = default;

    // Writes all lines in one operation; an empty batch is not an error
    virtual AsyncValue<Unit> Write(std::vector<std::string> lines) = 0;
};

} // namespace Rendezvous
