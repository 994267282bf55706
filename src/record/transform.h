#pragma once

#include <cstdint>
#include <functional>
#include <string>
#include <vector>

#include "record.h"

namespace Rendezvous {

/**
 * Notification emitted once per adjusted record
 */
struct AgeChange {
    std::string first_name;
    std::string last_name;
    int64_t old_age;
    int64_t new_age;
};

using AgeChangeListener = std::function<void(const AgeChange&)>;

// "The age of Ada Lovelace changes from 36 to 38"
std::string FormatAgeChange(const AgeChange& change);

// Writes FormatAgeChange() to the glog INFO stream
void LogAgeChange(const AgeChange& change);

/**
 * Returns a copy of `record` with `adjustment` added to its age and reports
 * the change to `listener` (if set). Zero and negative adjustments are applied
 * like any other. Throws a kInvalidInput PipelineError if the sum overflows.
 */
Record ApplyAdjustment(const Record& record, int64_t adjustment,
                       const AgeChangeListener& listener = LogAgeChange);

/**
 * Adjusts every record in input order; notifications follow the same order.
 */
std::vector<Record> ApplyAdjustment(const std::vector<Record>& records, int64_t adjustment,
                                    const AgeChangeListener& listener = LogAgeChange);

} // namespace Rendezvous
