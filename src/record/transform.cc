#include "transform.h"

#include <glog/logging.h>

#include "../common/errors.h"

namespace Rendezvous {

std::string FormatAgeChange(const AgeChange& change) {
    return "The age of " + change.first_name + " " + change.last_name + " changes from " +
           std::to_string(change.old_age) + " to " + std::to_string(change.new_age);
}

void LogAgeChange(const AgeChange& change) {
    LOG(INFO) << FormatAgeChange(change);
}

Record ApplyAdjustment(const Record& record, int64_t adjustment, const AgeChangeListener& listener) {
    int64_t new_age = 0;
    if (__builtin_add_overflow(record.age, adjustment, &new_age)) {
        throw InvalidInputError("adjusting age " + std::to_string(record.age) + " of " + record.first_name +
                                " " + record.last_name + " by " + std::to_string(adjustment) + " overflows");
    }

    if (listener) {
        listener(AgeChange{record.first_name, record.last_name, record.age, new_age});
    }

    Record updated = record;
    updated.age = new_age;
    return updated;
}

std::vector<Record> ApplyAdjustment(const std::vector<Record>& records, int64_t adjustment,
                                    const AgeChangeListener& listener) {
    std::vector<Record> updated;
    updated.reserve(records.size());
    for (const auto& record : records) {
        updated.push_back(ApplyAdjustment(record, adjustment, listener));
    }
    return updated;
}

} // namespace Rendezvous
