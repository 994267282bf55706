#ifndef RENDEZVOUS_RECORD_RECORD_H_
#define RENDEZVOUS_RECORD_RECORD_H_

#include <cstdint>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

namespace Rendezvous {

/**
 * One data row: a name pair and an age.
 * Values are never modified in place; an adjusted row is a new Record.
 */
struct Record {
    std::string first_name;
    std::string last_name;
    int64_t age = 0;

    // first name, last name, age as strings
    std::vector<std::string> ToFields() const;

    bool operator==(const Record& other) const {
        return first_name == other.first_name && last_name == other.last_name && age == other.age;
    }
    bool operator!=(const Record& other) const { return !(*this == other); }
};

std::ostream& operator<<(std::ostream& os, const Record& record);

/**
 * Parses "first,last,age". Throws a kMalformedRecord PipelineError when the
 * line does not have exactly three fields or the age is not a base-10 integer.
 */
Record ParseRecord(std::string_view line);

/**
 * Builds a record from already split fields, same checks as ParseRecord
 */
Record RecordFromFields(const std::vector<std::string>& fields);

std::string SerializeRecord(const Record& record);

/**
 * Parses every line in order. The first malformed line fails the batch and
 * its 1-based line number is part of the error message.
 */
std::vector<Record> ParseRecords(const std::vector<std::string>& lines);

std::vector<std::string> SerializeRecords(const std::vector<Record>& records);

} // namespace Rendezvous

#endif // RENDEZVOUS_RECORD_RECORD_H_
