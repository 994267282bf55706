#include "record.h"

#include <charconv>
#include <system_error>

#include "../common/config.h"
#include "../common/errors.h"

namespace Rendezvous {

namespace {

constexpr size_t kFieldCount = 3;

std::vector<std::string_view> SplitFields(std::string_view line) {
    std::vector<std::string_view> fields;
    size_t start = 0;
    while (true) {
        size_t pos = line.find(kFieldDelimiter, start);
        if (pos == std::string_view::npos) {
            fields.push_back(line.substr(start));
            break;
        }
        fields.push_back(line.substr(start, pos - start));
        start = pos + 1;
    }
    return fields;
}

// Accepts an optional leading '-' followed by digits, nothing else
int64_t ParseAge(std::string_view text) {
    int64_t age = 0;
    const char* first = text.data();
    const char* last = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(first, last, age, 10);
    if (text.empty() || ec == std::errc::invalid_argument || ptr != last) {
        throw MalformedRecordError("age '" + std::string(text) + "' is not an integer");
    }
    if (ec == std::errc::result_out_of_range) {
        throw MalformedRecordError("age '" + std::string(text) + "' is out of range");
    }
    return age;
}

Record BuildRecord(const std::vector<std::string_view>& fields) {
    if (fields.size() != kFieldCount) {
        throw MalformedRecordError("expected " + std::to_string(kFieldCount) + " fields, got " +
                                   std::to_string(fields.size()));
    }
    Record record;
    record.first_name = std::string(fields[0]);
    record.last_name = std::string(fields[1]);
    record.age = ParseAge(fields[2]);
    return record;
}

} // namespace

std::vector<std::string> Record::ToFields() const {
    return {first_name, last_name, std::to_string(age)};
}

std::ostream& operator<<(std::ostream& os, const Record& record) {
    return os << "Record{" << record.first_name << ", " << record.last_name << ", " << record.age << "}";
}

Record ParseRecord(std::string_view line) {
    return BuildRecord(SplitFields(line));
}

Record RecordFromFields(const std::vector<std::string>& fields) {
    std::vector<std::string_view> views(fields.begin(), fields.end());
    return BuildRecord(views);
}

std::string SerializeRecord(const Record& record) {
    std::string line;
    line.reserve(record.first_name.size() + record.last_name.size() + 24);
    line += record.first_name;
    line += kFieldDelimiter;
    line += record.last_name;
    line += kFieldDelimiter;
    line += std::to_string(record.age);
    return line;
}

std::vector<Record> ParseRecords(const std::vector<std::string>& lines) {
    std::vector<Record> records;
    records.reserve(lines.size());
    for (size_t i = 0; i < lines.size(); ++i) {
        try {
            records.push_back(ParseRecord(lines[i]));
        } catch (const PipelineError& e) {
            throw MalformedRecordError("line " + std::to_string(i + 1) + ": " + e.what());
        }
    }
    return records;
}

std::vector<std::string> SerializeRecords(const std::vector<Record>& records) {
    std::vector<std::string> lines;
    lines.reserve(records.size());
    for (const auto& record : records) {
        lines.push_back(SerializeRecord(record));
    }
    return lines;
}

} // namespace Rendezvous
