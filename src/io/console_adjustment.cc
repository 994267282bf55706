#include "console_adjustment.h"

#include <cctype>
#include <charconv>
#include <string>
#include <system_error>

#include <glog/logging.h>

#include "../common/errors.h"

namespace Rendezvous {

int64_t ParseAdjustment(std::string_view text) {
    size_t begin = 0;
    size_t end = text.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(text[begin]))) ++begin;
    while (end > begin && std::isspace(static_cast<unsigned char>(text[end - 1]))) --end;
    std::string_view trimmed = text.substr(begin, end - begin);

    int64_t value = 0;
    const char* last = trimmed.data() + trimmed.size();
    auto [ptr, ec] = std::from_chars(trimmed.data(), last, value, 10);
    if (trimmed.empty() || ec != std::errc() || ptr != last) {
        throw InvalidInputError("'" + std::string(text) + "' is not an integer");
    }
    return value;
}

ConsoleAdjustmentProvider::ConsoleAdjustmentProvider(std::istream& in, std::ostream& out,
                                                     TaskExecutor& executor, PromptOptions options)
    : in_(in), out_(out), executor_(executor), options_(std::move(options)) {}

AsyncValue<int64_t> ConsoleAdjustmentProvider::FetchAdjustment() {
    return executor_.ExecuteAsync([this]() { return AskForAdjustment(); });
}

int64_t ConsoleAdjustmentProvider::AskForAdjustment() {
    absl::MutexLock lock(&console_mu_);

    out_ << options_.prompt << std::flush;

    std::string answer;
    if (!std::getline(in_, answer)) {
        throw IOError("input closed before an adjustment was entered");
    }

    try {
        int64_t adjustment = ParseAdjustment(answer);
        VLOG(1) << "Adjustment entered: " << adjustment;
        return adjustment;
    } catch (const PipelineError& e) {
        if (!options_.lenient) {
            throw;
        }
        LOG(WARNING) << "Ignoring invalid adjustment: " << e.what();
        out_ << kInvalidInputNotice << std::endl;
        return 0;
    }
}

} // namespace Rendezvous
