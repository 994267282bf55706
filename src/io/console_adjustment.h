#pragma once

#include <cstdint>
#include <istream>
#include <ostream>
#include <string>
#include <string_view>

#include "absl/synchronization/mutex.h"
#include "interfaces.h"
#include "../async/task_executor.h"
#include "../common/config.h"

namespace Rendezvous {

/**
 * Parses a base-10 integer with optional leading '-', surrounding
 * whitespace ignored. Throws a kInvalidInput PipelineError otherwise.
 */
int64_t ParseAdjustment(std::string_view text);

struct PromptOptions {
    std::string prompt = kDefaultPrompt;
    // Invalid answers print kInvalidInputNotice and count as 0
    bool lenient = false;
};

/**
 * Adjustment provider that asks on an output stream and reads one line from
 * an input stream, on an executor worker. The streams must outlive every
 * fetch; concurrent fetches are serialized.
 */
class ConsoleAdjustmentProvider : public IAdjustmentProvider {
public:
    ConsoleAdjustmentProvider(std::istream& in, std::ostream& out, TaskExecutor& executor,
                              PromptOptions options = PromptOptions());

    AsyncValue<int64_t> FetchAdjustment() override;

    // Synchronous prompt on the calling thread
    int64_t AskForAdjustment();

private:
    std::istream& in_;
    std::ostream& out_;
    TaskExecutor& executor_;
    PromptOptions options_;
    absl::Mutex console_mu_;
};

} // namespace Rendezvous
