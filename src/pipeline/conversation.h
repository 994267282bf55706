#ifndef RENDEZVOUS_PIPELINE_CONVERSATION_H_
#define RENDEZVOUS_PIPELINE_CONVERSATION_H_

#include <chrono>
#include <cstdint>
#include <exception>
#include <optional>
#include <string>
#include <thread>
#include <variant>
#include <vector>

#include "../async/channel.h"
#include "../common/config.h"
#include "../io/interfaces.h"
#include "../record/record.h"
#include "../record/transform.h"
#include "update_pipeline.h"

namespace Rendezvous {

enum class Peer {
    kStorage,   // reads and writes the data
    kPrompt     // asks for the adjustment
};

const char* PeerName(Peer peer);

// Coordinator -> worker
struct Greet {};
struct ReadRequest {};
struct UpdateRequest {};
struct WriteRequest {
    std::vector<std::string> lines;
};
struct GoodBye {};

using WorkerMessage = std::variant<Greet, ReadRequest, UpdateRequest, WriteRequest, GoodBye>;

// Worker -> coordinator
struct GreetOk {
    Peer from;
};
struct ReadAnswer {
    std::vector<std::string> lines;
};
struct UpdateAnswer {
    int64_t adjustment;
};
struct WriteOk {};
struct WorkerFailed {
    Peer from;
    std::exception_ptr error;
};

using CoordinatorMessage = std::variant<GreetOk, ReadAnswer, UpdateAnswer, WriteOk, WorkerFailed>;

struct ConversationOptions {
    // Linger after GoodBye before the workers are joined
    std::chrono::milliseconds shutdown_delay{kDefaultShutdownDelayMs};
};

/**
 * The update run as a message exchange between a coordinator (the thread
 * calling Run) and two worker threads, each with its own inbox:
 *
 *   Greet -> GreetOk -> ReadRequest/UpdateRequest -> ReadAnswer/UpdateAnswer
 *   -> WriteRequest -> WriteOk -> GoodBye -> Shutdown
 *
 * The coordinator mailbox serializes the two answers, so the point where
 * both are present needs no further locking. A WorkerFailed message ends
 * the exchange without a write.
 */
class Conversation {
public:
    Conversation(ISourceProvider& source, IAdjustmentProvider& adjustment, IRecordSink& sink,
                 ConversationOptions options = ConversationOptions(),
                 AgeChangeListener listener = LogAgeChange);
    ~Conversation();

    Conversation(const Conversation&) = delete;
    Conversation& operator=(const Conversation&) = delete;

    /**
     * Runs the whole exchange on the calling thread and returns once the
     * workers are gone. Rethrows the first worker or transform failure.
     * Throws std::logic_error when called a second time.
     */
    RunReport Run();

    // Messages handled by the coordinator, in order. Read after Run() returns.
    const std::vector<std::string>& transcript() const { return transcript_; }

private:
    void StorageWorker();
    void PromptWorker();

    void Tell(Peer peer, WorkerMessage message);
    void Reply(CoordinatorMessage message);
    void Note(std::string event);
    void Shutdown();

    ISourceProvider& source_;
    IAdjustmentProvider& adjustment_;
    IRecordSink& sink_;
    ConversationOptions options_;
    AgeChangeListener listener_;

    Channel<CoordinatorMessage> mailbox_;
    Channel<WorkerMessage> storage_inbox_;
    Channel<WorkerMessage> prompt_inbox_;
    std::thread storage_thread_;
    std::thread prompt_thread_;

    bool started_ = false;
    std::vector<std::string> transcript_;
};

} // namespace Rendezvous

#endif // RENDEZVOUS_PIPELINE_CONVERSATION_H_
