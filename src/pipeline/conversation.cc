#include "conversation.h"

#include <stdexcept>
#include <utility>

#include <glog/logging.h>

#include "../common/errors.h"

namespace Rendezvous {

const char* PeerName(Peer peer) {
    switch (peer) {
        case Peer::kStorage:
            return "storage";
        case Peer::kPrompt:
            return "prompt";
    }
    return "unknown";
}

Conversation::Conversation(ISourceProvider& source, IAdjustmentProvider& adjustment, IRecordSink& sink,
                           ConversationOptions options, AgeChangeListener listener)
    : source_(source),
      adjustment_(adjustment),
      sink_(sink),
      options_(options),
      listener_(std::move(listener)) {}

Conversation::~Conversation() {
    if (storage_thread_.joinable() || prompt_thread_.joinable()) {
        LOG(WARNING) << "Conversation destroyed with workers still running, saying GoodBye";
        Tell(Peer::kStorage, GoodBye{});
        Tell(Peer::kPrompt, GoodBye{});
        if (storage_thread_.joinable()) storage_thread_.join();
        if (prompt_thread_.joinable()) prompt_thread_.join();
    }
}

void Conversation::Tell(Peer peer, WorkerMessage message) {
    Channel<WorkerMessage>& inbox = peer == Peer::kStorage ? storage_inbox_ : prompt_inbox_;
    if (!inbox.Send(std::move(message))) {
        LOG(WARNING) << "Conversation: " << PeerName(peer) << " inbox already closed";
    }
}

void Conversation::Reply(CoordinatorMessage message) {
    if (!mailbox_.Send(std::move(message))) {
        LOG(WARNING) << "Conversation: coordinator mailbox already closed";
    }
}

void Conversation::Note(std::string event) {
    LOG(INFO) << "Conversation: " << event;
    transcript_.push_back(std::move(event));
}

void Conversation::StorageWorker() {
    while (auto message = storage_inbox_.Receive()) {
        if (std::holds_alternative<Greet>(*message)) {
            VLOG(1) << "Storage worker: hello coordinator, I will answer to you";
            Reply(GreetOk{Peer::kStorage});
        } else if (std::holds_alternative<ReadRequest>(*message)) {
            VLOG(1) << "Storage worker: received a read request";
            try {
                Reply(ReadAnswer{source_.FetchLines().Get()});
            } catch (...) {
                Reply(WorkerFailed{Peer::kStorage, std::current_exception()});
            }
        } else if (auto* write = std::get_if<WriteRequest>(&*message)) {
            VLOG(1) << "Storage worker: received a write request (" << write->lines.size() << " lines)";
            try {
                sink_.Write(std::move(write->lines)).Get();
                Reply(WriteOk{});
            } catch (...) {
                Reply(WorkerFailed{Peer::kStorage, std::current_exception()});
            }
        } else if (std::holds_alternative<GoodBye>(*message)) {
            VLOG(1) << "Storage worker: goodbye";
            return;
        } else {
            LOG(WARNING) << "Storage worker: ignoring a message meant for the prompt worker";
        }
    }
}

void Conversation::PromptWorker() {
    while (auto message = prompt_inbox_.Receive()) {
        if (std::holds_alternative<Greet>(*message)) {
            VLOG(1) << "Prompt worker: hello coordinator, I will answer to you";
            Reply(GreetOk{Peer::kPrompt});
        } else if (std::holds_alternative<UpdateRequest>(*message)) {
            VLOG(1) << "Prompt worker: received an update request";
            try {
                Reply(UpdateAnswer{adjustment_.FetchAdjustment().Get()});
            } catch (...) {
                Reply(WorkerFailed{Peer::kPrompt, std::current_exception()});
            }
        } else if (std::holds_alternative<GoodBye>(*message)) {
            VLOG(1) << "Prompt worker: goodbye";
            return;
        } else {
            LOG(WARNING) << "Prompt worker: ignoring a message meant for the storage worker";
        }
    }
}

void Conversation::Shutdown() {
    Note("GoodBye");
    Tell(Peer::kStorage, GoodBye{});
    Tell(Peer::kPrompt, GoodBye{});

    if (options_.shutdown_delay.count() > 0) {
        std::this_thread::sleep_for(options_.shutdown_delay);
    }

    storage_thread_.join();
    prompt_thread_.join();
    storage_inbox_.Close();
    prompt_inbox_.Close();
    mailbox_.Close();
    Note("Shutdown");
}

RunReport Conversation::Run() {
    if (started_) {
        throw std::logic_error("Conversation: a conversation runs once");
    }
    started_ = true;

    Note("Start");
    storage_thread_ = std::thread(&Conversation::StorageWorker, this);
    prompt_thread_ = std::thread(&Conversation::PromptWorker, this);
    Tell(Peer::kStorage, Greet{});
    Tell(Peer::kPrompt, Greet{});

    std::optional<std::vector<Record>> records;
    std::optional<int64_t> adjustment;
    std::optional<RunReport> report;
    bool write_requested = false;
    bool written = false;
    std::exception_ptr failure;

    while (!written && !failure) {
        std::optional<CoordinatorMessage> message = mailbox_.Receive();
        if (!message) {
            failure = std::make_exception_ptr(std::logic_error("Conversation: mailbox closed mid-run"));
            break;
        }

        if (auto* greet = std::get_if<GreetOk>(&*message)) {
            Note(std::string("GreetOk from ") + PeerName(greet->from));
            if (greet->from == Peer::kStorage) {
                Tell(Peer::kStorage, ReadRequest{});
            } else {
                Tell(Peer::kPrompt, UpdateRequest{});
            }
        } else if (auto* read = std::get_if<ReadAnswer>(&*message)) {
            Note("ReadAnswer with " + std::to_string(read->lines.size()) + " lines");
            try {
                records = ParseRecords(read->lines);
            } catch (...) {
                failure = std::current_exception();
            }
        } else if (auto* update = std::get_if<UpdateAnswer>(&*message)) {
            Note("UpdateAnswer " + std::to_string(update->adjustment));
            adjustment = update->adjustment;
        } else if (std::holds_alternative<WriteOk>(*message)) {
            Note("WriteOk");
            written = true;
        } else if (auto* failed = std::get_if<WorkerFailed>(&*message)) {
            Note(std::string("WorkerFailed from ") + PeerName(failed->from) + ": " + DescribeError(failed->error));
            failure = failed->error;
        }

        // Both answers present: the rendezvous
        if (!failure && !write_requested && records && adjustment) {
            try {
                std::vector<Record> updated = ApplyAdjustment(*records, *adjustment, listener_);
                report = RunReport{updated.size(), *adjustment};
                Note("WriteRequest with " + std::to_string(updated.size()) + " lines");
                Tell(Peer::kStorage, WriteRequest{SerializeRecords(updated)});
                write_requested = true;
            } catch (...) {
                failure = std::current_exception();
            }
        }
    }

    Shutdown();

    if (failure) {
        LOG(ERROR) << "Conversation failed: " << DescribeError(failure);
        std::rethrow_exception(failure);
    }
    return *report;
}

} // namespace Rendezvous
