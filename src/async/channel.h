#ifndef RENDEZVOUS_ASYNC_CHANNEL_H_
#define RENDEZVOUS_ASYNC_CHANNEL_H_

#include <deque>
#include <optional>
#include <utility>

#include "absl/synchronization/mutex.h"

namespace Rendezvous {

/**
 * Unbounded multi-producer FIFO with blocking receive.
 * After Close() sends are refused and receivers drain what is left,
 * then get std::nullopt.
 */
template<typename T>
class Channel {
public:
    Channel() = default;
    Channel(const Channel&) = delete;
    Channel& operator=(const Channel&) = delete;

    // Returns false if the channel is closed
    bool Send(T message) {
        absl::MutexLock lock(&mu_);
        if (closed_) {
            return false;
        }
        queue_.push_back(std::move(message));
        return true;
    }

    std::optional<T> Receive() {
        absl::MutexLock lock(&mu_);
        mu_.Await(absl::Condition(this, &Channel::Readable));
        return PopLocked();
    }

    void Close() {
        absl::MutexLock lock(&mu_);
        closed_ = true;
    }

private:
    bool Readable() const ABSL_EXCLUSIVE_LOCKS_REQUIRED(mu_) { return closed_ || !queue_.empty(); }

    std::optional<T> PopLocked() ABSL_EXCLUSIVE_LOCKS_REQUIRED(mu_) {
        if (queue_.empty()) {
            return std::nullopt;
        }
        T message = std::move(queue_.front());
        queue_.pop_front();
        return message;
    }

    absl::Mutex mu_;
    std::deque<T> queue_ ABSL_GUARDED_BY(mu_);
    bool closed_ ABSL_GUARDED_BY(mu_) = false;
};

} // namespace Rendezvous

#endif // RENDEZVOUS_ASYNC_CHANNEL_H_
