#include "OutcomeChannel.hpp"

#include <utility>

OutcomeChannel::OutcomeChannel(std::size_t capacity)
    : capacity_(capacity == 0 ? 1 : capacity) {}

void OutcomeChannel::Send(SideOutcome outcome) {
    std::unique_lock<std::mutex> lock(mutex_);
    writable_.wait(lock, [this] { return queue_.size() < capacity_; });
    queue_.push_back(std::move(outcome));
    lock.unlock();
    readable_.notify_one();
}

SideOutcome OutcomeChannel::Receive() {
    std::unique_lock<std::mutex> lock(mutex_);
    readable_.wait(lock, [this] { return !queue_.empty(); });
    SideOutcome outcome = std::move(queue_.front());
    queue_.pop_front();
    lock.unlock();
    writable_.notify_one();
    return outcome;
}
