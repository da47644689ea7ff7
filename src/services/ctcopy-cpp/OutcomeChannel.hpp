#pragma once

#include "CopyTypes.hpp"

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <string>
#include <thread>
#include <utility>

enum class MigrationSide {
    Destination,
    Source
};

struct SideOutcome {
    MigrationSide side = MigrationSide::Destination;
    bool ok = false;
    std::string error;
    OperationInfo operation;
};

// Bounded FIFO handing waiter results to the control thread.
class OutcomeChannel {
public:
    explicit OutcomeChannel(std::size_t capacity);

    void Send(SideOutcome outcome);
    SideOutcome Receive();

private:
    const std::size_t capacity_;
    std::deque<SideOutcome> queue_;
    std::mutex mutex_;
    std::condition_variable readable_;
    std::condition_variable writable_;
};

// Owns a waiter thread and joins it on destruction.
class WaiterThread {
public:
    template <typename Fn, typename... Args>
    explicit WaiterThread(Fn&& fn, Args&&... args)
        : thread_(std::forward<Fn>(fn), std::forward<Args>(args)...) {}

    ~WaiterThread() {
        Join();
    }

    WaiterThread(const WaiterThread&) = delete;
    WaiterThread& operator=(const WaiterThread&) = delete;

    void Join() {
        if (thread_.joinable()) {
            thread_.join();
        }
    }

private:
    std::thread thread_;
};
