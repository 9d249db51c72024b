#pragma once

#include "messages.hpp"
#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <mutex>
#include <optional>
#include <vector>

namespace cmdrun {

// FIFO feeding the update function. Any thread may push; only the UI thread pops.
class MessageQueue {
public:
    void push(Message message);
    void push_all(std::vector<Message> messages);

    [[nodiscard]] std::optional<Message> try_pop();

    // Wait until a message is available or the timeout expires
    bool wait(std::chrono::milliseconds timeout);

    [[nodiscard]] bool empty() const;
    [[nodiscard]] size_t size() const;

    // Called after every push (outside the queue lock), e.g. to wake the event loop.
    // Waits for a running call to finish, so once the callback is cleared its
    // target may be destroyed.
    void set_on_message(std::function<void()> callback);

private:
    void notify();

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<Message> queue_;

    std::mutex callback_mutex_;
    std::function<void()> on_message_;
};

} // namespace cmdrun
