#include "message_queue.hpp"

namespace cmdrun {

void MessageQueue::push(Message message) {
    {
        std::lock_guard lock(mutex_);
        queue_.push_back(std::move(message));
    }
    notify();
}

void MessageQueue::push_all(std::vector<Message> messages) {
    if (messages.empty()) return;
    {
        std::lock_guard lock(mutex_);
        for (auto& message : messages) {
            queue_.push_back(std::move(message));
        }
    }
    notify();
}

std::optional<Message> MessageQueue::try_pop() {
    std::lock_guard lock(mutex_);
    if (queue_.empty()) return std::nullopt;
    Message message = std::move(queue_.front());
    queue_.pop_front();
    return message;
}

bool MessageQueue::wait(const std::chrono::milliseconds timeout) {
    std::unique_lock lock(mutex_);
    return cv_.wait_for(lock, timeout, [this] { return !queue_.empty(); });
}

bool MessageQueue::empty() const {
    std::lock_guard lock(mutex_);
    return queue_.empty();
}

size_t MessageQueue::size() const {
    std::lock_guard lock(mutex_);
    return queue_.size();
}

void MessageQueue::set_on_message(std::function<void()> callback) {
    std::lock_guard lock(callback_mutex_);
    on_message_ = std::move(callback);
}

void MessageQueue::notify() {
    cv_.notify_all();

    // Outside the queue lock; callback_mutex_ keeps the target alive until the call returns
    std::lock_guard lock(callback_mutex_);
    if (on_message_) {
        on_message_();
    }
}

} // namespace cmdrun
