#include "runtime.hpp"
#include <algorithm>
#include <cassert>

namespace cmdrun {

Runtime::Runtime(Application* app, std::shared_ptr<MessageQueue> queue, TaskRunner* runner)
    : app_(app)
    , queue_(std::move(queue))
    , runner_(runner) {

    assert(app_ && "Application must not be null");
    assert(queue_ && "MessageQueue must not be null");
    assert(runner_ && "TaskRunner must not be null");
}

void Runtime::dispatch(Message message) {
    queue_->push(std::move(message));
}

size_t Runtime::pump() {
    size_t handled = 0;
    while (!exit_requested_) {
        auto message = queue_->try_pop();
        if (!message) break;

        Task task = app_->update(std::move(*message));
        ++handled;

        queue_->push_all(task.take_immediate());
        for (auto& work : task.take_deferred()) {
            runner_->spawn(std::move(work));
        }
        if (task.exit_requested()) {
            exit_requested_ = true;
        }
    }
    return handled;
}

bool Runtime::idle() const {
    // in_flight first: a finished worker has already pushed its messages
    return runner_->in_flight() == 0 && queue_->empty();
}

bool Runtime::run_until_idle(const std::chrono::milliseconds timeout) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (true) {
        pump();
        if (exit_requested_ || idle()) return true;

        const auto now = std::chrono::steady_clock::now();
        if (now >= deadline) return false;

        const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
        queue_->wait(std::min(remaining, std::chrono::milliseconds(10)));
    }
}

} // namespace cmdrun
