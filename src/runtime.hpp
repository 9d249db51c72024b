#pragma once

#include "app.hpp"
#include "message_queue.hpp"
#include "task_runner.hpp"
#include <chrono>
#include <memory>

namespace cmdrun {

// Feeds queued messages into Application::update one at a time and routes
// the returned follow-up work. Not thread safe: call from the UI thread only.
class Runtime {
public:
    // Non-owning: app and runner must outlive the Runtime
    Runtime(Application* app, std::shared_ptr<MessageQueue> queue, TaskRunner* runner);

    void dispatch(Message message);

    // Handle every queued message, including follow-ups queued on the way.
    // Stops early once Exit was handled. Returns the number handled.
    size_t pump();

    // Pump until nothing is queued or in flight; false on timeout
    bool run_until_idle(std::chrono::milliseconds timeout);

    [[nodiscard]] bool exit_requested() const { return exit_requested_; }
    [[nodiscard]] bool idle() const;

    [[nodiscard]] const Application& app() const { return *app_; }

private:
    Application* app_ = nullptr;
    std::shared_ptr<MessageQueue> queue_;
    TaskRunner* runner_ = nullptr;
    bool exit_requested_ = false;
};

} // namespace cmdrun
