#pragma once

#include "message_queue.hpp"
#include "task.hpp"
#include <atomic>
#include <memory>

namespace cmdrun {

// Runs deferred work off the UI thread and queues the resulting messages.
// Each work item gets its own detached thread that shares ownership of the
// queue, so work still in flight at exit is simply dropped.
class TaskRunner {
public:
    explicit TaskRunner(std::shared_ptr<MessageQueue> queue);

    void spawn(Task::Work work);

    [[nodiscard]] size_t in_flight() const;

private:
    struct Shared {
        std::shared_ptr<MessageQueue> queue;
        std::atomic<size_t> in_flight{0};
    };

    std::shared_ptr<Shared> shared_;
};

} // namespace cmdrun
