#include "task_runner.hpp"
#include "log.hpp"
#include <system_error>
#include <thread>

namespace cmdrun {

TaskRunner::TaskRunner(std::shared_ptr<MessageQueue> queue)
    : shared_(std::make_shared<Shared>()) {
    shared_->queue = std::move(queue);
}

void TaskRunner::spawn(Task::Work work) {
    ++shared_->in_flight;

    try {
        std::thread([shared = shared_, work = std::move(work)] {
            std::vector<Message> messages;
            try {
                messages = work();
            } catch (const std::exception& e) {
                log::error("background task failed\n{}", e.what());
                messages.push_back(status("background task failed"));
            }

            // Push before decrementing so an idle check never misses a completion
            shared->queue->push_all(std::move(messages));
            --shared->in_flight;
        }).detach();
    } catch (const std::system_error& e) {
        --shared_->in_flight;
        log::error("could not start background task\n{}", e.what());
        shared_->queue->push(status("could not start background task"));
    }
}

size_t TaskRunner::in_flight() const {
    return shared_->in_flight;
}

} // namespace cmdrun
