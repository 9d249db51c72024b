#include "task.hpp"

namespace cmdrun {

Task Task::none() {
    return {};
}

Task Task::done(Message message) {
    Task task;
    task.immediate_.push_back(std::move(message));
    return task;
}

Task Task::batch(std::vector<Message> messages) {
    Task task;
    task.immediate_ = std::move(messages);
    return task;
}

Task Task::perform(Work work) {
    Task task;
    task.deferred_.push_back(std::move(work));
    return task;
}

Task Task::exit() {
    Task task;
    task.exit_ = true;
    return task;
}

} // namespace cmdrun
