#pragma once

#include "messages.hpp"
#include <functional>
#include <vector>

namespace cmdrun {

// Follow-up work returned by one update step.
// immediate messages are queued in order; deferred work runs off the UI
// thread and its returned messages are queued when it completes.
class Task {
public:
    using Work = std::function<std::vector<Message>()>;

    [[nodiscard]] static Task none();
    [[nodiscard]] static Task done(Message message);
    [[nodiscard]] static Task batch(std::vector<Message> messages);
    [[nodiscard]] static Task perform(Work work);
    [[nodiscard]] static Task exit();

    [[nodiscard]] const std::vector<Message>& immediate() const { return immediate_; }
    [[nodiscard]] const std::vector<Work>& deferred() const { return deferred_; }
    [[nodiscard]] bool exit_requested() const { return exit_; }
    [[nodiscard]] bool empty() const { return immediate_.empty() && deferred_.empty() && !exit_; }

    std::vector<Message> take_immediate() { return std::move(immediate_); }
    std::vector<Work> take_deferred() { return std::move(deferred_); }

private:
    std::vector<Message> immediate_;
    std::vector<Work> deferred_;
    bool exit_ = false;
};

} // namespace cmdrun
