#pragma once

#include "../message_queue.hpp"
#include "../messages.hpp"
#include "../runtime.hpp"
#include <chrono>
#include <mutex>
#include <optional>
#include <string>

struct GLFWwindow;

namespace cmdrun {

class ImGuiApp {
public:
    // Non-owning constructor: ImGuiApp drives but does not own the runtime.
    // Both pointers must be non-null and must outlive the ImGuiApp instance.
    // - runtime: update loop, pumped once per frame
    // - queue: the runtime's queue; its wake callback is pointed at this window
    ImGuiApp(Runtime* runtime, MessageQueue* queue);
    ~ImGuiApp();

    void run();

private:
    void render();
    void render_menu_bar();
    void render_executable_row();
    void render_arguments_editor();
    void render_status_row();

    void handle_keyboard_shortcuts();
    void apply_theme(Theme theme);

    void dispatch(Message message);

    // Non-owned
    Runtime* runtime_ = nullptr;
    MessageQueue* queue_ = nullptr;

    GLFWwindow* window_ = nullptr;
    std::optional<Theme> applied_theme_;

    // Widget buffers, refreshed from the view state every frame
    std::string executable_buffer_;
    std::string arguments_buffer_;

    // Event debouncing
    void post_empty_event_debounced();
    std::mutex event_debounce_mutex_;
    std::chrono::steady_clock::time_point last_event_post_time_;
    static constexpr auto kEventDebounceInterval = std::chrono::milliseconds(16);
};

} // namespace cmdrun
