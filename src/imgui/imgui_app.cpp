#include "imgui_app.hpp"
#include "imgui.h"
#include "imgui_impl_glfw.h"
#include "imgui_impl_opengl3.h"
#include "misc/cpp/imgui_stdlib.h"
#include "../log.hpp"
#include <GLFW/glfw3.h>
#include <algorithm>
#include <cassert>
#include <stdexcept>

namespace cmdrun {

namespace {

constexpr int kWindowWidth = 640;
constexpr int kWindowHeight = 320;
constexpr const char* kWindowTitle = "Run Command";

void center_window(GLFWwindow* window) {
    GLFWmonitor* monitor = glfwGetPrimaryMonitor();
    if (!monitor) return;
    const GLFWvidmode* mode = glfwGetVideoMode(monitor);
    if (!mode) return;

    int monitor_x = 0;
    int monitor_y = 0;
    glfwGetMonitorPos(monitor, &monitor_x, &monitor_y);
    glfwSetWindowPos(window,
                     monitor_x + (mode->width - kWindowWidth) / 2,
                     monitor_y + (mode->height - kWindowHeight) / 2);
}

} // namespace

ImGuiApp::ImGuiApp(Runtime* runtime, MessageQueue* queue)
    : runtime_(runtime)
    , queue_(queue) {

    assert(runtime_ && "Runtime must not be null");
    assert(queue_ && "MessageQueue must not be null");

    // Wake up the UI when background work completes
    queue_->set_on_message([this]() {
        post_empty_event_debounced();
    });
}

ImGuiApp::~ImGuiApp() {
    queue_->set_on_message(nullptr);
}

void ImGuiApp::run() {
    // Initialize GLFW
    if (!glfwInit()) {
        throw std::runtime_error("Failed to initialize GLFW");
    }

    // GL 3.3 + GLSL 330
    glfwWindowHint(GLFW_CONTEXT_VERSION_MAJOR, 3);
    glfwWindowHint(GLFW_CONTEXT_VERSION_MINOR, 3);
    glfwWindowHint(GLFW_OPENGL_PROFILE, GLFW_OPENGL_CORE_PROFILE);
    glfwWindowHint(GLFW_VISIBLE, GLFW_FALSE);

    // Set Wayland app_id for desktop integration
    glfwWindowHintString(GLFW_WAYLAND_APP_ID, "cmdrun");

    {
        std::lock_guard lock(event_debounce_mutex_);
        window_ = glfwCreateWindow(kWindowWidth, kWindowHeight, kWindowTitle, nullptr, nullptr);
    }
    if (!window_) {
        glfwTerminate();
        throw std::runtime_error("Failed to create GLFW window");
    }

    center_window(window_);
    glfwShowWindow(window_);
    glfwMakeContextCurrent(window_);
    glfwSwapInterval(1);

    // Setup Dear ImGui context
    IMGUI_CHECKVERSION();
    ImGui::CreateContext();
    ImGuiIO& io = ImGui::GetIO();
    io.ConfigFlags |= ImGuiConfigFlags_NavEnableKeyboard;
    io.IniFilename = nullptr;

    ImGuiStyle& style = ImGui::GetStyle();
    style.WindowRounding = 0.0f;
    style.FrameRounding = 2.0f;
    style.ScrollbarRounding = 2.0f;
    style.WindowPadding = ImVec2(5.0f, 5.0f);
    style.ItemSpacing = ImVec2(3.0f, 3.0f);

    // Setup Platform/Renderer backends
    ImGui_ImplGlfw_InitForOpenGL(window_, true);
    ImGui_ImplOpenGL3_Init("#version 330");

    log::debug("window created");

    // Main loop
    while (!glfwWindowShouldClose(window_)) {
        glfwWaitEventsTimeout(0.1);

        runtime_->pump();
        if (runtime_->exit_requested()) {
            glfwSetWindowShouldClose(window_, GLFW_TRUE);
            break;
        }

        apply_theme(runtime_->app().theme());

        // Start the Dear ImGui frame
        ImGui_ImplOpenGL3_NewFrame();
        ImGui_ImplGlfw_NewFrame();
        ImGui::NewFrame();

        render();

        // Rendering
        ImGui::Render();
        int display_w, display_h;
        glfwGetFramebufferSize(window_, &display_w, &display_h);
        glViewport(0, 0, display_w, display_h);
        const ImVec4 clear = ImGui::GetStyle().Colors[ImGuiCol_WindowBg];
        glClearColor(clear.x, clear.y, clear.z, 1.0f);
        glClear(GL_COLOR_BUFFER_BIT);
        ImGui_ImplOpenGL3_RenderDrawData(ImGui::GetDrawData());

        glfwSwapBuffers(window_);
    }

    log::debug("event loop finished");

    // Cleanup
    ImGui_ImplOpenGL3_Shutdown();
    ImGui_ImplGlfw_Shutdown();
    ImGui::DestroyContext();

    {
        std::lock_guard lock(event_debounce_mutex_);
        glfwDestroyWindow(window_);
        window_ = nullptr;
    }
    glfwTerminate();
}

void ImGuiApp::dispatch(Message message) {
    runtime_->dispatch(std::move(message));
}

void ImGuiApp::apply_theme(const Theme theme) {
    if (applied_theme_ == theme) return;
    applied_theme_ = theme;

    if (theme == Theme::Light) {
        ImGui::StyleColorsLight();
    } else {
        ImGui::StyleColorsDark();
    }
}

void ImGuiApp::post_empty_event_debounced() {
    std::lock_guard lock(event_debounce_mutex_);
    if (!window_) return;

    const auto now = std::chrono::steady_clock::now();
    if (now - last_event_post_time_ >= kEventDebounceInterval) {
        last_event_post_time_ = now;
        glfwPostEmptyEvent();
    }
}

void ImGuiApp::render() {
    // Create main window that fills the viewport
    const ImGuiViewport* viewport = ImGui::GetMainViewport();
    ImGui::SetNextWindowPos(viewport->Pos);
    ImGui::SetNextWindowSize(viewport->Size);

    constexpr ImGuiWindowFlags window_flags = ImGuiWindowFlags_NoTitleBar | ImGuiWindowFlags_NoCollapse |
                                              ImGuiWindowFlags_NoResize | ImGuiWindowFlags_NoMove |
                                              ImGuiWindowFlags_NoBringToFrontOnFocus | ImGuiWindowFlags_MenuBar;

    ImGui::Begin("cmdrun", nullptr, window_flags);

    handle_keyboard_shortcuts();

    render_menu_bar();
    render_executable_row();
    render_arguments_editor();
    render_status_row();

    ImGui::End();
}

void ImGuiApp::render_menu_bar() {
    if (ImGui::BeginMenuBar()) {
        if (ImGui::BeginMenu("File")) {
            if (ImGui::MenuItem("Load...", "Ctrl+O")) {
                dispatch(msg::LoadConfigDialog{});
            }
            if (ImGui::MenuItem("Save...", "Ctrl+S")) {
                dispatch(msg::SaveConfigDialog{});
            }
            ImGui::Separator();
            if (ImGui::MenuItem("Run", "F5")) {
                dispatch(msg::Run{});
            }
            if (ImGui::MenuItem("Reload", "Ctrl+R")) {
                dispatch(msg::Reload{});
            }
            ImGui::Separator();
            if (ImGui::MenuItem("Exit", "Ctrl+Q")) {
                dispatch(msg::Exit{});
            }
            ImGui::EndMenu();
        }

        if (ImGui::BeginMenu("View")) {
            const Theme theme = runtime_->app().theme();
            if (ImGui::MenuItem("Light", nullptr, theme == Theme::Light)) {
                dispatch(msg::SetTheme{Theme::Light});
            }
            if (ImGui::MenuItem("Dark", nullptr, theme == Theme::Dark)) {
                dispatch(msg::SetTheme{Theme::Dark});
            }
            ImGui::EndMenu();
        }

        ImGui::EndMenuBar();
    }
}

void ImGuiApp::render_executable_row() {
    const ViewState& view = runtime_->app().view_state();
    executable_buffer_ = view.executable;

    const float button_width = ImGui::CalcTextSize("Open").x + ImGui::GetStyle().FramePadding.x * 2.0f;
    ImGui::SetNextItemWidth(ImGui::GetContentRegionAvail().x - button_width - ImGui::GetStyle().ItemSpacing.x);
    if (ImGui::InputTextWithHint("##executable", "Executable...", &executable_buffer_)) {
        dispatch(msg::SetExecutable{executable_buffer_});
    }
    ImGui::SameLine();
    if (ImGui::Button("Open")) {
        dispatch(msg::OpenExecutableDialog{});
    }
}

void ImGuiApp::render_arguments_editor() {
    const ViewState& view = runtime_->app().view_state();
    arguments_buffer_ = view.raw_arguments.text();

    // Leave one row for the status line; the default font is monospace
    const float status_height = ImGui::GetFrameHeightWithSpacing();
    const ImVec2 size(-FLT_MIN, ImGui::GetContentRegionAvail().y - status_height);
    if (ImGui::InputTextMultiline("##arguments", &arguments_buffer_, size, ImGuiInputTextFlags_AllowTabInput)) {
        dispatch(msg::EditArguments{EditAction::replace_all(arguments_buffer_)});
    }
}

void ImGuiApp::render_status_row() {
    const ViewState& view = runtime_->app().view_state();

    const char* labels[] = {"Save", "Load", "Reload", "Cancel", "Run"};
    const ImGuiStyle& style = ImGui::GetStyle();
    float buttons_width = 0.0f;
    for (const char* label : labels) {
        buttons_width += ImGui::CalcTextSize(label).x + style.FramePadding.x * 2.0f + style.ItemSpacing.x;
    }

    ImGui::AlignTextToFramePadding();
    const float text_width = ImGui::GetContentRegionAvail().x - buttons_width;
    ImGui::PushClipRect(ImGui::GetCursorScreenPos(),
                        ImVec2(ImGui::GetCursorScreenPos().x + std::max(text_width, 0.0f),
                               ImGui::GetCursorScreenPos().y + ImGui::GetFrameHeight()),
                        true);
    ImGui::TextUnformatted(view.status.c_str());
    ImGui::PopClipRect();
    if (ImGui::IsItemHovered() && !view.status.empty()) {
        ImGui::SetTooltip("%s", view.status.c_str());
    }

    ImGui::SameLine();
    const float available = ImGui::GetContentRegionAvail().x;
    if (available > buttons_width) {
        ImGui::SetCursorPosX(ImGui::GetCursorPosX() + available - buttons_width + style.ItemSpacing.x);
    }

    if (ImGui::Button("Save")) {
        dispatch(msg::SaveConfigDialog{});
    }
    ImGui::SameLine();
    if (ImGui::Button("Load")) {
        dispatch(msg::LoadConfigDialog{});
    }
    ImGui::SameLine();
    if (ImGui::Button("Reload")) {
        dispatch(msg::Reload{});
    }
    ImGui::SameLine();
    if (ImGui::Button("Cancel")) {
        dispatch(msg::Exit{});
    }
    ImGui::SameLine();
    if (ImGui::Button("Run")) {
        dispatch(msg::Run{});
    }
}

} // namespace cmdrun
