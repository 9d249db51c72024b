#include "imgui_app.hpp"
#include "imgui.h"

namespace cmdrun {

void ImGuiApp::handle_keyboard_shortcuts() {
    const ImGuiIO& io = ImGui::GetIO();

    // F5 to run
    if (ImGui::IsKeyPressed(ImGuiKey_F5, false)) {
        dispatch(msg::Run{});
        return;
    }

    if (!io.KeyCtrl) return;

    if (ImGui::IsKeyPressed(ImGuiKey_O, false)) {
        dispatch(msg::LoadConfigDialog{});
    } else if (ImGui::IsKeyPressed(ImGuiKey_S, false)) {
        dispatch(msg::SaveConfigDialog{});
    } else if (ImGui::IsKeyPressed(ImGuiKey_R, false)) {
        dispatch(msg::Reload{});
    } else if (ImGui::IsKeyPressed(ImGuiKey_Q, false)) {
        dispatch(msg::Exit{});
    }
}

} // namespace cmdrun
