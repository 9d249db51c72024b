#include "messages.hpp"

namespace cmdrun {

const char* to_string(const Theme theme) {
    switch (theme) {
        case Theme::Light: return "Light";
        case Theme::Dark: return "Dark";
    }
    return "Dark";
}

namespace {

template <class... Ts>
struct overloaded : Ts... { using Ts::operator()...; };

} // namespace

const char* message_name(const Message& message) {
    return std::visit(overloaded{
        [](const msg::SetTheme&) { return "SetTheme"; },
        [](const msg::SetExecutable&) { return "SetExecutable"; },
        [](const msg::EditArguments&) { return "EditArguments"; },
        [](const msg::SetStatus&) { return "SetStatus"; },
        [](const msg::Run&) { return "Run"; },
        [](const msg::OpenExecutableDialog&) { return "OpenExecutableDialog"; },
        [](const msg::LoadConfig&) { return "LoadConfig"; },
        [](const msg::UpdateConfig&) { return "UpdateConfig"; },
        [](const msg::SaveConfig&) { return "SaveConfig"; },
        [](const msg::LoadConfigDialog&) { return "LoadConfigDialog"; },
        [](const msg::SaveConfigDialog&) { return "SaveConfigDialog"; },
        [](const msg::Reload&) { return "Reload"; },
        [](const msg::Exit&) { return "Exit"; },
    }, message);
}

} // namespace cmdrun
