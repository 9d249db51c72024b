#include "app.hpp"
#include "cli.hpp"
#include "headless.hpp"
#include "imgui/imgui_app.hpp"
#include "log.hpp"
#include "message_queue.hpp"
#include "platform_factory.hpp"
#include "runtime.hpp"
#include "task_runner.hpp"
#include <iostream>
#include <memory>

int main(int argc, char* argv[]) {
    cmdrun::log::init_from_env();

    cmdrun::CliOptions options;
    try {
        options = cmdrun::parse_cli(argc, argv);
    } catch (const cmdrun::CliError& e) {
        std::cerr << "error: " << e.what() << "\n\n" << cmdrun::usage_text();
        return 2;
    }

    if (options.show_help) {
        std::cout << cmdrun::usage_text();
        return 0;
    }
    if (options.show_version) {
        std::cout << cmdrun::kProgramName << " " << cmdrun::kProgramVersion << std::endl;
        return 0;
    }

    try {
        // Create platform-specific services (shared with background work)
        cmdrun::Services services{cmdrun::make_file_dialog(), cmdrun::make_process_runner()};

        if (options.skip) {
            return cmdrun::run_headless(*options.config_path, *services.process_runner);
        }

        cmdrun::Application app(options.theme, options.config_path, false,
                                 std::move(options.config), std::move(services));

        // Update loop: worker threads share the queue, the UI thread pumps it
        auto queue = std::make_shared<cmdrun::MessageQueue>();
        cmdrun::TaskRunner runner(queue);
        cmdrun::Runtime runtime(&app, queue, &runner);
        runtime.dispatch(app.initial_message());

        // ImGuiApp does not own the runtime - it's managed here
        cmdrun::ImGuiApp ui(&runtime, queue.get());
        ui.run();
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
