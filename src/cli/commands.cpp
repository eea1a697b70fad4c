#include <csignal>
#include <iostream>
#include <memory>
#include <mutex>
#include <string>

#include <nlohmann/json.hpp>

#include "agent/tools/python.hpp"
#include "agent/tools/shell.hpp"
#include "agent/tools/tool_registry.hpp"
#include "config/config_loader.hpp"
#include "sandbox/local_platform.hpp"
#include "session/request_dispatcher.hpp"
#include "session/sandbox_service.hpp"
#include "utils/logging.hpp"

namespace {

volatile std::sig_atomic_t g_signal = 0;

void HandleSignal(int signal) {
    g_signal = signal;
}

void InstallSignalHandlers() {
    struct sigaction action {};
    action.sa_handler = HandleSignal;
    sigemptyset(&action.sa_mask);
    action.sa_flags = 0;
    sigaction(SIGINT, &action, nullptr);
    sigaction(SIGTERM, &action, nullptr);
}

// One JSON request per stdin line, one JSON result per stdout line.
int RunServe(replbox::session::SandboxService& service) {
    InstallSignalHandlers();
    std::mutex output_mutex;
    replbox::session::RequestDispatcher dispatcher(service, [&output_mutex](const nlohmann::json& json) {
        std::lock_guard<std::mutex> lock(output_mutex);
        std::cout << json.dump(-1, ' ', true, nlohmann::json::error_handler_t::replace) << std::endl;
    });

    replbox::utils::Log(replbox::utils::LogLevel::kInfo, "serve", "ready");
    std::string line;
    while (g_signal == 0 && std::getline(std::cin, line)) {
        if (line.find_first_not_of(" \t\r") == std::string::npos) {
            continue;
        }
        dispatcher.Submit(line);
    }

    dispatcher.Drain();
    service.ReleaseAll();
    replbox::utils::Log(replbox::utils::LogLevel::kInfo, "serve", "stopped",
                        {{"requests", std::to_string(dispatcher.Submitted())}});
    return 0;
}

int PrintResult(const replbox::sandbox::ExecutionResult& result) {
    std::cout << replbox::agent::tools::FormatToolOutput(result) << std::endl;
    return result.Completed() && result.success ? 0 : 1;
}

int PrintTools(replbox::session::SandboxService& service) {
    replbox::agent::tools::ToolRegistry registry;
    registry.Register(std::make_unique<replbox::agent::tools::ExecutePythonTool>(service, "cli"));
    registry.Register(std::make_unique<replbox::agent::tools::ExecuteBashTool>(service, "cli"));

    nlohmann::json json = nlohmann::json::array();
    for (const auto& def : registry.GetDefinitions()) {
        json.push_back({
            {"name", def.name},
            {"description", def.description},
            {"parameters", nlohmann::json::parse(def.parameters_json)}
        });
    }
    std::cout << json.dump(2) << std::endl;
    return 0;
}

void PrintUsage() {
    std::cout << "Usage: replbox serve | replbox python <caller> <code> | replbox bash <command> | replbox tools"
              << std::endl;
}

}  // namespace

int main(int argc, char** argv) {
    if (argc < 2) {
        PrintUsage();
        return 1;
    }
    const std::string command = argv[1];

    auto config = replbox::config::LoadConfig();
    replbox::utils::LogConfig log_config{};
    log_config.min_level = replbox::utils::ParseLogLevel(config.logging.level, replbox::utils::LogLevel::kInfo);
    replbox::utils::SetLogConfig(log_config);

    replbox::sandbox::LocalPlatform platform(replbox::session::ResolveRootDir(config));
    replbox::session::SandboxService service(platform, replbox::session::MakeRegistryOptions(config));

    if (command == "serve") {
        return RunServe(service);
    }
    if (command == "python" && argc >= 4) {
        const auto code = PrintResult(service.ExecuteCode(argv[2], argv[3]));
        service.ReleaseAll();
        return code;
    }
    if (command == "bash" && argc >= 3) {
        return PrintResult(service.RunShellOnce(argv[2]));
    }
    if (command == "tools") {
        return PrintTools(service);
    }
    PrintUsage();
    return 1;
}
