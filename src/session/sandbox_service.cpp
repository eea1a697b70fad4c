#include "session/sandbox_service.hpp"

#include "utils/common.hpp"
#include "utils/logging.hpp"

namespace replbox::session {

using sandbox::ExecutionResult;
using sandbox::FailureKind;
using utils::LogLevel;

RegistryOptions MakeRegistryOptions(const config::Config& config) {
    RegistryOptions options{};

    options.environment.image = config.sandbox.image.empty()
        ? std::string()
        : utils::ExpandHome(config.sandbox.image).string();
    options.environment.limits.memory_mb = config.sandbox.memory_mb;
    options.environment.limits.cpu_seconds = config.sandbox.cpu_seconds;
    options.environment.lifetime = std::chrono::seconds(config.sandbox.lifetime_s);
    if (config.sandbox.volume.enabled) {
        sandbox::VolumeMount volume{};
        volume.name = config.sandbox.volume.name;
        volume.source = utils::ExpandHome(config.sandbox.volume.source);
        volume.mount_path = config.sandbox.volume.mount_path;
        volume.create_if_missing = config.sandbox.volume.create_if_missing;
        options.environment.volumes.push_back(std::move(volume));
    }

    options.interpreter.command = config.interpreter.command;
    options.interpreter.default_timeout = std::chrono::seconds(config.interpreter.default_timeout_s);
    options.interpreter.terminate_grace = std::chrono::seconds(config.interpreter.terminate_grace_s);
    options.interpreter.restart_on_timeout = config.interpreter.restart_on_timeout;
    for (const auto& entry : config.interpreter.preload) {
        try {
            options.preload.push_back(sandbox::ParsePreload(entry));
        } catch (const std::invalid_argument& ex) {
            utils::Log(LogLevel::kWarn, "config", "ignoring preload entry",
                       {{"entry", entry}, {"error", ex.what()}});
        }
    }

    options.shell.command = config.shell.command;
    options.shell.default_timeout = std::chrono::seconds(config.shell.default_timeout_s);
    return options;
}

std::filesystem::path ResolveRootDir(const config::Config& config) {
    if (!config.sandbox.root_dir.empty()) {
        return utils::ExpandHome(config.sandbox.root_dir);
    }
    return std::filesystem::temp_directory_path() / "replbox";
}

SandboxService::SandboxService(sandbox::Platform& platform, RegistryOptions options)
    : registry_(platform, std::move(options)) {}

template <typename Fn>
ExecutionResult SandboxService::WithSandbox(const std::string& caller_id, Fn&& fn) {
    std::shared_ptr<sandbox::Sandbox> sandbox;
    try {
        sandbox = registry_.Acquire(caller_id);
    } catch (const std::exception& ex) {
        utils::Log(LogLevel::kError, "service", "could not provision sandbox",
                   {{"caller", caller_id}, {"error", ex.what()}});
        return ExecutionResult::Failure(FailureKind::kProvisioning, ex.what());
    }
    try {
        return fn(*sandbox);
    } catch (const std::exception& ex) {
        utils::Log(LogLevel::kError, "service", "call failed",
                   {{"caller", caller_id}, {"error", ex.what()}});
        return ExecutionResult::Failure(FailureKind::kTransport, ex.what());
    }
}

ExecutionResult SandboxService::ExecuteCode(const std::string& caller_id,
                                            const std::string& code,
                                            std::optional<std::chrono::milliseconds> timeout) {
    utils::Log(LogLevel::kDebug, "service", "execute_code",
               {{"caller", caller_id}, {"size", std::to_string(code.size())}});
    return WithSandbox(caller_id, [&](sandbox::Sandbox& sandbox) {
        return sandbox.ExecuteCode(code, timeout);
    });
}

ExecutionResult SandboxService::ExecuteShell(const std::string& caller_id,
                                             const std::string& command,
                                             std::optional<std::chrono::milliseconds> timeout) {
    utils::Log(LogLevel::kDebug, "service", "execute_shell",
               {{"caller", caller_id}, {"command", command}});
    return WithSandbox(caller_id, [&](sandbox::Sandbox& sandbox) {
        return sandbox.ExecuteShell(command, timeout);
    });
}

void SandboxService::ReleaseSession(const std::string& caller_id) {
    utils::BestEffort("service", "release " + caller_id, [&]() {
        if (!registry_.Release(caller_id)) {
            utils::Log(LogLevel::kDebug, "service", "release of unknown session", {{"caller", caller_id}});
        }
    });
}

void SandboxService::ReleaseAll() {
    registry_.ReleaseAll();
}

std::string SandboxService::NextOneShotId() {
    return "oneshot-" + std::to_string(++one_shot_counter_);
}

ExecutionResult SandboxService::RunCodeOnce(const std::string& code,
                                            std::optional<std::chrono::milliseconds> timeout) {
    const auto id = NextOneShotId();
    auto result = ExecuteCode(id, code, timeout);
    ReleaseSession(id);
    return result;
}

ExecutionResult SandboxService::RunShellOnce(const std::string& command,
                                             std::optional<std::chrono::milliseconds> timeout) {
    const auto id = NextOneShotId();
    auto result = ExecuteShell(id, command, timeout);
    ReleaseSession(id);
    return result;
}

}  // namespace replbox::session
