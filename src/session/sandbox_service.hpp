#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

#include "config/config_schema.hpp"
#include "sandbox/execution_result.hpp"
#include "sandbox/platform.hpp"
#include "session/session_registry.hpp"

namespace replbox::session {

RegistryOptions MakeRegistryOptions(const config::Config& config);
std::filesystem::path ResolveRootDir(const config::Config& config);

// The surface the agent runtime talks to. Every call returns a result;
// nothing is thrown past these methods.
class SandboxService {
public:
    SandboxService(sandbox::Platform& platform, RegistryOptions options);

    sandbox::ExecutionResult ExecuteCode(const std::string& caller_id,
                                         const std::string& code,
                                         std::optional<std::chrono::milliseconds> timeout = std::nullopt);
    sandbox::ExecutionResult ExecuteShell(const std::string& caller_id,
                                          const std::string& command,
                                          std::optional<std::chrono::milliseconds> timeout = std::nullopt);
    void ReleaseSession(const std::string& caller_id);
    void ReleaseAll();

    // Throwaway sandbox: created, used for one call, then terminated.
    sandbox::ExecutionResult RunCodeOnce(const std::string& code,
                                         std::optional<std::chrono::milliseconds> timeout = std::nullopt);
    sandbox::ExecutionResult RunShellOnce(const std::string& command,
                                          std::optional<std::chrono::milliseconds> timeout = std::nullopt);

    SessionRegistry& Registry() { return registry_; }

private:
    template <typename Fn>
    sandbox::ExecutionResult WithSandbox(const std::string& caller_id, Fn&& fn);
    std::string NextOneShotId();

    SessionRegistry registry_;
    std::atomic<std::uint64_t> one_shot_counter_{0};
};

}  // namespace replbox::session
