#pragma once

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <memory>

#include "sandbox/platform.hpp"

namespace replbox::sandbox {

// Runs environments as private working directories on this host. Processes
// get their own process group and the environment's resource limits.
class LocalPlatform : public Platform {
public:
    explicit LocalPlatform(std::filesystem::path root_dir);

    std::unique_ptr<Environment> ProvisionEnvironment(const EnvironmentSpec& spec) override;

    const std::filesystem::path& RootDir() const { return root_dir_; }

private:
    std::filesystem::path root_dir_;
    std::atomic<std::uint64_t> counter_{0};
};

}  // namespace replbox::sandbox
