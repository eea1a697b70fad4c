#pragma once

#include <chrono>
#include <filesystem>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "sandbox/stream_adapter.hpp"

namespace replbox::sandbox {

class ProvisioningError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

struct ResourceLimits {
    int memory_mb = 2048;
    int cpu_seconds = 0;
};

struct VolumeMount {
    std::string name;
    std::filesystem::path source;
    std::string mount_path;
    bool create_if_missing = true;
};

struct EnvironmentSpec {
    std::string image;
    ResourceLimits limits;
    std::chrono::seconds lifetime{600};
    std::vector<VolumeMount> volumes;
    std::string label;
};

class ProcessHandle {
public:
    virtual ~ProcessHandle() = default;

    virtual int Id() const = 0;
    virtual WriteHandle StdinHandle() = 0;
    virtual ReadHandle StdoutHandle() = 0;
    virtual ReadHandle StderrHandle() = 0;
    virtual void CloseStdin() = 0;

    // Exit code once the process has ended, nullopt while it still runs
    // after timeout.
    virtual std::optional<int> Wait(std::chrono::milliseconds timeout) = 0;
    virtual void Kill() = 0;
};

class Environment {
public:
    virtual ~Environment() = default;

    virtual std::string Id() const = 0;
    virtual std::filesystem::path WorkingDirectory() const = 0;

    // A zero timeout leaves the process bounded only by the environment lifetime.
    virtual std::unique_ptr<ProcessHandle> SpawnProcess(
        const std::vector<std::string>& argv,
        std::chrono::milliseconds timeout) = 0;

    virtual void Terminate() = 0;
    virtual bool IsTerminated() const = 0;
};

class Platform {
public:
    virtual ~Platform() = default;
    virtual std::unique_ptr<Environment> ProvisionEnvironment(const EnvironmentSpec& spec) = 0;
};

}  // namespace replbox::sandbox
