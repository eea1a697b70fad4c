#pragma once

#include <catch2/catch.hpp>

#include "sandbox/local_platform.hpp"
#include "sandbox/platform.hpp"
#include "session/session_registry.hpp"
#include "utils/logging.hpp"

extern "C" {
#include <signal.h>
#include <unistd.h>
}

#include <atomic>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <memory>
#include <string>
#include <system_error>
#include <thread>

namespace replbox::test {

namespace fs = std::filesystem;
using namespace std::chrono_literals;

// Unique scratch directory removed on scope exit.
class TempDir {
public:
    TempDir() {
        static std::atomic<int> counter{0};
        path_ = fs::temp_directory_path() /
                ("replbox-test-" + std::to_string(::getpid()) + "-" + std::to_string(++counter));
        fs::create_directories(path_);
    }
    ~TempDir() {
        std::error_code ec;
        fs::remove_all(path_, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const fs::path& Path() const { return path_; }

private:
    fs::path path_;
};

inline void WriteFile(const fs::path& path, const std::string& content) {
    fs::create_directories(path.parent_path());
    std::ofstream output(path);
    output << content;
}

inline void QuietLogs() {
    utils::LogConfig config{};
    config.min_level = utils::LogLevel::kError;
    utils::SetLogConfig(config);
}

// Short timeouts, only stdlib preloads, tools volume under the scratch dir.
inline session::RegistryOptions MakeTestOptions(const fs::path& scratch) {
    session::RegistryOptions options{};
    options.environment.limits.memory_mb = 0;
    options.environment.lifetime = std::chrono::seconds(120);
    sandbox::VolumeMount volume{};
    volume.name = "replbox-tools";
    volume.source = scratch / "volume";
    volume.mount_path = "servers";
    volume.create_if_missing = true;
    options.environment.volumes.push_back(volume);

    options.interpreter.command = {"python3", "-u"};
    options.interpreter.default_timeout = 20s;
    options.interpreter.terminate_grace = 1s;
    options.preload = {{"json", ""}, {"sys", ""}};

    options.shell.command = {"bash", "-c"};
    options.shell.default_timeout = 20s;
    return options;
}

// LocalPlatform that counts provisions and can refuse volume attachment.
class RecordingPlatform : public sandbox::Platform {
public:
    explicit RecordingPlatform(fs::path root) : inner_(std::move(root)) {}

    std::unique_ptr<sandbox::Environment> ProvisionEnvironment(const sandbox::EnvironmentSpec& spec) override {
        ++calls_;
        if (fail_volumes_ && !spec.volumes.empty()) {
            ++volume_failures_;
            throw sandbox::ProvisioningError("volume backend unavailable");
        }
        if (fail_all_) {
            throw sandbox::ProvisioningError("platform unavailable");
        }
        if (delay_.count() > 0) {
            std::this_thread::sleep_for(delay_);
        }
        ++provisioned_;
        return inner_.ProvisionEnvironment(spec);
    }

    void FailVolumes(bool value) { fail_volumes_ = value; }
    void FailAll(bool value) { fail_all_ = value; }
    void SetDelay(std::chrono::milliseconds delay) { delay_ = delay; }

    int Calls() const { return calls_.load(); }
    int Provisioned() const { return provisioned_.load(); }
    int VolumeFailures() const { return volume_failures_.load(); }

private:
    sandbox::LocalPlatform inner_;
    std::atomic<int> calls_{0};
    std::atomic<int> provisioned_{0};
    std::atomic<int> volume_failures_{0};
    std::atomic<bool> fail_volumes_{false};
    std::atomic<bool> fail_all_{false};
    std::chrono::milliseconds delay_{0};
};

inline bool Contains(const std::string& haystack, const std::string& needle) {
    return haystack.find(needle) != std::string::npos;
}

}  // namespace replbox::test
