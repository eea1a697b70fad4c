#include "config/config_loader.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <stdexcept>

#include "utils/common.hpp"
#include "utils/logging.hpp"

namespace replbox::config {
namespace {

std::string GetEnv(const char* name) {
    const char* value = std::getenv(name);
    return value ? std::string(value) : std::string();
}

std::string GetEnvFallback(const char* primary, const char* secondary) {
    auto value = GetEnv(primary);
    if (!value.empty()) {
        return value;
    }
    return GetEnv(secondary);
}

bool ParseBool(const std::string& value) {
    std::string lowered = value;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return lowered == "1" || lowered == "true" || lowered == "yes" || lowered == "on";
}

int ParseInt(const std::string& value, int fallback) {
    try {
        return std::stoi(value);
    } catch (const std::logic_error&) {
        return fallback;
    }
}

std::vector<std::string> SplitCsv(const std::string& value) {
    std::vector<std::string> items;
    std::stringstream stream(value);
    std::string item;
    while (std::getline(stream, item, ',')) {
        item = utils::Trim(item);
        if (!item.empty()) {
            items.push_back(item);
        }
    }
    return items;
}

// Accepts either a JSON array of strings or a single whitespace separated string.
std::vector<std::string> ReadCommand(const nlohmann::json& value) {
    std::vector<std::string> parts;
    if (value.is_array()) {
        for (const auto& item : value) {
            if (item.is_string()) {
                parts.push_back(item.get<std::string>());
            }
        }
    } else if (value.is_string()) {
        std::istringstream stream(value.get<std::string>());
        std::string token;
        while (stream >> token) {
            parts.push_back(token);
        }
    }
    return parts;
}

void ReadString(const nlohmann::json& source, const char* key, std::string& target) {
    if (source.contains(key) && source[key].is_string()) {
        target = source[key].get<std::string>();
    }
}

void ReadInt(const nlohmann::json& source, const char* key, int& target) {
    if (source.contains(key) && source[key].is_number_integer()) {
        target = source[key].get<int>();
    }
}

void ReadBool(const nlohmann::json& source, const char* key, bool& target) {
    if (source.contains(key) && source[key].is_boolean()) {
        target = source[key].get<bool>();
    }
}

}  // namespace

std::filesystem::path GetConfigPath() {
    return utils::GetHomePath() / ".replbox" / "config.json";
}

void ApplyConfigFromJson(Config& config, const nlohmann::json& data) {
    if (!data.is_object()) {
        return;
    }

    if (data.contains("sandbox") && data["sandbox"].is_object()) {
        const auto& sandbox = data["sandbox"];
        ReadString(sandbox, "rootDir", config.sandbox.root_dir);
        ReadString(sandbox, "image", config.sandbox.image);
        ReadInt(sandbox, "lifetimeS", config.sandbox.lifetime_s);
        ReadInt(sandbox, "memoryMb", config.sandbox.memory_mb);
        ReadInt(sandbox, "cpuSeconds", config.sandbox.cpu_seconds);
        if (sandbox.contains("volume") && sandbox["volume"].is_object()) {
            const auto& volume = sandbox["volume"];
            ReadBool(volume, "enabled", config.sandbox.volume.enabled);
            ReadString(volume, "name", config.sandbox.volume.name);
            ReadString(volume, "source", config.sandbox.volume.source);
            ReadString(volume, "mountPath", config.sandbox.volume.mount_path);
            ReadBool(volume, "createIfMissing", config.sandbox.volume.create_if_missing);
        }
    }

    if (data.contains("interpreter") && data["interpreter"].is_object()) {
        const auto& interpreter = data["interpreter"];
        if (interpreter.contains("command")) {
            auto command = ReadCommand(interpreter["command"]);
            if (!command.empty()) {
                config.interpreter.command = std::move(command);
            }
        }
        if (interpreter.contains("preload") && interpreter["preload"].is_array()) {
            config.interpreter.preload.clear();
            for (const auto& item : interpreter["preload"]) {
                if (item.is_string()) {
                    config.interpreter.preload.push_back(item.get<std::string>());
                }
            }
        }
        ReadInt(interpreter, "defaultTimeoutS", config.interpreter.default_timeout_s);
        ReadInt(interpreter, "terminateGraceS", config.interpreter.terminate_grace_s);
        ReadBool(interpreter, "restartOnTimeout", config.interpreter.restart_on_timeout);
    }

    if (data.contains("shell") && data["shell"].is_object()) {
        const auto& shell = data["shell"];
        if (shell.contains("command")) {
            auto command = ReadCommand(shell["command"]);
            if (!command.empty()) {
                config.shell.command = std::move(command);
            }
        }
        ReadInt(shell, "defaultTimeoutS", config.shell.default_timeout_s);
    }

    if (data.contains("logging") && data["logging"].is_object()) {
        ReadString(data["logging"], "level", config.logging.level);
    }
}

void ApplyEnvironmentOverrides(Config& config) {
    const auto root_dir = GetEnvFallback("REPLBOX_SANDBOX__ROOT_DIR", "REPLBOX_SANDBOX_ROOT_DIR");
    if (!root_dir.empty()) {
        config.sandbox.root_dir = root_dir;
    }

    const auto image = GetEnvFallback("REPLBOX_SANDBOX__IMAGE", "REPLBOX_SANDBOX_IMAGE");
    if (!image.empty()) {
        config.sandbox.image = image;
    }

    const auto lifetime = GetEnvFallback("REPLBOX_SANDBOX__LIFETIME_S", "REPLBOX_SANDBOX_LIFETIME_S");
    if (!lifetime.empty()) {
        config.sandbox.lifetime_s = ParseInt(lifetime, config.sandbox.lifetime_s);
    }

    const auto memory = GetEnvFallback("REPLBOX_SANDBOX__MEMORY_MB", "REPLBOX_SANDBOX_MEMORY_MB");
    if (!memory.empty()) {
        config.sandbox.memory_mb = ParseInt(memory, config.sandbox.memory_mb);
    }

    const auto cpu = GetEnvFallback("REPLBOX_SANDBOX__CPU_SECONDS", "REPLBOX_SANDBOX_CPU_SECONDS");
    if (!cpu.empty()) {
        config.sandbox.cpu_seconds = ParseInt(cpu, config.sandbox.cpu_seconds);
    }

    const auto volume_enabled = GetEnvFallback(
        "REPLBOX_SANDBOX__VOLUME__ENABLED",
        "REPLBOX_SANDBOX_VOLUME_ENABLED");
    if (!volume_enabled.empty()) {
        config.sandbox.volume.enabled = ParseBool(volume_enabled);
    }

    const auto volume_source = GetEnvFallback(
        "REPLBOX_SANDBOX__VOLUME__SOURCE",
        "REPLBOX_SANDBOX_VOLUME_SOURCE");
    if (!volume_source.empty()) {
        config.sandbox.volume.source = volume_source;
    }

    const auto interpreter_command = GetEnvFallback(
        "REPLBOX_INTERPRETER__COMMAND",
        "REPLBOX_INTERPRETER_COMMAND");
    if (!interpreter_command.empty()) {
        auto command = ReadCommand(nlohmann::json(interpreter_command));
        if (!command.empty()) {
            config.interpreter.command = std::move(command);
        }
    }

    // Set but empty is meaningful here: no preloads at all.
    const char* preload = std::getenv("REPLBOX_INTERPRETER__PRELOAD");
    if (!preload) {
        preload = std::getenv("REPLBOX_INTERPRETER_PRELOAD");
    }
    if (preload) {
        config.interpreter.preload = SplitCsv(preload);
    }

    const auto interpreter_timeout = GetEnvFallback(
        "REPLBOX_INTERPRETER__DEFAULT_TIMEOUT_S",
        "REPLBOX_INTERPRETER_DEFAULT_TIMEOUT_S");
    if (!interpreter_timeout.empty()) {
        config.interpreter.default_timeout_s = ParseInt(
            interpreter_timeout,
            config.interpreter.default_timeout_s);
    }

    const auto restart_on_timeout = GetEnvFallback(
        "REPLBOX_INTERPRETER__RESTART_ON_TIMEOUT",
        "REPLBOX_INTERPRETER_RESTART_ON_TIMEOUT");
    if (!restart_on_timeout.empty()) {
        config.interpreter.restart_on_timeout = ParseBool(restart_on_timeout);
    }

    const auto shell_timeout = GetEnvFallback(
        "REPLBOX_SHELL__DEFAULT_TIMEOUT_S",
        "REPLBOX_SHELL_DEFAULT_TIMEOUT_S");
    if (!shell_timeout.empty()) {
        config.shell.default_timeout_s = ParseInt(shell_timeout, config.shell.default_timeout_s);
    }

    const auto log_level = GetEnvFallback("REPLBOX_LOGGING__LEVEL", "REPLBOX_LOG_LEVEL");
    if (!log_level.empty()) {
        config.logging.level = log_level;
    }
}

Config LoadConfigFrom(const std::filesystem::path& path) {
    Config config{};

    if (std::filesystem::exists(path)) {
        try {
            std::ifstream input(path);
            nlohmann::json data;
            input >> data;
            ApplyConfigFromJson(config, data);
        } catch (const nlohmann::json::exception& ex) {
            utils::Log(utils::LogLevel::kWarn, "config", "keeping defaults, config parse failed",
                       {{"path", path.string()}, {"error", ex.what()}});
        }
    }

    ApplyEnvironmentOverrides(config);
    return config;
}

Config LoadConfig() {
    return LoadConfigFrom(GetConfigPath());
}

}  // namespace replbox::config
