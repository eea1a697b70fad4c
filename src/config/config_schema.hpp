#pragma once

#include <string>
#include <vector>

namespace replbox::config {

struct VolumeConfig {
    bool enabled = true;
    std::string name = "replbox-tools";
    std::string source = "~/.replbox/volumes/replbox-tools";
    std::string mount_path = "servers";
    bool create_if_missing = true;
};

struct SandboxConfig {
    std::string root_dir;
    std::string image;
    int lifetime_s = 600;
    int memory_mb = 2048;
    int cpu_seconds = 0;
    VolumeConfig volume;
};

struct InterpreterConfig {
    std::vector<std::string> command = {"python3", "-u"};
    std::vector<std::string> preload = {"numpy as np", "pandas as pd", "json", "sys"};
    int default_timeout_s = 120;
    int terminate_grace_s = 5;
    bool restart_on_timeout = false;
};

struct ShellConfig {
    std::vector<std::string> command = {"bash", "-c"};
    int default_timeout_s = 120;
};

struct LoggingConfig {
    std::string level = "info";
};

struct Config {
    SandboxConfig sandbox;
    InterpreterConfig interpreter;
    ShellConfig shell;
    LoggingConfig logging;
};

}  // namespace replbox::config
