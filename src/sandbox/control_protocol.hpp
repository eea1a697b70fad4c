#pragma once

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace replbox::sandbox {

class ProtocolError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

struct ControlRequest {
    std::optional<std::uint64_t> id;
    std::string code;
    bool terminate = false;

    static ControlRequest Code(std::string code, std::optional<std::uint64_t> id = std::nullopt);
    static ControlRequest Terminate(std::optional<std::uint64_t> id = std::nullopt);
};

struct ControlResponse {
    std::optional<std::uint64_t> id;
    bool ok = false;
    std::string stdout_text;
    std::string stderr_text;
};

// One JSON object followed by '\n'.
std::string EncodeRequest(const ControlRequest& request);
std::string EncodeResponse(const ControlResponse& response);

// Throws ProtocolError unless the line holds one complete response object.
ControlResponse DecodeResponse(const std::string& line);
ControlRequest DecodeRequest(const std::string& line);

// Program run by the interpreter inside the environment: reads one request
// per line from stdin, answers with exactly one response line.
const std::string& ResidentLoopScript();

struct PreloadModule {
    std::string module;
    std::string alias;
};

// "numpy as np" -> {numpy, np}; "json" -> {json, ""}.
PreloadModule ParsePreload(const std::string& entry);

// Imports each module in its own guarded block and puts the search paths at
// the head of the module path.
std::string BuildInitSnippet(const std::vector<PreloadModule>& modules,
                             const std::vector<std::string>& search_paths);

}  // namespace replbox::sandbox
