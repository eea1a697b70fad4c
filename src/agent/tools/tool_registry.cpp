#include "agent/tools/tool_registry.hpp"

#include <cmath>
#include <stdexcept>

#include <nlohmann/json.hpp>

#include "utils/logging.hpp"

namespace replbox::agent::tools {

using utils::LogLevel;

namespace {

std::vector<std::string> RequiredParams(const Tool& tool) {
    std::vector<std::string> required;
    auto schema = nlohmann::json::parse(tool.ParametersJson(), nullptr, false);
    if (schema.is_discarded() || !schema.is_object()) {
        throw std::invalid_argument("tool '" + tool.Name() + "' has an invalid parameter schema");
    }
    auto it = schema.find("required");
    if (it == schema.end() || !it->is_array()) {
        return required;
    }
    for (const auto& item : *it) {
        if (item.is_string()) {
            required.push_back(item.get<std::string>());
        }
    }
    return required;
}

std::string Abbreviate(const std::string& value) {
    return value.size() > 80 ? value.substr(0, 80) + "..." : value;
}

}  // namespace

std::string FormatToolOutput(const sandbox::ExecutionResult& result) {
    if (!result.Completed()) {
        return "Error: " + result.message;
    }
    std::string text = result.output;
    if (!result.error.empty()) {
        text += "\n[stderr]: " + result.error;
    }
    if (text.empty()) {
        return "(no output)";
    }
    return text;
}

std::optional<std::chrono::milliseconds> ParseTimeoutParam(const ToolParams& params) {
    auto it = params.find("timeout");
    if (it == params.end() || it->second.empty()) {
        return std::nullopt;
    }
    double seconds = 0;
    try {
        seconds = std::stod(it->second);
    } catch (const std::exception& ex) {
        utils::Log(LogLevel::kWarn, "tool", "ignoring timeout parameter",
                   {{"value", it->second}, {"error", ex.what()}});
        return std::nullopt;
    }
    if (!std::isfinite(seconds) || seconds <= 0 || seconds > kMaxTimeoutSeconds) {
        utils::Log(LogLevel::kWarn, "tool", "ignoring timeout parameter",
                   {{"value", it->second}, {"error", "out of range"}});
        return std::nullopt;
    }
    return std::chrono::milliseconds(static_cast<long long>(seconds * 1000));
}

void ToolRegistry::Register(std::unique_ptr<Tool> tool) {
    auto required = RequiredParams(*tool);
    auto name = tool->Name();
    tools_[std::move(name)] = Entry{std::move(tool), std::move(required)};
}

Tool* ToolRegistry::Find(const std::string& name) const {
    auto it = tools_.find(name);
    return it == tools_.end() ? nullptr : it->second.tool.get();
}

std::vector<std::string> ToolRegistry::List() const {
    std::vector<std::string> names;
    for (const auto& [name, _] : tools_) {
        names.push_back(name);
    }
    return names;
}

std::vector<ToolDefinition> ToolRegistry::GetDefinitions() const {
    std::vector<ToolDefinition> defs;
    for (const auto& [name, entry] : tools_) {
        defs.push_back({name, entry.tool->Description(), entry.tool->ParametersJson()});
    }
    return defs;
}

std::string ToolRegistry::Execute(const std::string& name, const ToolParams& params) {
    auto it = tools_.find(name);
    if (it == tools_.end()) {
        return "Error: Tool '" + name + "' not found";
    }
    for (const auto& param : it->second.required) {
        auto found = params.find(param);
        if (found == params.end() || found->second.empty()) {
            return "Error: missing " + param;
        }
    }

    utils::LogFields fields{{"name", name}};
    for (const auto& [key, value] : params) {
        fields["param." + key] = Abbreviate(value);
    }
    utils::Log(LogLevel::kInfo, "tool", "start", fields);

    sandbox::ExecutionResult result;
    try {
        result = it->second.tool->Run(params, ParseTimeoutParam(params));
    } catch (const std::exception& ex) {
        utils::Log(LogLevel::kError, "tool", "failed", {{"name", name}, {"error", ex.what()}});
        return std::string("Error: ") + ex.what();
    }
    auto text = FormatToolOutput(result);
    utils::Log(LogLevel::kInfo, "tool", "end",
               {{"name", name}, {"kind", sandbox::ToString(result.kind)}, {"size", std::to_string(text.size())}});
    return text;
}

}  // namespace replbox::agent::tools
