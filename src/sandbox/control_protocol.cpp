#include "sandbox/control_protocol.hpp"

#include <cctype>
#include <sstream>

#include <nlohmann/json.hpp>

#include "utils/common.hpp"

namespace replbox::sandbox {
namespace {

constexpr const char* kResidentLoop = R"PY(
import contextlib
import io
import json
import os
import sys
import traceback

# Control records travel on a private copy of the original stdout. fd 1 is
# pointed at stderr so that output written by child processes cannot end up
# in the record stream.
_channel = os.fdopen(os.dup(1), "w", encoding="utf-8")
os.dup2(2, 1)

NAMESPACE = {"__name__": "__main__"}


def run(code, namespace):
    buffer_out = io.StringIO()
    buffer_err = io.StringIO()
    ok = True
    try:
        with contextlib.redirect_stdout(buffer_out), contextlib.redirect_stderr(buffer_err):
            exec(compile(code, "<sandbox>", "exec"), namespace, namespace)
    except Exception:
        ok = False
        traceback.print_exc(file=buffer_err)
    return {"ok": ok, "stdout": buffer_out.getvalue(), "stderr": buffer_err.getvalue()}


def reply(message, payload):
    if isinstance(message, dict) and "id" in message:
        payload["id"] = message["id"]
    _channel.write(json.dumps(payload) + "\n")
    _channel.flush()


for line in sys.stdin:
    line = line.strip()
    if not line:
        continue
    try:
        message = json.loads(line)
    except ValueError as exc:
        reply(None, {"ok": False, "stdout": "", "stderr": "malformed request: %s\n" % exc})
        continue
    if not isinstance(message, dict):
        reply(None, {"ok": False, "stdout": "", "stderr": "request is not an object\n"})
        continue
    if message.get("_terminate"):
        reply(message, {"ok": True, "stdout": "", "stderr": ""})
        break
    reply(message, run(message.get("code", ""), NAMESPACE))
)PY";

bool IsModuleName(const std::string& value) {
    if (value.empty() || value.front() == '.' || value.back() == '.') {
        return false;
    }
    for (const auto c : value) {
        if (!std::isalnum(static_cast<unsigned char>(c)) && c != '_' && c != '.') {
            return false;
        }
    }
    return !std::isdigit(static_cast<unsigned char>(value.front()));
}

std::optional<std::uint64_t> ReadId(const nlohmann::json& json) {
    if (json.contains("id") && json["id"].is_number_unsigned()) {
        return json["id"].get<std::uint64_t>();
    }
    return std::nullopt;
}

nlohmann::json ParseRecord(const std::string& line) {
    const auto text = utils::Trim(line);
    if (text.empty()) {
        throw ProtocolError("empty control record");
    }
    auto json = nlohmann::json::parse(text, nullptr, false);
    if (json.is_discarded()) {
        throw ProtocolError("malformed control record: " + text.substr(0, 200));
    }
    if (!json.is_object()) {
        throw ProtocolError("control record is not an object");
    }
    return json;
}

}  // namespace

ControlRequest ControlRequest::Code(std::string code, std::optional<std::uint64_t> id) {
    ControlRequest request{};
    request.id = id;
    request.code = std::move(code);
    return request;
}

ControlRequest ControlRequest::Terminate(std::optional<std::uint64_t> id) {
    ControlRequest request{};
    request.id = id;
    request.terminate = true;
    return request;
}

std::string EncodeRequest(const ControlRequest& request) {
    nlohmann::json json = nlohmann::json::object();
    if (request.id.has_value()) {
        json["id"] = *request.id;
    }
    if (request.terminate) {
        json["_terminate"] = true;
    } else {
        json["code"] = request.code;
    }
    // ASCII-only output; invalid UTF-8 in the payload is replaced, never an error.
    return json.dump(-1, ' ', true, nlohmann::json::error_handler_t::replace) + "\n";
}

std::string EncodeResponse(const ControlResponse& response) {
    nlohmann::json json = {
        {"ok", response.ok},
        {"stdout", response.stdout_text},
        {"stderr", response.stderr_text}
    };
    if (response.id.has_value()) {
        json["id"] = *response.id;
    }
    return json.dump(-1, ' ', true, nlohmann::json::error_handler_t::replace) + "\n";
}

ControlResponse DecodeResponse(const std::string& line) {
    const auto json = ParseRecord(line);
    if (!json.contains("ok") || !json["ok"].is_boolean()) {
        throw ProtocolError("incomplete control record: missing ok");
    }
    if (!json.contains("stdout") || !json["stdout"].is_string()) {
        throw ProtocolError("incomplete control record: missing stdout");
    }
    if (!json.contains("stderr") || !json["stderr"].is_string()) {
        throw ProtocolError("incomplete control record: missing stderr");
    }
    ControlResponse response{};
    response.id = ReadId(json);
    response.ok = json["ok"].get<bool>();
    response.stdout_text = json["stdout"].get<std::string>();
    response.stderr_text = json["stderr"].get<std::string>();
    return response;
}

ControlRequest DecodeRequest(const std::string& line) {
    const auto json = ParseRecord(line);
    ControlRequest request{};
    request.id = ReadId(json);
    if (json.contains("_terminate") && json["_terminate"].is_boolean() && json["_terminate"].get<bool>()) {
        request.terminate = true;
        return request;
    }
    if (!json.contains("code") || !json["code"].is_string()) {
        throw ProtocolError("incomplete control record: missing code");
    }
    request.code = json["code"].get<std::string>();
    return request;
}

const std::string& ResidentLoopScript() {
    static const std::string script(kResidentLoop);
    return script;
}

PreloadModule ParsePreload(const std::string& entry) {
    std::istringstream stream(entry);
    std::vector<std::string> tokens;
    std::string token;
    while (stream >> token) {
        tokens.push_back(token);
    }
    PreloadModule module{};
    if (tokens.size() == 1) {
        module.module = tokens[0];
    } else if (tokens.size() == 3 && tokens[1] == "as") {
        module.module = tokens[0];
        module.alias = tokens[2];
    } else {
        throw std::invalid_argument("invalid preload entry: " + entry);
    }
    if (!IsModuleName(module.module) ||
        (!module.alias.empty() && (!IsModuleName(module.alias) || module.alias.find('.') != std::string::npos))) {
        throw std::invalid_argument("invalid preload entry: " + entry);
    }
    return module;
}

std::string BuildInitSnippet(const std::vector<PreloadModule>& modules,
                             const std::vector<std::string>& search_paths) {
    std::ostringstream snippet;
    snippet << "import sys\n";
    // Inserted in reverse so the first path ends up first.
    for (auto it = search_paths.rbegin(); it != search_paths.rend(); ++it) {
        // A JSON string literal is also a valid Python string literal.
        snippet << "sys.path.insert(0, " << nlohmann::json(*it).dump() << ")\n";
    }
    for (const auto& module : modules) {
        snippet << "try:\n";
        snippet << "    import " << module.module;
        if (!module.alias.empty()) {
            snippet << " as " << module.alias;
        }
        snippet << "\n";
        snippet << "except ImportError as exc:\n";
        snippet << "    print('preload skipped: %s' % exc, file=sys.stderr)\n";
    }
    return snippet.str();
}

}  // namespace replbox::sandbox
