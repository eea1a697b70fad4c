#include "utils.hpp"

#include "agent/tools/python.hpp"
#include "agent/tools/shell.hpp"
#include "agent/tools/tool_registry.hpp"
#include "config/config_schema.hpp"
#include "sandbox/local_platform.hpp"
#include "session/sandbox_service.hpp"

#include <nlohmann/json.hpp>

#include <set>
#include <stdexcept>
#include <vector>

namespace replbox::test {

using agent::tools::ExecuteBashTool;
using agent::tools::ExecutePythonTool;
using agent::tools::ToolRegistry;
using session::SandboxService;

namespace {

struct ServiceFixture {
    ServiceFixture() : platform(scratch.Path() / "envs"), service(platform, MakeTestOptions(scratch.Path())) {
        QuietLogs();
    }

    TempDir scratch;
    RecordingPlatform platform;
    SandboxService service;
};

}  // namespace

TEST_CASE("007: state set by one call is visible to the next", "[007][service]") {
    ServiceFixture fixture;
    auto& service = fixture.service;

    REQUIRE(service.ExecuteCode("agent-1", "x = 1").success);
    const auto result = service.ExecuteCode("agent-1", "print(x)");
    REQUIRE(result.Completed());
    CHECK(result.success);
    CHECK(Contains(result.output, "1"));

    REQUIRE(service.ExecuteCode("agent-1", "x += 1\nimport math").success);
    const auto again = service.ExecuteCode("agent-1", "print(x, math.pi > 3)");
    CHECK(utils::Trim(again.output) == "2 True");
}

TEST_CASE("007: shell works before any interpreter exists", "[007][service]") {
    ServiceFixture fixture;
    auto& service = fixture.service;

    const auto result = service.ExecuteShell("agent-1", "echo hi");
    REQUIRE(result.Completed());
    CHECK(result.success);
    CHECK(utils::Trim(result.output) == "hi");

    auto sandbox = service.Registry().Find("agent-1");
    REQUIRE(sandbox != nullptr);
    CHECK(sandbox->Interpreter().State() == sandbox::SessionState::kAbsent);
}

TEST_CASE("007: shell and interpreter share the working directory", "[007][service]") {
    ServiceFixture fixture;
    auto& service = fixture.service;

    REQUIRE(service.ExecuteShell("agent-1", "printf 'a,b\\n1,2\\n' > data.csv").success);
    const auto result = service.ExecuteCode("agent-1", "print(open('data.csv').read().splitlines()[1])");
    CHECK(utils::Trim(result.output) == "1,2");
}

TEST_CASE("007: timeout then a fast call on the same caller", "[007][service]") {
    ServiceFixture fixture;
    auto& service = fixture.service;

    REQUIRE(service.ExecuteCode("agent-1", "import time\nvalue = 'ok'").success);
    const auto slow = service.ExecuteCode("agent-1", "time.sleep(1)", 200ms);
    CHECK(slow.TimedOut());

    const auto fast = service.ExecuteCode("agent-1", "print(value)");
    REQUIRE(fast.Completed());
    CHECK(utils::Trim(fast.output) == "ok");
}

TEST_CASE("007: release twice is fine", "[007][service]") {
    ServiceFixture fixture;
    auto& service = fixture.service;

    REQUIRE(service.ExecuteCode("agent-1", "n = 1").success);
    CHECK_NOTHROW(service.ReleaseSession("agent-1"));
    CHECK_NOTHROW(service.ReleaseSession("agent-1"));
    CHECK_NOTHROW(service.ReleaseSession("unknown"));
    CHECK(service.Registry().Size() == 0);

    const auto result = service.ExecuteCode("agent-1", "print('n' in globals())");
    CHECK(utils::Trim(result.output) == "False");
}

TEST_CASE("007: concurrent callers never see each other's names", "[007][service]") {
    ServiceFixture fixture;
    auto& service = fixture.service;

    constexpr int kCallers = 4;
    std::vector<std::string> outputs(kCallers);
    std::vector<std::thread> threads;
    for (int i = 0; i < kCallers; ++i) {
        threads.emplace_back([&, i]() {
            const auto id = "caller-" + std::to_string(i);
            service.ExecuteCode(id, "mine = " + std::to_string(i));
            outputs[i] = service.ExecuteCode(
                id, "print(mine, sorted(k for k in globals() if k.startswith('mine')))").output;
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }
    for (int i = 0; i < kCallers; ++i) {
        CHECK(utils::Trim(outputs[i]) == std::to_string(i) + " ['mine']");
    }
    CHECK(fixture.platform.Provisioned() == kCallers);
}

TEST_CASE("007: provisioning failure is returned, not thrown", "[007][service]") {
    ServiceFixture fixture;
    fixture.platform.FailAll(true);

    const auto code = fixture.service.ExecuteCode("agent-1", "1");
    REQUIRE(code.Failed());
    CHECK(code.failure == sandbox::FailureKind::kProvisioning);
    CHECK(Contains(code.message, "platform unavailable"));

    const auto shell = fixture.service.ExecuteShell("agent-1", "true");
    REQUIRE(shell.Failed());
    CHECK(shell.failure == sandbox::FailureKind::kProvisioning);
}

TEST_CASE("007: one-off runs leave nothing registered", "[007][service]") {
    ServiceFixture fixture;
    auto& service = fixture.service;

    const auto code = service.RunCodeOnce("print(6 * 7)");
    CHECK(utils::Trim(code.output) == "42");
    const auto shell = service.RunShellOnce("echo once");
    CHECK(utils::Trim(shell.output) == "once");

    CHECK(service.Registry().Size() == 0);
    CHECK(fixture.platform.Provisioned() == 2);
}

TEST_CASE("007: tool output formatting", "[007][tools]") {
    using agent::tools::FormatToolOutput;
    using sandbox::ExecutionResult;

    CHECK(FormatToolOutput(ExecutionResult::Success(true, "out\n", "")) == "out\n");
    CHECK(FormatToolOutput(ExecutionResult::Success(false, "out", "boom")) == "out\n[stderr]: boom");
    CHECK(FormatToolOutput(ExecutionResult::Success(true, "", "")) == "(no output)");
    CHECK(FormatToolOutput(ExecutionResult::Timeout(120s)) == "Error: Timeout after 120s");
    CHECK(FormatToolOutput(ExecutionResult::Failure(sandbox::FailureKind::kTransport, "pipe closed")) ==
          "Error: pipe closed");
}

TEST_CASE("007: tools run through the registry for one caller", "[007][tools]") {
    ServiceFixture fixture;
    ToolRegistry tools;
    tools.Register(std::make_unique<ExecutePythonTool>(fixture.service, "agent-1"));
    tools.Register(std::make_unique<ExecuteBashTool>(fixture.service, "agent-1"));

    CHECK(tools.List() == std::vector<std::string>{"execute_bash", "execute_python"});
    CHECK(tools.Find("execute_python") != nullptr);
    CHECK(tools.Find("exec") == nullptr);

    for (const auto& def : tools.GetDefinitions()) {
        const auto schema = nlohmann::json::parse(def.parameters_json);
        CHECK(schema["type"] == "object");
        CHECK(schema["required"].size() == 1);
        CHECK_FALSE(def.description.empty());
    }

    CHECK(tools.Execute("execute_python", {{"code", "total = 2 + 3"}}) == "(no output)");
    CHECK(tools.Execute("execute_python", {{"code", "print(total)"}}) == "5\n");
    CHECK(Contains(tools.Execute("execute_python", {{"code", "undefined_name"}}), "[stderr]: "));
    CHECK(tools.Execute("execute_bash", {{"command", "echo hi >&2"}}) == "\n[stderr]: hi\n");
    CHECK(tools.Execute("execute_python", {{"code", "import time\ntime.sleep(2)"}, {"timeout", "0.2"}}) ==
          "Error: Timeout after 200ms");

    CHECK(tools.Execute("execute_python", {}) == "Error: missing code");
    CHECK(tools.Execute("execute_bash", {{"command", ""}}) == "Error: missing command");
    CHECK(tools.Execute("nope", {}) == "Error: Tool 'nope' not found");
}

TEST_CASE("007: timeout parameter parsing", "[007][tools]") {
    QuietLogs();
    using agent::tools::ParseTimeoutParam;

    CHECK_FALSE(ParseTimeoutParam({}).has_value());
    CHECK(ParseTimeoutParam({{"timeout", "1.5"}}) == std::optional<std::chrono::milliseconds>(1500ms));
    CHECK_FALSE(ParseTimeoutParam({{"timeout", "0"}}).has_value());
    CHECK_FALSE(ParseTimeoutParam({{"timeout", "later"}}).has_value());
    CHECK_FALSE(ParseTimeoutParam({{"timeout", "inf"}}).has_value());
    CHECK_FALSE(ParseTimeoutParam({{"timeout", "nan"}}).has_value());
    CHECK_FALSE(ParseTimeoutParam({{"timeout", "1e300"}}).has_value());
    CHECK_FALSE(ParseTimeoutParam({{"timeout", "-3"}}).has_value());
    CHECK(ParseTimeoutParam({{"timeout", "86400"}}) == std::optional<std::chrono::milliseconds>(86400000ms));
    CHECK_FALSE(ParseTimeoutParam({{"timeout", "86401"}}).has_value());
}

namespace {

class ThrowingTool : public agent::tools::Tool {
public:
    std::string Name() const override { return "broken"; }
    std::string Description() const override { return "always throws"; }
    std::string ParametersJson() const override {
        return R"({"type":"object","properties":{"path":{"type":"string"}},"required":["path"]})";
    }
    sandbox::ExecutionResult Run(const agent::tools::ToolParams& params,
                                 std::optional<std::chrono::milliseconds> timeout) override {
        last_timeout = timeout;
        throw std::runtime_error("cannot open " + params.at("path"));
    }

    std::optional<std::chrono::milliseconds> last_timeout;
};

class NoSchemaTool : public ThrowingTool {
public:
    std::string Name() const override { return "no_schema"; }
    std::string ParametersJson() const override { return "not json"; }
};

}  // namespace

TEST_CASE("007: registry checks required parameters and reports tool errors", "[007][tools]") {
    QuietLogs();
    ToolRegistry tools;
    auto broken = std::make_unique<ThrowingTool>();
    auto* raw = broken.get();
    tools.Register(std::move(broken));

    CHECK(tools.Execute("broken", {}) == "Error: missing path");
    CHECK(tools.Execute("broken", {{"path", "/x"}, {"timeout", "2"}}) == "Error: cannot open /x");
    CHECK(raw->last_timeout == std::optional<std::chrono::milliseconds>(2000ms));
    CHECK(tools.Execute("broken", {{"path", "/x"}, {"timeout", "inf"}}) == "Error: cannot open /x");
    CHECK_FALSE(raw->last_timeout.has_value());

    CHECK_THROWS_AS(tools.Register(std::make_unique<NoSchemaTool>()), std::invalid_argument);
    CHECK(tools.Find("no_schema") == nullptr);
}

TEST_CASE("007: default sandbox limits still capture output", "[007][service]") {
    QuietLogs();
    TempDir scratch;

    config::Config config{};
    config.sandbox.volume.source = (scratch.Path() / "volume").string();
    REQUIRE(config.sandbox.memory_mb > 0);

    sandbox::LocalPlatform platform(scratch.Path() / "envs");
    SandboxService service(platform, session::MakeRegistryOptions(config));

    const auto code = service.ExecuteCode("agent-1", "import sys\nprint('out')\nprint('err', file=sys.stderr)");
    REQUIRE(code.Completed());
    CHECK(code.success);
    CHECK(code.output == "out\n");
    CHECK(code.error == "err\n");

    const auto shell = service.ExecuteShell("agent-1", "echo hi; echo oops >&2; exit 3");
    REQUIRE(shell.Completed());
    CHECK_FALSE(shell.success);
    CHECK(shell.output == "hi\n");
    CHECK(shell.error == "oops\n");
    CHECK(shell.exit_code == std::optional<int>(3));

    service.ReleaseAll();
}

}  // namespace replbox::test
