#include "utils.hpp"

#include "sandbox/interpreter_session.hpp"

namespace replbox::test {

using sandbox::InterpreterOptions;
using sandbox::InterpreterSession;
using sandbox::SessionState;

namespace {

InterpreterOptions TestInterpreter() {
    InterpreterOptions options{};
    options.default_timeout = 20s;
    options.terminate_grace = 1s;
    options.init_code = sandbox::BuildInitSnippet({{"json", ""}}, {});
    return options;
}

struct SessionFixture {
    SessionFixture() : platform(scratch.Path() / "envs") {
        QuietLogs();
        environment = platform.ProvisionEnvironment(sandbox::EnvironmentSpec{});
    }

    TempDir scratch;
    sandbox::LocalPlatform platform;
    std::unique_ptr<sandbox::Environment> environment;
};

}  // namespace

TEST_CASE("005: session starts lazily and keeps names between calls", "[005][session]") {
    SessionFixture fixture;
    InterpreterSession session(*fixture.environment, TestInterpreter(), "caller-a");
    CHECK(session.State() == SessionState::kAbsent);
    CHECK_FALSE(session.ResidentProcessId().has_value());

    const auto assign = session.Execute("x = 1");
    REQUIRE(assign.Completed());
    CHECK(assign.success);
    CHECK(session.State() == SessionState::kReady);
    CHECK(session.ResidentProcessId().has_value());

    const auto read = session.Execute("print(x)");
    REQUIRE(read.Completed());
    CHECK(read.success);
    CHECK(Contains(read.output, "1"));

    const auto preloaded = session.Execute("print(json.dumps({'a': x}))");
    REQUIRE(preloaded.success);
    CHECK(utils::Trim(preloaded.output) == "{\"a\": 1}");
}

TEST_CASE("005: raised exceptions are completed calls with success false", "[005][session]") {
    SessionFixture fixture;
    InterpreterSession session(*fixture.environment, TestInterpreter());

    const auto result = session.Execute("print('before')\n1 / 0");
    REQUIRE(result.Completed());
    CHECK_FALSE(result.success);
    CHECK(result.output == "before\n");
    CHECK(Contains(result.error, "ZeroDivisionError"));
    CHECK(session.State() == SessionState::kReady);
    CHECK(session.RestartCount() == 0);

    const auto after = session.Execute("print('still alive')");
    CHECK(after.success);
}

TEST_CASE("005: stderr alone does not mean failure", "[005][session]") {
    SessionFixture fixture;
    InterpreterSession session(*fixture.environment, TestInterpreter());

    const auto result = session.Execute("import sys\nprint('note', file=sys.stderr)");
    REQUIRE(result.Completed());
    CHECK(result.success);
    CHECK(result.error == "note\n");
}

TEST_CASE("005: timeout keeps the session usable", "[005][session]") {
    SessionFixture fixture;
    InterpreterSession session(*fixture.environment, TestInterpreter());

    REQUIRE(session.Execute("import time\nmarker = 'kept'").success);
    const auto pid = session.ResidentProcessId();

    const auto slow = session.Execute("time.sleep(1.5)\nlate = True", 300ms);
    CHECK(slow.TimedOut());
    CHECK(slow.message == "Timeout after 300ms");
    CHECK(session.ResidentProcessId() == pid);

    // The late answer to the slow call must not be taken for this one.
    const auto fast = session.Execute("print(marker)", 10s);
    REQUIRE(fast.Completed());
    CHECK(fast.success);
    CHECK(utils::Trim(fast.output) == "kept");
    CHECK(session.RestartCount() == 0);

    const auto late = session.Execute("print(late)");
    CHECK(utils::Trim(late.output) == "True");
}

TEST_CASE("005: restart on timeout when configured", "[005][session]") {
    SessionFixture fixture;
    auto options = TestInterpreter();
    options.restart_on_timeout = true;
    InterpreterSession session(*fixture.environment, options);

    REQUIRE(session.Execute("y = 5").success);
    const auto pid = session.ResidentProcessId();

    CHECK(session.Execute("import time\ntime.sleep(30)", 300ms).TimedOut());
    CHECK_FALSE(session.ResidentProcessId().has_value());

    const auto after = session.Execute("print('y' in globals())");
    REQUIRE(after.success);
    CHECK(utils::Trim(after.output) == "False");
    CHECK(session.ResidentProcessId() != pid);
}

TEST_CASE("005: killed resident is restarted once and state is reset", "[005][session]") {
    SessionFixture fixture;
    InterpreterSession session(*fixture.environment, TestInterpreter());

    REQUIRE(session.Execute("bound = 41").success);
    const auto pid = session.ResidentProcessId();
    REQUIRE(pid.has_value());

    REQUIRE(::kill(*pid, SIGKILL) == 0);
    std::this_thread::sleep_for(200ms);

    const auto result = session.Execute("print('bound' in globals())");
    REQUIRE(result.Completed());
    CHECK(result.success);
    CHECK(utils::Trim(result.output) == "False");
    CHECK(session.RestartCount() == 1);
    CHECK(session.State() == SessionState::kReady);
    CHECK(session.ResidentProcessId() != pid);
}

TEST_CASE("005: code that exits the interpreter surfaces after one retry", "[005][session]") {
    SessionFixture fixture;
    InterpreterSession session(*fixture.environment, TestInterpreter());

    const auto result = session.Execute("import os\nos._exit(0)");
    REQUIRE(result.Failed());
    CHECK(result.failure == sandbox::FailureKind::kTransport);
    CHECK_FALSE(result.message.empty());
    CHECK(session.RestartCount() == 1);

    const auto recovered = session.Execute("print('fresh')");
    CHECK(recovered.success);
}

TEST_CASE("005: stray child output does not corrupt the channel", "[005][session]") {
    SessionFixture fixture;
    InterpreterSession session(*fixture.environment, TestInterpreter());

    const auto result = session.Execute("import os\nos.system('echo {not a record}')\nprint('done')");
    REQUIRE(result.Completed());
    CHECK(result.success);
    CHECK(result.output == "done\n");
    CHECK(session.RestartCount() == 0);
}

TEST_CASE("005: failing init snippet is logged and the session still serves", "[005][session]") {
    SessionFixture fixture;
    auto options = TestInterpreter();
    options.init_code = "raise RuntimeError('init broke')";
    InterpreterSession session(*fixture.environment, options);

    const auto result = session.Execute("print(2 + 2)");
    REQUIRE(result.success);
    CHECK(utils::Trim(result.output) == "4");
}

TEST_CASE("005: missing preload modules are skipped", "[005][session]") {
    SessionFixture fixture;
    auto options = TestInterpreter();
    options.init_code = sandbox::BuildInitSnippet({{"replbox_missing_module", "m"}, {"json", "j"}}, {});
    InterpreterSession session(*fixture.environment, options);

    const auto result = session.Execute("print(j.dumps(1))");
    REQUIRE(result.success);
    CHECK(utils::Trim(result.output) == "1");
}

TEST_CASE("005: missing interpreter is a provisioning failure", "[005][session]") {
    SessionFixture fixture;
    auto options = TestInterpreter();
    options.command = {"replbox-no-such-python"};
    InterpreterSession session(*fixture.environment, options);

    const auto result = session.Execute("1");
    REQUIRE(result.Failed());
    CHECK(result.failure == sandbox::FailureKind::kProvisioning);
    CHECK(session.State() == SessionState::kFailed);
}

TEST_CASE("005: terminate is absorbing", "[005][session]") {
    SessionFixture fixture;
    InterpreterSession session(*fixture.environment, TestInterpreter());

    REQUIRE(session.Execute("z = 3").success);
    session.Terminate();
    CHECK(session.State() == SessionState::kTerminated);
    CHECK_FALSE(session.ResidentProcessId().has_value());

    const auto result = session.Execute("print(z)");
    REQUIRE(result.Failed());
    CHECK(result.failure == sandbox::FailureKind::kTerminated);

    CHECK_NOTHROW(session.Terminate());
    CHECK_THROWS_AS(session.Start(), std::logic_error);
}

TEST_CASE("005: explicit start before first use", "[005][session]") {
    SessionFixture fixture;
    InterpreterSession session(*fixture.environment, TestInterpreter());

    session.Start();
    CHECK(session.State() == SessionState::kReady);
    const auto pid = session.ResidentProcessId();
    session.Start();
    CHECK(session.ResidentProcessId() == pid);
}

}  // namespace replbox::test
