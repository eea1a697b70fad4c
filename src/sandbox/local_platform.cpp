#include "sandbox/local_platform.hpp"

#include <boost/process.hpp>
#include <boost/process/extend.hpp>

#include <chrono>
#include <condition_variable>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <functional>
#include <mutex>
#include <random>
#include <set>
#include <thread>
#include <system_error>

#include <fcntl.h>
#include <signal.h>
#include <sys/resource.h>
#include <sys/wait.h>
#include <unistd.h>

#include "utils/common.hpp"
#include "utils/logging.hpp"

namespace replbox::sandbox {
namespace bp = boost::process;
namespace fs = std::filesystem;

namespace {

std::string GenerateId() {
    static const char* kChars = "0123456789abcdef";
    std::random_device rd;
    std::mt19937 gen(rd());
    std::uniform_int_distribution<int> dist(0, 15);
    std::string id;
    id.reserve(8);
    for (int i = 0; i < 8; ++i) {
        id.push_back(kChars[dist(gen)]);
    }
    return id;
}

// Both ends are close-on-exec, so a child spawned concurrently from another
// thread never holds on to them. The child's stdio copies are made with dup2,
// which clears the flag.
bp::pipe MakePipe() {
    int fds[2];
    if (::pipe2(fds, O_CLOEXEC) != 0) {
        throw ProvisioningError(std::string("pipe failed: ") + std::strerror(errno));
    }
    return bp::pipe(fds[0], fds[1]);
}

int DecodeExitStatus(int status) {
    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    if (WIFSIGNALED(status)) {
        return 128 + WTERMSIG(status);
    }
    return -1;
}

// Applied in the child between fork and exec.
struct ResourceLimitSetup : bp::extend::handler {
    ResourceLimits limits;

    explicit ResourceLimitSetup(ResourceLimits value) : limits(value) {}

    template <class Executor>
    void on_exec_setup(Executor&) const {
        if (limits.memory_mb > 0) {
            const auto bytes = static_cast<rlim_t>(limits.memory_mb) * 1024 * 1024;
            struct rlimit limit{bytes, bytes};
            ::setrlimit(RLIMIT_AS, &limit);
        }
        if (limits.cpu_seconds > 0) {
            const auto seconds = static_cast<rlim_t>(limits.cpu_seconds);
            struct rlimit limit{seconds, seconds};
            ::setrlimit(RLIMIT_CPU, &limit);
        }
    }
};

// Calls on_expire once the deadline passes, unless destroyed first.
class Watchdog {
public:
    Watchdog(std::chrono::steady_clock::time_point deadline, std::function<void()> on_expire)
        : on_expire_(std::move(on_expire)) {
        worker_ = std::thread([this, deadline]() {
            std::unique_lock<std::mutex> lock(mutex_);
            if (cv_.wait_until(lock, deadline, [this] { return stopped_; })) {
                return;
            }
            lock.unlock();
            on_expire_();
        });
    }

    ~Watchdog() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            stopped_ = true;
        }
        cv_.notify_all();
        if (worker_.joinable()) {
            worker_.join();
        }
    }

    Watchdog(const Watchdog&) = delete;
    Watchdog& operator=(const Watchdog&) = delete;

private:
    std::function<void()> on_expire_;
    std::mutex mutex_;
    std::condition_variable cv_;
    bool stopped_ = false;
    std::thread worker_;
};

class LocalProcess;

struct EnvironmentState {
    std::string id;
    fs::path working_dir;
    ResourceLimits limits;
    std::mutex mutex;
    bool terminated = false;
    std::set<LocalProcess*> processes;
};

class LocalProcess : public ProcessHandle {
public:
    LocalProcess(const std::vector<std::string>& argv,
                 std::chrono::milliseconds timeout,
                 std::shared_ptr<EnvironmentState> state)
        : state_(std::move(state))
        , stdin_(MakePipe())
        , stdout_(MakePipe())
        , stderr_(MakePipe()) {
        if (argv.empty()) {
            throw ProvisioningError("empty command");
        }
        boost::filesystem::path exe = argv.front();
        if (argv.front().find('/') == std::string::npos) {
            exe = bp::search_path(argv.front());
            if (exe.empty()) {
                throw ProvisioningError("executable not found: " + argv.front());
            }
        }
        const std::vector<std::string> args(argv.begin() + 1, argv.end());

        bp::environment env = boost::this_process::environment();
        env["REPLBOX_ENVIRONMENT_ID"] = state_->id;
        env["REPLBOX_WORKDIR"] = state_->working_dir.string();

        try {
            child_ = bp::child(
                bp::exe = exe,
                bp::args = args,
                env,
                bp::start_dir = state_->working_dir.string(),
                bp::std_in < stdin_,
                bp::std_out > stdout_,
                bp::std_err > stderr_,
                group_,
                ResourceLimitSetup(state_->limits));
        } catch (const bp::process_error& ex) {
            throw ProvisioningError(std::string("spawn failed: ") + ex.what());
        }
        pid_ = child_.id();
        // Reaped through waitpid below; the child object must not wait or kill on its own.
        child_.detach();

        if (timeout.count() > 0) {
            watchdog_ = std::make_unique<Watchdog>(
                std::chrono::steady_clock::now() + timeout,
                [this]() {
                    utils::Log(utils::LogLevel::kDebug, "platform", "process timeout elapsed",
                               {{"pid", std::to_string(pid_)}, {"env", state_->id}});
                    Kill();
                });
        }
    }

    ~LocalProcess() override {
        watchdog_.reset();
        CloseStdin();
        {
            std::lock_guard<std::mutex> lock(state_->mutex);
            state_->processes.erase(this);
        }
        if (!Wait(std::chrono::milliseconds(0)).has_value()) {
            Kill();
            if (!Wait(std::chrono::seconds(5)).has_value()) {
                utils::Log(utils::LogLevel::kWarn, "platform", "process not reaped after kill",
                           {{"pid", std::to_string(pid_)}});
            }
        }
    }

    int Id() const override { return pid_; }
    WriteHandle StdinHandle() override { return static_cast<std::ostream*>(&stdin_); }
    ReadHandle StdoutHandle() override { return static_cast<std::istream*>(&stdout_); }
    ReadHandle StderrHandle() override { return static_cast<std::istream*>(&stderr_); }

    // Closes the pipe without flushing. Bytes still buffered for a reader that
    // is gone are dropped; a flush into a dead reader throws from pipebuf.
    void CloseStdin() override {
        stdin_.pipe().close();
    }

    std::optional<int> Wait(std::chrono::milliseconds timeout) override {
        std::lock_guard<std::mutex> lock(wait_mutex_);
        if (exit_code_.has_value()) {
            return exit_code_;
        }
        const auto deadline = std::chrono::steady_clock::now() + timeout;
        while (true) {
            int status = 0;
            const auto waited = ::waitpid(pid_, &status, WNOHANG);
            if (waited == pid_) {
                exit_code_ = DecodeExitStatus(status);
                return exit_code_;
            }
            if (waited < 0) {
                exit_code_ = -1;
                return exit_code_;
            }
            const auto now = std::chrono::steady_clock::now();
            if (now >= deadline) {
                return std::nullopt;
            }
            std::this_thread::sleep_for(std::min<std::chrono::steady_clock::duration>(
                std::chrono::milliseconds(20), deadline - now));
        }
    }

    void Kill() override {
        std::lock_guard<std::mutex> lock(kill_mutex_);
        if (killed_) {
            return;
        }
        killed_ = true;
        std::error_code ec;
        group_.terminate(ec);
        if (ec) {
            utils::Log(utils::LogLevel::kDebug, "platform", "kill reported an error",
                       {{"pid", std::to_string(pid_)}, {"error", ec.message()}});
        }
    }

    void Register() {
        std::lock_guard<std::mutex> lock(state_->mutex);
        state_->processes.insert(this);
    }

private:
    std::shared_ptr<EnvironmentState> state_;
    bp::opstream stdin_;
    bp::ipstream stdout_;
    bp::ipstream stderr_;
    bp::group group_;
    bp::child child_;
    int pid_ = -1;
    std::mutex wait_mutex_;
    std::optional<int> exit_code_;
    std::mutex kill_mutex_;
    bool killed_ = false;
    std::unique_ptr<Watchdog> watchdog_;
};

class LocalEnvironment : public Environment {
public:
    LocalEnvironment(std::shared_ptr<EnvironmentState> state, std::chrono::seconds lifetime)
        : state_(std::move(state)) {
        if (lifetime.count() > 0) {
            lifetime_watchdog_ = std::make_unique<Watchdog>(
                std::chrono::steady_clock::now() + lifetime,
                [this]() {
                    utils::Log(utils::LogLevel::kInfo, "platform", "environment lifetime elapsed",
                               {{"env", state_->id}});
                    Terminate();
                });
        }
    }

    ~LocalEnvironment() override {
        lifetime_watchdog_.reset();
        Terminate();
    }

    std::string Id() const override { return state_->id; }
    fs::path WorkingDirectory() const override { return state_->working_dir; }

    std::unique_ptr<ProcessHandle> SpawnProcess(
        const std::vector<std::string>& argv,
        std::chrono::milliseconds timeout) override {
        {
            std::lock_guard<std::mutex> lock(state_->mutex);
            if (state_->terminated) {
                throw ProvisioningError("environment " + state_->id + " is terminated");
            }
        }
        auto process = std::make_unique<LocalProcess>(argv, timeout, state_);
        process->Register();
        utils::Log(utils::LogLevel::kDebug, "platform", "spawned",
                   {{"env", state_->id}, {"pid", std::to_string(process->Id())},
                    {"argv0", argv.front()}});
        return process;
    }

    void Terminate() override {
        {
            std::lock_guard<std::mutex> lock(state_->mutex);
            if (state_->terminated) {
                return;
            }
            state_->terminated = true;
            for (auto* process : state_->processes) {
                process->Kill();
            }
        }
        utils::BestEffort("platform", "remove working directory " + state_->working_dir.string(), [this]() {
            fs::remove_all(state_->working_dir);
        });
        utils::Log(utils::LogLevel::kDebug, "platform", "environment terminated", {{"env", state_->id}});
    }

    bool IsTerminated() const override {
        std::lock_guard<std::mutex> lock(state_->mutex);
        return state_->terminated;
    }

private:
    std::shared_ptr<EnvironmentState> state_;
    std::unique_ptr<Watchdog> lifetime_watchdog_;
};

void AttachVolume(const VolumeMount& volume, const fs::path& working_dir) {
    std::error_code ec;
    if (!fs::exists(volume.source, ec)) {
        if (!volume.create_if_missing) {
            throw ProvisioningError("volume " + volume.name + " source does not exist: " + volume.source.string());
        }
        fs::create_directories(volume.source, ec);
        if (ec) {
            throw ProvisioningError("volume " + volume.name + " could not be created: " + ec.message());
        }
    }
    const auto mount_point = working_dir / volume.mount_path;
    fs::create_directories(mount_point.parent_path(), ec);
    fs::create_directory_symlink(fs::absolute(volume.source), mount_point, ec);
    if (ec) {
        throw ProvisioningError("volume " + volume.name + " could not be mounted at " +
                                volume.mount_path + ": " + ec.message());
    }
}

}  // namespace

LocalPlatform::LocalPlatform(std::filesystem::path root_dir)
    : root_dir_(std::move(root_dir)) {
    // Writes to a dead resident must surface as EPIPE, not kill this process.
    std::signal(SIGPIPE, SIG_IGN);
}

std::unique_ptr<Environment> LocalPlatform::ProvisionEnvironment(const EnvironmentSpec& spec) {
    auto state = std::make_shared<EnvironmentState>();
    state->id = "env-" + GenerateId() + "-" + std::to_string(++counter_);
    state->working_dir = root_dir_ / state->id;
    state->limits = spec.limits;

    std::error_code ec;
    fs::create_directories(state->working_dir, ec);
    if (ec) {
        throw ProvisioningError("could not create " + state->working_dir.string() + ": " + ec.message());
    }

    try {
        if (!spec.image.empty()) {
            const auto image = utils::ExpandHome(spec.image);
            if (!fs::is_directory(image, ec)) {
                throw ProvisioningError("image not found: " + spec.image);
            }
            fs::copy(image, state->working_dir, fs::copy_options::recursive, ec);
            if (ec) {
                throw ProvisioningError("image copy failed: " + ec.message());
            }
        }
        for (const auto& volume : spec.volumes) {
            AttachVolume(volume, state->working_dir);
        }
    } catch (const ProvisioningError&) {
        fs::remove_all(state->working_dir, ec);
        throw;
    }

    utils::Log(utils::LogLevel::kInfo, "platform", "environment provisioned",
               {{"env", state->id}, {"label", spec.label},
                {"volumes", std::to_string(spec.volumes.size())},
                {"lifetime", std::to_string(spec.lifetime.count()) + "s"}});
    return std::make_unique<LocalEnvironment>(std::move(state), spec.lifetime);
}

}  // namespace replbox::sandbox
