#pragma once

#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "sandbox/command_runner.hpp"
#include "sandbox/control_protocol.hpp"
#include "sandbox/interpreter_session.hpp"
#include "sandbox/platform.hpp"
#include "sandbox/sandbox.hpp"

namespace replbox::session {

struct RegistryOptions {
    sandbox::EnvironmentSpec environment;
    sandbox::InterpreterOptions interpreter;
    std::vector<sandbox::PreloadModule> preload;
    sandbox::CommandOptions shell;
};

struct SessionInfo {
    std::string caller_id;
    std::string object_id;
    std::string state;
    int restarts = 0;
};

// Caller id -> sandbox. Calls for different ids never wait on each other;
// calls for the same id are serialized on that id's slot.
class SessionRegistry {
public:
    SessionRegistry(sandbox::Platform& platform, RegistryOptions options);
    ~SessionRegistry();

    SessionRegistry(const SessionRegistry&) = delete;
    SessionRegistry& operator=(const SessionRegistry&) = delete;

    // Returns the caller's sandbox, provisioning one on first use or when
    // the previous environment expired. Throws sandbox::ProvisioningError.
    std::shared_ptr<sandbox::Sandbox> Acquire(const std::string& caller_id);
    std::shared_ptr<sandbox::Sandbox> Find(const std::string& caller_id) const;

    // Idempotent. Returns true when a live sandbox was torn down.
    bool Release(const std::string& caller_id);
    void ReleaseAll();

    std::vector<SessionInfo> ListSessions() const;
    std::size_t Size() const;

private:
    struct Slot {
        std::mutex mutex;
        std::shared_ptr<sandbox::Sandbox> sandbox;
        bool released = false;
    };

    std::shared_ptr<Slot> SlotFor(const std::string& caller_id);
    void DropSlot(const std::string& caller_id, const std::shared_ptr<Slot>& slot);
    std::shared_ptr<sandbox::Sandbox> Provision(const std::string& caller_id);

    sandbox::Platform& platform_;
    RegistryOptions options_;
    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::shared_ptr<Slot>> slots_;
};

}  // namespace replbox::session
