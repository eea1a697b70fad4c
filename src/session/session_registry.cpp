#include "session/session_registry.hpp"

#include "utils/logging.hpp"

namespace replbox::session {

using utils::LogLevel;

SessionRegistry::SessionRegistry(sandbox::Platform& platform, RegistryOptions options)
    : platform_(platform)
    , options_(std::move(options)) {}

SessionRegistry::~SessionRegistry() {
    ReleaseAll();
}

std::shared_ptr<SessionRegistry::Slot> SessionRegistry::SlotFor(const std::string& caller_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& slot = slots_[caller_id];
    if (!slot) {
        slot = std::make_shared<Slot>();
    }
    return slot;
}

void SessionRegistry::DropSlot(const std::string& caller_id, const std::shared_ptr<Slot>& slot) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = slots_.find(caller_id);
    if (it != slots_.end() && it->second == slot) {
        slots_.erase(it);
    }
}

std::shared_ptr<sandbox::Sandbox> SessionRegistry::Acquire(const std::string& caller_id) {
    while (true) {
        auto slot = SlotFor(caller_id);
        std::unique_lock<std::mutex> slot_lock(slot->mutex);
        if (slot->released) {
            // Lost a race with Release; the map already holds a fresh slot or none.
            continue;
        }
        if (slot->sandbox && (slot->sandbox->Expired() || slot->sandbox->IsTerminated())) {
            utils::Log(LogLevel::kInfo, "registry", "environment expired, replacing",
                       {{"caller", caller_id}, {"env", slot->sandbox->ObjectId()}});
            slot->sandbox->Terminate();
            slot->sandbox.reset();
        }
        if (!slot->sandbox) {
            try {
                slot->sandbox = Provision(caller_id);
            } catch (const std::exception&) {
                slot->released = true;
                slot_lock.unlock();
                DropSlot(caller_id, slot);
                throw;
            }
        }
        return slot->sandbox;
    }
}

std::shared_ptr<sandbox::Sandbox> SessionRegistry::Find(const std::string& caller_id) const {
    std::shared_ptr<Slot> slot;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = slots_.find(caller_id);
        if (it == slots_.end()) {
            return nullptr;
        }
        slot = it->second;
    }
    std::lock_guard<std::mutex> slot_lock(slot->mutex);
    return slot->sandbox;
}

bool SessionRegistry::Release(const std::string& caller_id) {
    std::shared_ptr<Slot> slot;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = slots_.find(caller_id);
        if (it == slots_.end()) {
            return false;
        }
        slot = it->second;
        slots_.erase(it);
    }
    std::shared_ptr<sandbox::Sandbox> sandbox;
    {
        std::lock_guard<std::mutex> slot_lock(slot->mutex);
        slot->released = true;
        sandbox = std::move(slot->sandbox);
    }
    if (!sandbox) {
        return false;
    }
    // Holders of the shared pointer see Terminated failures from here on.
    sandbox->Terminate();
    utils::Log(LogLevel::kInfo, "registry", "session released",
               {{"caller", caller_id}, {"env", sandbox->ObjectId()}});
    return true;
}

void SessionRegistry::ReleaseAll() {
    std::vector<std::string> ids;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        ids.reserve(slots_.size());
        for (const auto& entry : slots_) {
            ids.push_back(entry.first);
        }
    }
    for (const auto& id : ids) {
        utils::BestEffort("registry", "release " + id, [this, &id]() { Release(id); });
    }
}

std::vector<SessionInfo> SessionRegistry::ListSessions() const {
    std::vector<std::pair<std::string, std::shared_ptr<Slot>>> snapshot;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        snapshot.assign(slots_.begin(), slots_.end());
    }
    std::vector<SessionInfo> sessions;
    for (const auto& [caller_id, slot] : snapshot) {
        std::shared_ptr<sandbox::Sandbox> sandbox;
        {
            std::lock_guard<std::mutex> slot_lock(slot->mutex);
            sandbox = slot->sandbox;
        }
        if (!sandbox) {
            continue;
        }
        SessionInfo info{};
        info.caller_id = caller_id;
        info.object_id = sandbox->ObjectId();
        info.state = sandbox::ToString(sandbox->Interpreter().State());
        info.restarts = sandbox->Interpreter().RestartCount();
        sessions.push_back(std::move(info));
    }
    return sessions;
}

std::size_t SessionRegistry::Size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return slots_.size();
}

std::shared_ptr<sandbox::Sandbox> SessionRegistry::Provision(const std::string& caller_id) {
    auto spec = options_.environment;
    spec.label = caller_id;

    std::unique_ptr<sandbox::Environment> environment;
    try {
        environment = platform_.ProvisionEnvironment(spec);
    } catch (const sandbox::ProvisioningError& ex) {
        if (spec.volumes.empty()) {
            throw;
        }
        utils::Log(LogLevel::kWarn, "registry", "volume attach failed, provisioning without volumes",
                   {{"caller", caller_id}, {"error", ex.what()}});
        spec.volumes.clear();
        environment = platform_.ProvisionEnvironment(spec);
    }

    std::vector<std::string> search_paths;
    for (const auto& volume : spec.volumes) {
        search_paths.push_back((environment->WorkingDirectory() / volume.mount_path).string());
    }
    auto interpreter = options_.interpreter;
    interpreter.init_code = sandbox::BuildInitSnippet(options_.preload, search_paths);

    utils::Log(LogLevel::kInfo, "registry", "session created",
               {{"caller", caller_id}, {"env", environment->Id()}});
    return std::make_shared<sandbox::Sandbox>(
        caller_id, std::move(environment), std::move(interpreter), options_.shell);
}

}  // namespace replbox::session
