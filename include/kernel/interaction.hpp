// nativebridge kernel: Interaction API between frontends and the Bridge
#pragma once

#include <cstdint>
#include <initializer_list>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "kernel/bridge.hpp"
#include "kernel/envelope.hpp"
#include "kernel/module_result.hpp"
#include "kernel/shared_state.hpp"

namespace nb {

// Minimal interaction facade to decouple frontends from Bridge internals.
class InteractionService {
public:
    explicit InteractionService(Bridge& bridge) : bridge_(bridge) {}

    // Modules
    ModuleLoadResult cmd_load_modules() { return bridge_.load_modules(); }
    ModuleLoadResult cmd_load_modules(const std::vector<std::string>& dirs) { return bridge_.load_modules(dirs); }
    std::vector<std::string> cmd_list_modules() const { return bridge_.modules().names(); }
    // Module name -> absolute library path
    std::map<std::string, std::string> cmd_module_sources() const { return bridge_.modules().sources(); }
    std::optional<std::vector<InvokeMode>> cmd_module_modes(const std::string& name) const {
        auto module = bridge_.modules().find(name);
        if (!module) return std::nullopt;
        std::vector<InvokeMode> modes;
        for (auto m : {InvokeMode::Sync, InvokeMode::Stream, InvokeMode::External})
            if (module->supports(m)) modes.push_back(m);
        return modes;
    }

    // Calls
    ResponseEnvelope cmd_call(const std::string& module, const Payload& payload) {
        return bridge_.dispatcher().invoke_sync(module, payload);
    }
    ResponseEnvelope cmd_call_external(const std::string& module, const Payload& payload) {
        return bridge_.dispatcher().invoke_external(module, payload);
    }
    ResponseEnvelope cmd_start_stream(const std::string& module, const Payload& payload) {
        return bridge_.dispatcher().invoke_streaming(module, payload);
    }
    bool cmd_cancel_stream(uint64_t stream_id) { return bridge_.dispatcher().cancel_stream(stream_id); }
    std::vector<uint64_t> cmd_active_streams() const { return bridge_.dispatcher().active_streams(); }
    void cmd_wait_streams() { bridge_.dispatcher().wait_idle(); }

    // Transport-agnostic dispatch call: request and response as JSON.
    nlohmann::json cmd_dispatch(const nlohmann::json& request) {
        try {
            return bridge_.dispatcher().invoke(RequestEnvelope::from_json(request)).to_json();
        } catch (const BridgeError& e) {
            return ResponseEnvelope::failure(e.code(), e.what()).to_json();
        }
    }

    // Event channel
    int cmd_subscribe(EventChannel::Listener listener) { return bridge_.events().subscribe(std::move(listener)); }
    bool cmd_unsubscribe(int id) { return bridge_.events().unsubscribe(id); }
    const std::string& cmd_channel_name() const { return bridge_.events().name(); }

    // Shared state
    int cmd_access_count() const { return SharedState::instance().access_count(); }

private:
    Bridge& bridge_;
};

} // namespace nb
