// nativebridge kernel: Dispatcher implementation
#include "kernel/dispatcher.hpp"

#include <cstring>

namespace nb {

namespace {

// Module wire format: {"ok":true,"result":...} or {"ok":false,"error":"..."}.
ResponseEnvelope decode_module_response(const std::string& module_name, const std::string& text) {
    nlohmann::json j = nlohmann::json::parse(text, nullptr, /*allow_exceptions*/ false);
    if (j.is_discarded() || !j.is_object() || !j.contains("ok") || !j["ok"].is_boolean()) {
        return ResponseEnvelope::failure(BridgeErrc::ExecutionFailed,
                                         "Module '" + module_name + "' returned a malformed response");
    }
    if (j["ok"].get<bool>()) {
        return ResponseEnvelope::success(j.contains("result") ? j["result"] : nlohmann::json());
    }
    std::string error = "Module '" + module_name + "' reported a failure";
    if (j.contains("error") && j["error"].is_string()) error = j["error"].get<std::string>();
    return ResponseEnvelope::failure(BridgeErrc::ExecutionFailed, error);
}

bool serialize_payload(const Payload& payload, std::string& out, std::string& error) {
    try {
        out = payload.dump();
        return true;
    } catch (const nlohmann::json::exception& e) {
        error = std::string("Payload cannot be serialized: ") + e.what();
        return false;
    }
}

} // namespace

Dispatcher::Dispatcher(const ModuleRegistry& registry,
                       EventChannel& channel,
                       std::shared_ptr<const SecurityGate> gate,
                       unsigned int stream_workers)
    : registry_(registry),
      channel_(channel),
      gate_(gate ? std::move(gate) : std::make_shared<ProcessSecurityGate>()),
      executor_(stream_workers) {
    executor_.start();
}

Dispatcher::~Dispatcher() {
    {
        std::lock_guard<std::mutex> lock(streams_mutex_);
        for (auto& kv : streams_) kv.second->cancelled = true;
    }
    executor_.stop();
}

std::optional<ResponseEnvelope> Dispatcher::admit(const std::string& module_name, InvokeMode mode,
                                                  std::shared_ptr<const NativeModule>& out) const {
    out = registry_.find(module_name);
    if (!out) {
        return ResponseEnvelope::failure(BridgeErrc::NotFound,
                                         "Native module '" + module_name + "' not found.");
    }
    SecurityVerdict verdict = gate_->verify(out->allowed_hosts);
    if (!verdict.verified) {
        return ResponseEnvelope::failure(BridgeErrc::Unauthorized,
                                         "Host process '" + verdict.detected_process +
                                         "' is not authorized to call module '" + out->name + "'.");
    }
    if (!out->supports(mode)) {
        return ResponseEnvelope::failure(BridgeErrc::Unsupported,
                                         "Native module '" + out->name + "' does not implement " +
                                         to_string(mode) + " mode.");
    }
    return std::nullopt;
}

ResponseEnvelope Dispatcher::invoke_sync(const std::string& module_name, const Payload& payload) {
    return invoke_blocking(module_name, payload, InvokeMode::Sync);
}

ResponseEnvelope Dispatcher::invoke_external(const std::string& module_name, const Payload& payload) {
    return invoke_blocking(module_name, payload, InvokeMode::External);
}

ResponseEnvelope Dispatcher::invoke_blocking(const std::string& module_name, const Payload& payload,
                                             InvokeMode mode) {
    std::shared_ptr<const NativeModule> module;
    if (auto rejected = admit(module_name, mode, module)) return *rejected;

    std::string text, error;
    if (!serialize_payload(payload, text, error)) {
        return ResponseEnvelope::failure(BridgeErrc::InvalidPayload, error);
    }

    char* raw = nullptr;
    try {
        raw = mode == InvokeMode::External ? module->execute_external(text.c_str())
                                           : module->execute(text.c_str());
    } catch (const std::exception& e) {
        return ResponseEnvelope::failure(BridgeErrc::ExecutionFailed,
                                         "Module '" + module->name + "' raised: " + e.what());
    } catch (...) {
        return ResponseEnvelope::failure(BridgeErrc::ExecutionFailed,
                                         "Module '" + module->name + "' raised an unknown exception.");
    }
    if (!raw) {
        return ResponseEnvelope::failure(BridgeErrc::ExecutionFailed,
                                         "Module '" + module->name + "' returned a null pointer.");
    }
    std::string out(raw);
    module->free_string(raw);
    return decode_module_response(module->name, out);
}

ResponseEnvelope Dispatcher::invoke_streaming(const std::string& module_name, const Payload& payload) {
    std::shared_ptr<const NativeModule> module;
    if (auto rejected = admit(module_name, InvokeMode::Stream, module)) {
        if (rejected->code == BridgeErrc::Unauthorized) {
            // Listeners waiting on this module still observe a terminated stream.
            const uint64_t id = next_stream_id_.fetch_add(1);
            StreamEvent ev;
            ev.stream_id = id;
            ev.module = module->name;
            ev.kind = StreamEvent::Error;
            ev.message = rejected->error;
            channel_.publish(ev);
            publish_end(id, module->name);
            rejected->result = {{"stream_id", id}};
        }
        return *rejected;
    }

    std::string text, error;
    if (!serialize_payload(payload, text, error)) {
        return ResponseEnvelope::failure(BridgeErrc::InvalidPayload, error);
    }

    auto state = std::make_shared<StreamState>();
    state->id = next_stream_id_.fetch_add(1);
    state->module = module;
    state->owner = this;
    {
        std::lock_guard<std::mutex> lock(streams_mutex_);
        streams_[state->id] = state;
    }
    executor_.post([this, state, text] { run_stream(state, text); });
    return ResponseEnvelope::success({{"stream_id", state->id}});
}

ResponseEnvelope Dispatcher::invoke(const RequestEnvelope& request) {
    switch (request.mode) {
        case InvokeMode::Sync: return invoke_sync(request.module_name, request.payload);
        case InvokeMode::Stream: return invoke_streaming(request.module_name, request.payload);
        case InvokeMode::External: return invoke_external(request.module_name, request.payload);
    }
    return ResponseEnvelope::failure(BridgeErrc::InvalidPayload, "Unknown interaction mode");
}

void Dispatcher::run_stream(const std::shared_ptr<StreamState>& state, const std::string& payload_text) {
    const auto& module = *state->module;
    // Retires the stream and publishes its end event on every exit path.
    struct EndGuard {
        Dispatcher& self;
        const StreamState& state;
        ~EndGuard() {
            {
                std::lock_guard<std::mutex> lock(self.streams_mutex_);
                self.streams_.erase(state.id);
            }
            try {
                self.publish_end(state.id, state.module->name);
            } catch (const std::exception&) {
                // Listener failures are contained by the channel; only allocation can get here.
            }
        }
    } end_guard{*this, *state};

    try {
        module.execute_streaming(payload_text.c_str(), &Dispatcher::emit_trampoline, state.get());
    } catch (const std::exception& e) {
        publish(*state, StreamEvent::Error, "Module '" + module.name + "' raised: " + e.what());
    } catch (...) {
        publish(*state, StreamEvent::Error, "Module '" + module.name + "' raised an unknown exception.");
    }
    if (state->cancelled) publish(*state, StreamEvent::Error, "Stream cancelled.");
}

int Dispatcher::emit_trampoline(void* ctx, int kind, const char* message) {
    auto* state = static_cast<StreamState*>(ctx);
    if (!state || state->cancelled) return 1;
    if (!message) return 0;
    // The host owns termination; a module-sent sentinel is dropped.
    if (std::strcmp(message, kStreamEndSentinel) == 0) return 0;
    try {
        state->owner->publish(*state, kind == NB_EVENT_ERROR ? StreamEvent::Error : StreamEvent::Progress,
                              message);
    } catch (const std::exception&) {
        // Never unwind into module code.
    }
    return state->cancelled ? 1 : 0;
}

void Dispatcher::publish(const StreamState& state, StreamEvent::Kind kind, const std::string& message) {
    StreamEvent ev;
    ev.stream_id = state.id;
    ev.module = state.module->name;
    ev.kind = kind;
    ev.message = message;
    channel_.publish(ev);
}

void Dispatcher::publish_end(uint64_t stream_id, const std::string& module_name) {
    StreamEvent ev;
    ev.stream_id = stream_id;
    ev.module = module_name;
    ev.kind = StreamEvent::End;
    ev.message = kStreamEndSentinel;
    channel_.publish(ev);
}

bool Dispatcher::cancel_stream(uint64_t stream_id) {
    std::lock_guard<std::mutex> lock(streams_mutex_);
    auto it = streams_.find(stream_id);
    if (it == streams_.end()) return false;
    it->second->cancelled = true;
    return true;
}

std::vector<uint64_t> Dispatcher::active_streams() const {
    std::lock_guard<std::mutex> lock(streams_mutex_);
    std::vector<uint64_t> ids;
    ids.reserve(streams_.size());
    for (const auto& kv : streams_) ids.push_back(kv.first);
    return ids;
}

void Dispatcher::wait_idle() {
    executor_.wait_idle();
}

} // namespace nb
