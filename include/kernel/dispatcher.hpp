// nativebridge kernel: routes requests to module entry points
#pragma once

#include <atomic>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "kernel/envelope.hpp"
#include "kernel/module_registry.hpp"
#include "kernel/security_gate.hpp"
#include "kernel/services/event_channel.hpp"
#include "kernel/stream_executor.hpp"

namespace nb {

// Single entry point used by frontends. Every call resolves the module,
// evaluates its allow-list through the SecurityGate and only then runs
// module code. Failures are returned as envelopes, never thrown.
class NATIVEBRIDGE_API Dispatcher {
public:
    Dispatcher(const ModuleRegistry& registry,
               EventChannel& channel,
               std::shared_ptr<const SecurityGate> gate = nullptr,
               unsigned int stream_workers = 0);
    ~Dispatcher();

    Dispatcher(const Dispatcher&) = delete;
    Dispatcher& operator=(const Dispatcher&) = delete;

    // Blocks until the module returns.
    ResponseEnvelope invoke_sync(const std::string& module_name, const Payload& payload);

    // Returns at once with {"stream_id": n}; the module runs on the stream
    // executor and its messages arrive on the event channel, followed by
    // exactly one end event. An unauthorized call still publishes one error
    // event and the end event for its stream id.
    ResponseEnvelope invoke_streaming(const std::string& module_name, const Payload& payload);

    // Same contract as invoke_sync; the module delegates to another native
    // library through the SymbolCache.
    ResponseEnvelope invoke_external(const std::string& module_name, const Payload& payload);

    ResponseEnvelope invoke(const RequestEnvelope& request);

    // Cooperative: the module learns about it on its next emit. Returns
    // false when the stream is unknown or already finished.
    bool cancel_stream(uint64_t stream_id);
    std::vector<uint64_t> active_streams() const;

    // Blocks until every scheduled stream has published its end event.
    void wait_idle();

private:
    struct StreamState {
        uint64_t id = 0;
        std::shared_ptr<const NativeModule> module;
        std::atomic<bool> cancelled{false};
        Dispatcher* owner = nullptr;
    };

    ResponseEnvelope invoke_blocking(const std::string& module_name, const Payload& payload,
                                     InvokeMode mode);
    // Resolves the module (into `out`, whenever it exists) and checks mode
    // support and authorization. Returns the rejection, if any.
    std::optional<ResponseEnvelope> admit(const std::string& module_name, InvokeMode mode,
                                          std::shared_ptr<const NativeModule>& out) const;
    void run_stream(const std::shared_ptr<StreamState>& state, const std::string& payload_text);
    void publish(const StreamState& state, StreamEvent::Kind kind, const std::string& message);
    void publish_end(uint64_t stream_id, const std::string& module_name);

    static int emit_trampoline(void* ctx, int kind, const char* message);

    const ModuleRegistry& registry_;
    EventChannel& channel_;
    std::shared_ptr<const SecurityGate> gate_;

    std::atomic<uint64_t> next_stream_id_{1};
    mutable std::mutex streams_mutex_;
    std::map<uint64_t, std::shared_ptr<StreamState>> streams_;

    StreamExecutor executor_;
};

} // namespace nb
