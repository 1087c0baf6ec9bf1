// Test module that only a foreign host may call.
#include "module_sdk.hpp"
#include "kernel/shared_state.hpp"

namespace {

const char* const kAllowedHosts[] = {"trusted_host"};

char* restricted_execute(const char* json_payload) {
    return nb::sdk::guarded_execute(json_payload, [](const nlohmann::json&) {
        return nlohmann::json(nb::SharedState::instance().record_access());
    });
}

void restricted_execute_streaming(const char* json_payload, nb_emit_fn emit, void* ctx) {
    nb::sdk::guarded_stream(json_payload, emit, ctx, [](const nlohmann::json&, nb::sdk::Emitter& out) {
        out.progress(nb::SharedState::instance().global_message());
    });
}

char* restricted_execute_external(const char* json_payload) {
    return restricted_execute(json_payload);
}

const NbModuleManifest kManifest = {
    NB_MODULE_ABI_VERSION, kAllowedHosts, 1,
    restricted_execute, restricted_execute_streaming, restricted_execute_external, nb::sdk::free_string,
};

} // namespace

extern "C" NB_MODULE_EXPORT const NbModuleManifest* nb_get_module_manifest() {
    return &kManifest;
}
