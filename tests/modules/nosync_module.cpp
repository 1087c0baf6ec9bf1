// Test module without the mandatory execute entry point.
#include "module_sdk.hpp"

namespace {

const char* const kAllowedHosts[] = {"nativebridge_tests"};

void nosync_execute_streaming(const char* json_payload, nb_emit_fn emit, void* ctx) {
    nb::sdk::guarded_stream(json_payload, emit, ctx, [](const nlohmann::json&, nb::sdk::Emitter& out) {
        out.progress("unreachable");
    });
}

const NbModuleManifest kManifest = {
    NB_MODULE_ABI_VERSION, kAllowedHosts, 1,
    nullptr, nosync_execute_streaming, nullptr, nb::sdk::free_string,
};

} // namespace

extern "C" NB_MODULE_EXPORT const NbModuleManifest* nb_get_module_manifest() {
    return &kManifest;
}
