#include <chrono>
#include <cstdint>
#include <limits>
#include <stdexcept>
#include <string>
#include <thread>
#include <utility>

#include "module_sdk.hpp"
#include "kernel/shared_state.hpp"
#include "kernel/symbol_cache.hpp"

namespace {

const char* const kAllowedHosts[] = {"addin_host", "nativebridge_tests"};

int32_t require_int(const nlohmann::json& payload, const char* key) {
    if (!payload.is_object() || !payload.contains(key) || !payload[key].is_number_integer()) {
        throw std::invalid_argument(std::string("payload requires integer field '") + key + "'");
    }
    const auto& value = payload[key];
    const bool in_range = value.is_number_unsigned()
        ? value.get<uint64_t>() <= static_cast<uint64_t>(std::numeric_limits<int32_t>::max())
        : value.get<int64_t>() >= std::numeric_limits<int32_t>::min() &&
          value.get<int64_t>() <= std::numeric_limits<int32_t>::max();
    if (!in_range) {
        throw std::out_of_range(std::string("field '") + key + "' is outside the 32-bit integer range");
    }
    return static_cast<int32_t>(value.get<int64_t>());
}

// Both operands, rejected when their sum does not fit in 32 bits.
std::pair<int32_t, int32_t> require_operands(const nlohmann::json& payload) {
    const int32_t a = require_int(payload, "a");
    const int32_t b = require_int(payload, "b");
    const int64_t sum = static_cast<int64_t>(a) + b;
    if (sum < std::numeric_limits<int32_t>::min() || sum > std::numeric_limits<int32_t>::max()) {
        throw std::overflow_error("sum of 'a' and 'b' overflows a 32-bit integer");
    }
    return {a, b};
}

char* sample_execute(const char* json_payload) {
    return nb::sdk::guarded_execute(json_payload, [](const nlohmann::json& payload) {
        nb::SharedState::instance().record_access();
        auto [a, b] = require_operands(payload);
        return nlohmann::json(a + b);
    });
}

void sample_execute_streaming(const char* json_payload, nb_emit_fn emit, void* ctx) {
    nb::sdk::guarded_stream(json_payload, emit, ctx, [](const nlohmann::json& payload, nb::sdk::Emitter& out) {
        const int steps = payload.value("steps", 5);
        const int delay_ms = payload.value("delay_ms", 100);
        if (!out.progress("Starting: " + nb::SharedState::instance().global_message())) return;
        for (int i = 1; i <= steps; ++i) {
            std::this_thread::sleep_for(std::chrono::milliseconds(delay_ms));
            if (!out.progress("Step " + std::to_string(i) + "/" + std::to_string(steps))) return;
        }
        out.progress("Done.");
    });
}

char* sample_execute_external(const char* json_payload) {
    return nb::sdk::guarded_execute(json_payload, [](const nlohmann::json& payload) {
        nb::SharedState::instance().record_access();
        auto [a, b] = require_operands(payload);
        auto calc = nb::SymbolCache::instance().resolve<int32_t(int32_t, int32_t)>(
            "external_utility", "perform_calculation");
        return nlohmann::json(calc(a, b));
    });
}

const NbModuleManifest kManifest = {
    NB_MODULE_ABI_VERSION,
    kAllowedHosts,
    sizeof(kAllowedHosts) / sizeof(kAllowedHosts[0]),
    sample_execute,
    sample_execute_streaming,
    sample_execute_external,
    nb::sdk::free_string,
};

} // namespace

extern "C" NB_MODULE_EXPORT const NbModuleManifest* nb_get_module_manifest() {
    return &kManifest;
}
