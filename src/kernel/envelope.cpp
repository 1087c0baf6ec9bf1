#include "kernel/envelope.hpp"

namespace nb {

RequestEnvelope RequestEnvelope::from_json(const nlohmann::json& j) {
    if (!j.is_object()) throw BridgeError(BridgeErrc::InvalidPayload, "Request must be a JSON object");
    auto name = j.find("moduleName");
    if (name == j.end() || !name->is_string()) {
        throw BridgeError(BridgeErrc::InvalidPayload, "Request is missing string field 'moduleName'");
    }
    RequestEnvelope req;
    req.module_name = name->get<std::string>();

    auto mode = j.find("mode");
    if (mode != j.end()) {
        if (!mode->is_string() || !parse_invoke_mode(mode->get<std::string>(), req.mode)) {
            throw BridgeError(BridgeErrc::InvalidPayload,
                              "Field 'mode' must be one of \"sync\", \"stream\", \"external\"");
        }
    }
    auto payload = j.find("payload");
    req.payload = payload != j.end() ? *payload : nlohmann::json::object();
    return req;
}

nlohmann::json ResponseEnvelope::to_json() const {
    if (ok) return {{"ok", true}, {"result", result}};
    return {{"ok", false}, {"error", error}, {"kind", to_string(code)}};
}

} // namespace nb
