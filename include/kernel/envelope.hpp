// nativebridge kernel: request/response envelopes of the dispatch protocol
#pragma once

#include <string>

#include "nb_types.hpp"

namespace nb {

struct NATIVEBRIDGE_API RequestEnvelope {
    std::string module_name;
    InvokeMode mode = InvokeMode::Sync;
    Payload payload;

    // {"moduleName": ..., "mode": "sync"|"stream"|"external", "payload": ...}
    // Throws BridgeError(InvalidPayload) on a malformed request.
    static RequestEnvelope from_json(const nlohmann::json& j);
};

struct NATIVEBRIDGE_API ResponseEnvelope {
    bool ok = false;
    Payload result;
    BridgeErrc code = BridgeErrc::Unknown;
    std::string error;

    static ResponseEnvelope success(Payload result) {
        ResponseEnvelope r;
        r.ok = true;
        r.result = std::move(result);
        return r;
    }
    static ResponseEnvelope failure(BridgeErrc code, std::string error) {
        ResponseEnvelope r;
        r.code = code;
        r.error = std::move(error);
        return r;
    }

    // {"ok": true, "result": ...} or {"ok": false, "error": ..., "kind": ...}
    nlohmann::json to_json() const;
};

} // namespace nb
