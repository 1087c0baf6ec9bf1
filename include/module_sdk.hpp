// Header-only helpers for module authors.
#pragma once

#include <cstdlib>
#include <cstring>
#include <exception>
#include <string>

#include <nlohmann/json.hpp>

#include "module_api.hpp"

namespace nb::sdk {

// Heap copy that the module's free_string releases.
inline char* dup_string(const std::string& s) {
    char* out = static_cast<char*>(std::malloc(s.size() + 1));
    if (!out) return nullptr;
    std::memcpy(out, s.c_str(), s.size() + 1);
    return out;
}

inline void free_string(char* s) { std::free(s); }

inline char* ok_response(const nlohmann::json& result) {
    nlohmann::json j = {{"ok", true}, {"result", result}};
    return dup_string(j.dump());
}

inline char* error_response(const std::string& message) {
    nlohmann::json j = {{"ok", false}, {"error", message}};
    return dup_string(j.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace));
}

inline nlohmann::json parse_payload(const char* json_payload) {
    if (!json_payload || !*json_payload) return nlohmann::json::object();
    return nlohmann::json::parse(json_payload);
}

// Runs `fn(payload) -> json` and converts anything it throws into an error
// response so no exception crosses the C boundary.
template <typename Fn>
char* guarded_execute(const char* json_payload, Fn&& fn) {
    try {
        return ok_response(fn(parse_payload(json_payload)));
    } catch (const std::exception& e) {
        return error_response(e.what());
    } catch (...) {
        return error_response("unknown exception in module");
    }
}

class Emitter {
public:
    Emitter(nb_emit_fn emit, void* ctx) : emit_(emit), ctx_(ctx) {}

    // Returns false once the host cancelled the stream.
    bool progress(const std::string& message) { return send(NB_EVENT_PROGRESS, message); }
    bool error(const std::string& message) { return send(NB_EVENT_ERROR, message); }
    bool cancelled() const { return cancelled_; }

private:
    bool send(int kind, const std::string& message) {
        if (!emit_ || cancelled_) return false;
        cancelled_ = emit_(ctx_, kind, message.c_str()) != 0;
        return !cancelled_;
    }

    nb_emit_fn emit_;
    void* ctx_;
    bool cancelled_ = false;
};

// Runs `fn(payload, emitter)`; a thrown exception becomes one error event.
// The host publishes the end-of-stream sentinel after this returns.
template <typename Fn>
void guarded_stream(const char* json_payload, nb_emit_fn emit, void* ctx, Fn&& fn) {
    Emitter emitter(emit, ctx);
    try {
        fn(parse_payload(json_payload), emitter);
    } catch (const std::exception& e) {
        emitter.error(e.what());
    } catch (...) {
        emitter.error("unknown exception in module");
    }
}

} // namespace nb::sdk
