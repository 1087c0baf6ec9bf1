#pragma once
#include <filesystem>
#include <stdexcept>
#include <string>
#include <nlohmann/json.hpp>

namespace nb {
namespace fs = std::filesystem;

using Payload = nlohmann::json;

#if defined(_WIN32)
    #if defined(NATIVEBRIDGE_LIB_BUILD)
        #define NATIVEBRIDGE_API __declspec(dllexport)
    #else
        #define NATIVEBRIDGE_API __declspec(dllimport)
    #endif
#else // Non-Windows platforms
    #if defined(NATIVEBRIDGE_LIB_BUILD)
        #define NATIVEBRIDGE_API __attribute__((visibility("default")))
    #else
        #define NATIVEBRIDGE_API
    #endif
#endif

enum class BridgeErrc {
    Unknown = 1, NotFound, Unauthorized, ExecutionFailed, Unsupported,
    InvalidPayload, InvalidModule, Io,
    LibraryNotFound, SymbolNotFound, SignatureMismatch,
};

// Stable snake_case name used as the "kind" field on the wire.
NATIVEBRIDGE_API const char* to_string(BridgeErrc code) noexcept;

struct NATIVEBRIDGE_API BridgeError : public std::runtime_error {
    explicit BridgeError(const std::string& what)
        : std::runtime_error(what), code_(BridgeErrc::Unknown) {}
    BridgeError(BridgeErrc code, const std::string& what)
        : std::runtime_error(what), code_(code) {}
    BridgeErrc code() const noexcept { return code_; }
private:
    BridgeErrc code_;
};

enum class InvokeMode { Sync, Stream, External };

NATIVEBRIDGE_API const char* to_string(InvokeMode mode) noexcept;
// Accepts "sync", "stream" and "external" (case-insensitive).
NATIVEBRIDGE_API bool parse_invoke_mode(const std::string& text, InvokeMode& out);

NATIVEBRIDGE_API std::string to_lower(std::string s);

// File extension of loadable native libraries on this platform, dot included.
inline const char* native_library_extension() {
#if defined(_WIN32)
    return ".dll";
#elif defined(__APPLE__)
    return ".dylib";
#else
    return ".so";
#endif
}

} // namespace nb
