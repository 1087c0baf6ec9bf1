#include "nb_types.hpp"

#include <algorithm>
#include <cctype>

namespace nb {

const char* to_string(BridgeErrc code) noexcept {
    switch (code) {
        case BridgeErrc::NotFound: return "not_found";
        case BridgeErrc::Unauthorized: return "unauthorized";
        case BridgeErrc::ExecutionFailed: return "execution_failed";
        case BridgeErrc::Unsupported: return "unsupported";
        case BridgeErrc::InvalidPayload: return "invalid_payload";
        case BridgeErrc::InvalidModule: return "invalid_module";
        case BridgeErrc::Io: return "io";
        case BridgeErrc::LibraryNotFound: return "library_not_found";
        case BridgeErrc::SymbolNotFound: return "symbol_not_found";
        case BridgeErrc::SignatureMismatch: return "signature_mismatch";
        case BridgeErrc::Unknown: break;
    }
    return "unknown";
}

const char* to_string(InvokeMode mode) noexcept {
    switch (mode) {
        case InvokeMode::Sync: return "sync";
        case InvokeMode::Stream: return "stream";
        case InvokeMode::External: return "external";
    }
    return "sync";
}

bool parse_invoke_mode(const std::string& text, InvokeMode& out) {
    const std::string m = to_lower(text);
    if (m == "sync") { out = InvokeMode::Sync; return true; }
    if (m == "stream") { out = InvokeMode::Stream; return true; }
    if (m == "external") { out = InvokeMode::External; return true; }
    return false;
}

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

} // namespace nb
