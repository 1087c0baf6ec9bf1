// nativebridge kernel: SecurityGate implementation
#include "kernel/security_gate.hpp"

#include <algorithm>
#include <system_error>

#ifdef _WIN32
  #include <windows.h>
#elif defined(__APPLE__)
  #include <mach-o/dyld.h>
  #include <climits>
#endif

namespace nb {

std::string normalize_process_name(const std::string& name) {
    std::string out = to_lower(fs::path(name).filename().string());
#ifdef _WIN32
    if (out.size() < 4 || out.compare(out.size() - 4, 4, ".exe") != 0) out += ".exe";
#endif
    return out;
}

SecurityVerdict SecurityGate::verify(const AllowList& allowed_process_names) const noexcept {
    try {
        auto raw = detect_process_name();
        if (!raw || raw->empty()) return {false, kUnknownProcessIdentity};
        std::string current = normalize_process_name(*raw);
        bool allowed = std::any_of(allowed_process_names.begin(), allowed_process_names.end(),
                                   [&](const std::string& name) {
                                       return normalize_process_name(name) == current;
                                   });
        return {allowed, current};
    } catch (const std::exception&) {
        return {false, kUnknownProcessIdentity};
    }
}

std::optional<std::string> ProcessSecurityGate::detect_process_name() const {
#ifdef _WIN32
    char buf[MAX_PATH];
    DWORD n = GetModuleFileNameA(nullptr, buf, MAX_PATH);
    if (n == 0 || n == MAX_PATH) return std::nullopt;
    return std::string(buf, n);
#elif defined(__APPLE__)
    char buf[PATH_MAX];
    uint32_t size = sizeof(buf);
    if (_NSGetExecutablePath(buf, &size) != 0) return std::nullopt;
    return std::string(buf);
#else
    std::error_code ec;
    fs::path exe = fs::read_symlink("/proc/self/exe", ec);
    if (ec) return std::nullopt;
    return exe.string();
#endif
}

SecurityVerdict verify_current_process(const AllowList& allowed_process_names) noexcept {
    ProcessSecurityGate gate;
    return gate.verify(allowed_process_names);
}

} // namespace nb
