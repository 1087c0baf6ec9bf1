// nativebridge kernel: host process identity check
#pragma once

#include <optional>
#include <string>
#include <vector>

#include "nb_types.hpp"

namespace nb {

using AllowList = std::vector<std::string>;

struct SecurityVerdict {
    bool verified = false;
    std::string detected_process;
};

// Identity reported when the executable name cannot be determined.
inline constexpr const char* kUnknownProcessIdentity = "unknown";

// Lowercases, strips directories and appends ".exe" on Windows.
NATIVEBRIDGE_API std::string normalize_process_name(const std::string& name);

// Evaluates a module's allow-list against the identity of the current
// process. Computed fresh on every call. Never throws.
class NATIVEBRIDGE_API SecurityGate {
public:
    virtual ~SecurityGate() = default;
    virtual SecurityVerdict verify(const AllowList& allowed_process_names) const noexcept;

protected:
    // Raw executable name, or nullopt when it cannot be determined.
    virtual std::optional<std::string> detect_process_name() const = 0;
};

class NATIVEBRIDGE_API ProcessSecurityGate : public SecurityGate {
protected:
    std::optional<std::string> detect_process_name() const override;
};

// Convenience wrapper around a ProcessSecurityGate, usable from modules.
NATIVEBRIDGE_API SecurityVerdict verify_current_process(const AllowList& allowed_process_names) noexcept;

} // namespace nb
