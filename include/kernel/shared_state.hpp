// nativebridge kernel: process-wide state shared by all modules
#pragma once

#include <atomic>
#include <string>

#include "nb_types.hpp"

namespace nb {

class NATIVEBRIDGE_API SharedState {
public:
    static SharedState& instance();

    // Increments the access counter and returns the new value.
    int record_access() { return access_counter_.fetch_add(1) + 1; }
    int access_count() const { return access_counter_.load(); }

    // Records an access and returns a message carrying the new count.
    std::string global_message();

private:
    std::atomic<int> access_counter_{0};
};

} // namespace nb
