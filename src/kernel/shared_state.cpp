#include "kernel/shared_state.hpp"

namespace nb {

SharedState& SharedState::instance() {
    static SharedState state;
    return state;
}

std::string SharedState::global_message() {
    int count = record_access();
    return "This is a shared message from the host bridge. Access count: " + std::to_string(count);
}

} // namespace nb
