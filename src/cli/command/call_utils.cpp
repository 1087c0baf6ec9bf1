// FILE: src/cli/command/call_utils.cpp
#include "cli/command/call_utils.hpp"

#include <iostream>

std::optional<nb::Payload> read_payload(std::istringstream& iss) {
    std::string rest;
    std::getline(iss, rest);
    auto first = rest.find_first_not_of(" \t");
    if (first == std::string::npos) return nb::Payload::object();
    try {
        return nb::Payload::parse(rest.substr(first));
    } catch (const nlohmann::json::parse_error& e) {
        std::cout << "Error: payload is not valid JSON: " << e.what() << "\n";
        return std::nullopt;
    }
}

void print_response(const nb::ResponseEnvelope& response) {
    std::cout << response.to_json().dump(2) << "\n";
}

std::string format_stream_event(const nb::StreamEvent& event) {
    std::string line = "[stream " + std::to_string(event.stream_id) + " | " + event.module + "] ";
    switch (event.kind) {
        case nb::StreamEvent::Progress: return line + event.message;
        case nb::StreamEvent::Error: return line + "Error: " + event.message;
        case nb::StreamEvent::End: return line + "--- finished ---";
    }
    return line + event.message;
}
