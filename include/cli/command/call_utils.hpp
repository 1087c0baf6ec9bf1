// FILE: include/cli/command/call_utils.hpp
#pragma once
#include <optional>
#include <sstream>
#include <string>

#include "kernel/envelope.hpp"
#include "kernel/services/event_channel.hpp"

// Reads the remainder of the line as a JSON payload. An empty remainder is
// an empty object. Prints the parse error and returns nullopt on bad input.
std::optional<nb::Payload> read_payload(std::istringstream& iss);

// Prints a response envelope as indented JSON.
void print_response(const nb::ResponseEnvelope& response);

// One line per stream event, e.g. "[stream 3 | sample] Step 1/5".
std::string format_stream_event(const nb::StreamEvent& event);
