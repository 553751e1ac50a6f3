// SPDX-License-Identifier: Apache-2.0
// proto_json.hpp
// JSON <-> protobuf helpers for HTTP bodies, JWT segments and SSO responses.
#pragma once

#include <google/protobuf/message.h>

#include <string>
#include <string_view>

namespace eden::wire {

// Compact JSON, proto3 json_name keys. Throws std::runtime_error if printing fails.
std::string to_json(const google::protobuf::Message &msg);

// Parses JSON into msg, ignoring unknown fields. Returns false on malformed input.
bool from_json(std::string_view json, google::protobuf::Message &msg);

} // namespace eden::wire
