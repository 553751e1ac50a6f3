// SPDX-License-Identifier: Apache-2.0
#include "server/wire/proto_json.hpp"

#include <google/protobuf/util/json_util.h>

#include <stdexcept>

namespace eden::wire {

std::string to_json(const google::protobuf::Message &msg)
{
    google::protobuf::util::JsonPrintOptions opts;
    opts.add_whitespace = false;
    std::string out;
    auto st = google::protobuf::util::MessageToJsonString(msg, &out, opts);
    if (!st.ok())
        throw std::runtime_error("json print failed for " + msg.GetTypeName() + ": " + st.ToString());
    return out;
}

bool from_json(std::string_view json, google::protobuf::Message &msg)
{
    google::protobuf::util::JsonParseOptions opts;
    opts.ignore_unknown_fields = true;
    auto st = google::protobuf::util::JsonStringToMessage(std::string(json), &msg, opts);
    return st.ok();
}

} // namespace eden::wire
