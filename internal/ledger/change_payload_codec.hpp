#pragma once

#include <string>

#include "storykb/ledger/v1/change_payload.pb.h"

namespace storykb::ledger {

// Ledger payloads are stored as protobuf JSON so the table stays readable
// from the sqlite shell.
std::string EncodePayload(const storykb::ledger::v1::ChangePayload& payload);

// ValidationError on malformed input.
storykb::ledger::v1::ChangePayload DecodePayload(const std::string& json);

} // namespace storykb::ledger
