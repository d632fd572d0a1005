#pragma once

#include "resp/frame.hpp"

#include <string>

namespace respkv::resp {

// ── Encoder ───────────────────────────────────────────────────────────────────
//
// Renders a Frame into the wire bytes decode() accepts.  Total: every Frame
// encodes.  Map entries are emitted in key order with bulk-string keys, Set
// elements in sorted order, so equal frames always encode to equal bytes.
//
// Thread-safe: pure functions, no shared state.

// Append the encoding of `frame` to `out`.
void encode_to(const Frame& frame, std::string& out);

[[nodiscard]] std::string encode(const Frame& frame);

} // namespace respkv::resp
