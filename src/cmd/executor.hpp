#pragma once

#include "cmd/command.hpp"
#include "resp/frame.hpp"
#include "storage/backend.hpp"

namespace respkv::cmd {

// Apply `command` to `backend` and build the reply.  Total: a missing value
// is a Null (or empty Array) reply, never an error.
//
//   Get / HGet      -> value or Null
//   Set / HSet      -> +OK
//   HGetAll         -> Map of field -> value, empty Array if the hash is absent
//   HMGet           -> Array of the values found, empty Array if the hash is absent
//   Echo            -> SimpleString(text)
//   Sadd/Sismember  -> Integer 1 / 0
//   Unrecognized    -> +OK
[[nodiscard]] resp::Frame execute(Command command, storage::Backend& backend);

// The fixed +OK reply.
[[nodiscard]] const resp::Frame& ok_reply();

} // namespace respkv::cmd
