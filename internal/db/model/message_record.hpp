#pragma once

#include <cstdint>
#include <string>

namespace unison::db::model {

/*
  One row of a queue table as the store sees it.

  The store never interprets `message`; it is the JSON text of the
  payload object and is handed back byte-for-byte on read.
*/

struct MessageRecord {
  int64_t msg_id = 0;

  // Number of times the row has been leased.
  int32_t read_ct = 0;

  uint64_t enqueued_at_ms = 0;

  // Row is visible to readers once now >= vt_ms.
  uint64_t vt_ms = 0;

  std::string message;
};

} // namespace unison::db::model
