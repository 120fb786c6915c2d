#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace dispatcher::db::model {

/*
  Persisted dispatcher_processes row.

  Column types are deliberately wider than the domain fields so that
  out-of-range data written by other tools is still readable and can be
  rejected by the codec instead of being truncated by the driver.
*/

struct ProcessRow {
  std::string uuid;  // 36 char canonical text

  int64_t source_id = 0;  // INT UNSIGNED

  std::string state;  // VARCHAR(15)

  int64_t type = 0;  // TINYINT UNSIGNED

  // epoch ms, TIMESTAMP(3)
  int64_t created_at_ms = 0;

  // NULL until a supervisor claims the process
  std::optional<std::string> supervisor_id;

  bool operator==(const ProcessRow&) const = default;
};

} // namespace dispatcher::db::model
