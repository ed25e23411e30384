#pragma once

#include <string>
#include <vector>
#include "protocol/change_contract.hpp"

namespace hive::runtime {

// Extracts proposed file changes from model output. Recognised forms, tried
// in this order:
//   ```json {"files": [{"path", "content", "type"}]} ```
//   ```lang:path/to/file  (or a "File: path" / "### Create: path" line
//   directly above a fence)
//   "### Delete: path" with no block
// Changes default to `modify`; a later change to the same path wins.
std::vector<protocol::FileChange> parse_file_changes(const std::string& output);

}  // namespace hive::runtime
