#pragma once

#include <string>
#include <vector>

namespace agentbench::sandbox {

// Splits on whitespace; a double-quoted segment stays in one token and the
// quotes are dropped. Escapes are not interpreted and an unpaired quote is
// treated as a separator.
std::vector<std::string> SplitCommandLine(const std::string& command);

}  // namespace agentbench::sandbox
