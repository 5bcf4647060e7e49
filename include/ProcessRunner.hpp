#pragma once
#include <string>
#include <vector>

namespace CapBridge {

// Spawn `program` (looked up in PATH) with `args`, wait for it and report its
// exit code. Output is inherited from the host. Returns false when the
// process cannot be started or terminates without an exit code.
bool runProcess(const std::string &program, const std::vector<std::string> &args, int &outExitCode, std::string *outError);

} // namespace CapBridge
