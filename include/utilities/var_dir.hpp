#pragma once

#include <string>

namespace cogdedup {

/// Root for runtime state; COGDEDUP_VAR_DIR overrides the default.
void setVarDir(const std::string &dir);
const std::string &getVarDir();

std::string logsDir();
std::string storeSnapshotPath();

} // namespace cogdedup
