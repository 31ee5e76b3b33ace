#include "utilities/var_dir.hpp"

#include <cstdlib>
#include <filesystem>

namespace cogdedup {

static std::string varDir = [] {
  const char *env = std::getenv("COGDEDUP_VAR_DIR");
  if (env && env[0] != '\0') {
    return std::string(env);
  }
  if (std::filesystem::exists("/var/lib/cogdedup"))
    return std::string("/var/lib/cogdedup");
  return std::string("var/cogdedup");
}();

void setVarDir(const std::string &dir) { varDir = dir; }

const std::string &getVarDir() { return varDir; }

std::string logsDir() { return getVarDir() + "/logs"; }

std::string storeSnapshotPath() { return getVarDir() + "/store.ucst"; }

} // namespace cogdedup
