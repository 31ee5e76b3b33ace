#include "cogdedup/federation.hpp"
#include "utilities/logger.h"

namespace cogdedup {

Federation::Federation(uint64_t promote_threshold, StoreConfig config)
    : agent_config_(config) {
  agent_config_.promote_threshold = promote_threshold;
  agent_config_.shared_tier = false;

  StoreConfig shared_config = config;
  shared_config.shared_tier = true;
  shared_config.max_warm_chunks = 0;
  shared_ = std::make_shared<ChunkStore>(shared_config);
}

std::shared_ptr<ChunkStore> Federation::agentStore(const std::string &agent_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = agents_.find(agent_id);
  if (it != agents_.end()) {
    return it->second;
  }
  auto store = std::make_shared<ChunkStore>(agent_config_, shared_);
  agents_.emplace(agent_id, store);
  Logger::getInstance().log(LogLevel::DEBUG, "federation",
                            "Created store for agent " + agent_id);
  return store;
}

std::shared_ptr<ChunkStore>
Federation::findAgentStore(const std::string &agent_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = agents_.find(agent_id);
  return it == agents_.end() ? nullptr : it->second;
}

std::vector<std::string> Federation::agentIds() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<std::string> ids;
  ids.reserve(agents_.size());
  for (const auto &[id, store] : agents_) {
    ids.push_back(id);
  }
  return ids;
}

} // namespace cogdedup
