#ifndef COGDEDUP_FEDERATION_HPP
#define COGDEDUP_FEDERATION_HPP

#include "cogdedup/chunk_store.hpp"

#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace cogdedup {

/**
 * @brief One shared tier plus a private store per agent.
 *
 * Agent stores see each other's chunks only after promotion into the
 * shared tier.
 */
class Federation {
public:
  explicit Federation(uint64_t promote_threshold = 5,
                      StoreConfig config = StoreConfig{});

  /// Create the store for @p agent_id on first use; later calls return it.
  std::shared_ptr<ChunkStore> agentStore(const std::string &agent_id);

  /// nullptr if @p agent_id has no store yet.
  std::shared_ptr<ChunkStore> findAgentStore(const std::string &agent_id) const;

  std::shared_ptr<ChunkStore> sharedStore() const { return shared_; }

  std::vector<std::string> agentIds() const;

private:
  StoreConfig agent_config_;
  std::shared_ptr<ChunkStore> shared_;
  mutable std::mutex mutex_;
  std::map<std::string, std::shared_ptr<ChunkStore>> agents_;
};

} // namespace cogdedup

#endif // COGDEDUP_FEDERATION_HPP
