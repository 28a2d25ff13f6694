#include "cache/eviction_policy.hpp"
#include <iterator>
#include <stdexcept>

namespace randomfs::cache {

OrderedPolicy::OrderedPolicy(bool refresh_on_access)
  : refresh_on_access_(refresh_on_access) {
}

void OrderedPolicy::record_insert(const std::string& id) {
  // An overwrite counts as a fresh insertion for both orders
  move_to_back(id);
}

void OrderedPolicy::record_access(const std::string& id) {
  if (refresh_on_access_ && positions_.count(id) != 0) {
    move_to_back(id);
  }
}

void OrderedPolicy::record_remove(const std::string& id) {
  auto it = positions_.find(id);
  if (it == positions_.end()) {
    return;
  }
  order_.erase(it->second);
  positions_.erase(it);
}

std::optional<std::string> OrderedPolicy::select_victim() const {
  if (order_.empty()) {
    return std::nullopt;
  }
  return order_.front();
}

void OrderedPolicy::move_to_back(const std::string& id) {
  auto it = positions_.find(id);
  if (it != positions_.end()) {
    order_.splice(order_.end(), order_, it->second);
    return;
  }
  order_.push_back(id);
  positions_.emplace(id, std::prev(order_.end()));
}

std::unique_ptr<EvictionPolicy> make_eviction_policy(EvictionKind kind) {
  switch (kind) {
    case EvictionKind::LRU:  return std::make_unique<LruPolicy>();
    case EvictionKind::FIFO: return std::make_unique<FifoPolicy>();
  }
  throw std::invalid_argument("Eviction policy: unknown kind");
}

EvictionKind eviction_kind_from_string(const std::string& name) {
  if (name == "lru") {
    return EvictionKind::LRU;
  }
  if (name == "fifo") {
    return EvictionKind::FIFO;
  }
  throw std::invalid_argument("Eviction policy: unknown policy '" + name + "'");
}

} // namespace randomfs::cache
