#ifndef RANDOMFS_EVICTION_POLICY_HPP
#define RANDOMFS_EVICTION_POLICY_HPP

#include <list>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>

namespace randomfs::cache {

enum class EvictionKind {
  LRU,
  FIFO
};

// Decides which cached block goes first. Not thread-safe: the owning cache
// calls it under its own lock.
class EvictionPolicy {
public:
  virtual ~EvictionPolicy() = default;

  // New id, or an existing id being overwritten
  virtual void record_insert(const std::string& id) = 0;
  // Cache hit on id
  virtual void record_access(const std::string& id) = 0;
  virtual void record_remove(const std::string& id) = 0;
  // Next id to evict, or nullopt when nothing is tracked
  virtual std::optional<std::string> select_victim() const = 0;
  virtual const char* name() const = 0;
};

// Keeps ids in a list, oldest at the front
class OrderedPolicy : public EvictionPolicy {
public:
  explicit OrderedPolicy(bool refresh_on_access);

  void record_insert(const std::string& id) override;
  void record_access(const std::string& id) override;
  void record_remove(const std::string& id) override;
  std::optional<std::string> select_victim() const override;

protected:
  void move_to_back(const std::string& id);

private:
  bool refresh_on_access_;
  std::list<std::string> order_;
  std::unordered_map<std::string, std::list<std::string>::iterator> positions_;
};

// Least recently used first; hits refresh recency
class LruPolicy : public OrderedPolicy {
public:
  LruPolicy() : OrderedPolicy(true) {}
  const char* name() const override { return "lru"; }
};

// Insertion order; hits do not matter
class FifoPolicy : public OrderedPolicy {
public:
  FifoPolicy() : OrderedPolicy(false) {}
  const char* name() const override { return "fifo"; }
};

std::unique_ptr<EvictionPolicy> make_eviction_policy(EvictionKind kind);

// Parses "lru" / "fifo"; throws std::invalid_argument otherwise
EvictionKind eviction_kind_from_string(const std::string& name);

} // namespace randomfs::cache

#endif // RANDOMFS_EVICTION_POLICY_HPP
