// core/registry.hpp - Source registry
#pragma once

#include "handle.hpp"
#include "inventory.hpp"
#include "tree.hpp"
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace fs = std::filesystem;

namespace modulate {

// Owns every loaded source and tracks which ones are active. The active
// list is ordered lowest priority first.
class SourceRegistry {
public:
  SourceHandle add_source(const fs::path &dir);
  SourceHandle add_source(Source source);
  void remove_source(const SourceHandle &handle);

  // Appends to the active list, so the newest activation has top priority.
  void activate(const SourceHandle &handle);
  void deactivate(const SourceHandle &handle);
  // `order` must be a permutation of the active handles.
  void reorder(const std::vector<SourceHandle> &order);

  bool contains(const SourceHandle &handle) const;
  bool is_active(const SourceHandle &handle) const;
  const Source &get(const SourceHandle &handle) const;
  std::optional<fs::path> root_of(const SourceHandle &handle) const;
  std::optional<SourceHandle> find(const std::string &uuid_or_name) const;

  std::vector<SourceTree> active_sources() const;
  const std::vector<SourceHandle> &active_handles() const { return active_; }
  const std::vector<SourceHandle> &inactive_handles() const {
    return inactive_;
  }
  size_t size() const { return active_.size() + inactive_.size(); }

private:
  struct Slot {
    uint32_t generation = 1;
    std::optional<Source> source;
  };

  const Source *lookup(const SourceHandle &handle) const;
  const Source &checked(const SourceHandle &handle) const;

  std::vector<Slot> slots_;
  std::vector<uint32_t> free_slots_;
  std::vector<SourceHandle> active_;
  std::vector<SourceHandle> inactive_;
};

} // namespace modulate
