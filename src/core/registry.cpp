// core/registry.cpp - Source registry implementation
#include "registry.hpp"
#include "../utils.hpp"
#include "errors.hpp"
#include <algorithm>
#include <set>

namespace modulate {

const Source *SourceRegistry::lookup(const SourceHandle &handle) const {
  if (!handle.valid() || handle.index >= slots_.size()) {
    return nullptr;
  }
  const Slot &slot = slots_[handle.index];
  if (slot.generation != handle.generation || !slot.source) {
    return nullptr;
  }
  return &*slot.source;
}

const Source &SourceRegistry::checked(const SourceHandle &handle) const {
  const Source *source = lookup(handle);
  if (source == nullptr) {
    throw OverlayError(ErrorKind::InvalidHandle,
                       "unknown source " + to_string(handle));
  }
  return *source;
}

SourceHandle SourceRegistry::add_source(const fs::path &dir) {
  return add_source(load_source(dir));
}

SourceHandle SourceRegistry::add_source(Source source) {
  for (const auto &slot : slots_) {
    if (slot.source && slot.source->metadata.uuid == source.metadata.uuid) {
      throw OverlayError(ErrorKind::DuplicateSource,
                         source.metadata.uuid + " is already registered as " +
                             slot.source->metadata.name);
    }
  }

  SourceHandle handle;
  if (!free_slots_.empty()) {
    handle.index = free_slots_.back();
    free_slots_.pop_back();
  } else {
    handle.index = static_cast<uint32_t>(slots_.size());
    slots_.emplace_back();
  }

  Slot &slot = slots_[handle.index];
  handle.generation = slot.generation;
  std::string name = source.metadata.name;
  slot.source = std::move(source);
  inactive_.push_back(handle);

  LOG_INFO("Added source: " + name + " " + to_string(handle));
  return handle;
}

void SourceRegistry::remove_source(const SourceHandle &handle) {
  std::string name = checked(handle).metadata.name;
  if (is_active(handle)) {
    throw OverlayError(ErrorKind::SourceActive,
                       name + " must be deactivated before removal");
  }

  Slot &slot = slots_[handle.index];
  slot.source.reset();
  if (++slot.generation == 0) {
    slot.generation = 1;
  }
  free_slots_.push_back(handle.index);
  inactive_.erase(std::remove(inactive_.begin(), inactive_.end(), handle),
                  inactive_.end());

  LOG_INFO("Removed source: " + name);
}

void SourceRegistry::activate(const SourceHandle &handle) {
  const Source &source = checked(handle);
  if (is_active(handle)) {
    throw OverlayError(ErrorKind::InvalidHandle,
                       source.metadata.name + " is already active");
  }
  inactive_.erase(std::remove(inactive_.begin(), inactive_.end(), handle),
                  inactive_.end());
  active_.push_back(handle);
  LOG_INFO("Activated source: " + source.metadata.name);
}

void SourceRegistry::deactivate(const SourceHandle &handle) {
  const Source &source = checked(handle);
  if (!is_active(handle)) {
    throw OverlayError(ErrorKind::InvalidHandle,
                       source.metadata.name + " is not active");
  }
  active_.erase(std::remove(active_.begin(), active_.end(), handle),
                active_.end());
  inactive_.push_back(handle);
  LOG_INFO("Deactivated source: " + source.metadata.name);
}

void SourceRegistry::reorder(const std::vector<SourceHandle> &order) {
  std::set<SourceHandle> wanted(order.begin(), order.end());
  std::set<SourceHandle> current(active_.begin(), active_.end());
  if (order.size() != active_.size() || wanted != current) {
    std::string listed;
    for (const auto &h : order) {
      listed += (listed.empty() ? "" : " ") + to_string(h);
    }
    throw OverlayError(ErrorKind::InvalidOrder,
                       "[" + listed + "] is not a permutation of the " +
                           std::to_string(active_.size()) + " active sources");
  }
  active_ = order;
  LOG_INFO("Reordered " + std::to_string(order.size()) + " active sources");
}

bool SourceRegistry::contains(const SourceHandle &handle) const {
  return lookup(handle) != nullptr;
}

bool SourceRegistry::is_active(const SourceHandle &handle) const {
  return std::find(active_.begin(), active_.end(), handle) != active_.end();
}

const Source &SourceRegistry::get(const SourceHandle &handle) const {
  return checked(handle);
}

std::optional<fs::path>
SourceRegistry::root_of(const SourceHandle &handle) const {
  const Source *source = lookup(handle);
  if (source == nullptr) {
    return std::nullopt;
  }
  return source->root;
}

std::optional<SourceHandle>
SourceRegistry::find(const std::string &uuid_or_name) const {
  std::string key = to_lower(uuid_or_name);
  std::optional<SourceHandle> by_name;

  for (uint32_t i = 0; i < slots_.size(); ++i) {
    const Slot &slot = slots_[i];
    if (!slot.source) {
      continue;
    }
    SourceHandle handle{i, slot.generation};
    if (slot.source->metadata.uuid == key) {
      return handle;
    }
    if (!by_name && slot.source->metadata.name == uuid_or_name) {
      by_name = handle;
    }
  }
  return by_name;
}

std::vector<SourceTree> SourceRegistry::active_sources() const {
  std::vector<SourceTree> result;
  for (const auto &handle : active_) {
    result.emplace_back(handle, &checked(handle).tree);
  }
  return result;
}

} // namespace modulate
