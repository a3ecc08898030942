// core/handle.hpp - Source handles
#pragma once

#include <cstdint>
#include <string>

namespace modulate {

// Generation-checked key into the source registry. A default-constructed
// handle is invalid and never equal to a live one.
struct SourceHandle {
  uint32_t index = 0;
  uint32_t generation = 0;

  bool valid() const { return generation != 0; }

  bool operator==(const SourceHandle &other) const {
    return index == other.index && generation == other.generation;
  }
  bool operator!=(const SourceHandle &other) const { return !(*this == other); }
  bool operator<(const SourceHandle &other) const {
    return index != other.index ? index < other.index
                                : generation < other.generation;
  }
};

inline std::string to_string(const SourceHandle &handle) {
  if (!handle.valid()) {
    return "#invalid";
  }
  return "#" + std::to_string(handle.index) + "v" +
         std::to_string(handle.generation);
}

} // namespace modulate
