#pragma once

#include <array>
#include <chrono>

#include "model/cluster_snapshot.hpp"

namespace cluster_dial::hardware {

// BCM numbering. Defaults match header pins 3, 5, 7, 11 and 13.
struct PinTable {
  unsigned int pointer{2};
  unsigned int cpu{3};
  unsigned int memory{4};
  unsigned int disk{17};
  unsigned int alarm{27};

  [[nodiscard]] unsigned int indicator_pin(const model::indicator role) const noexcept {
    switch (role) {
      case model::indicator::CPU:
        return cpu;
      case model::indicator::MEMORY:
        return memory;
      case model::indicator::DISK:
        return disk;
    }
    return cpu;
  }

  [[nodiscard]] std::array<unsigned int, 3> indicator_pins() const noexcept { return {cpu, memory, disk}; }

  [[nodiscard]] std::array<unsigned int, 5> all_pins() const noexcept { return {pointer, cpu, memory, disk, alarm}; }
};

struct PointerOptions {
  std::chrono::milliseconds settle{1000};
  unsigned int min_pulse_us{500};
  unsigned int max_pulse_us{2500};
};

}  // namespace cluster_dial::hardware
