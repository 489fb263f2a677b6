#pragma once

#include "model/cluster_snapshot.hpp"

namespace cluster_dial::display {

// Highest percent wins; ties go to the earlier of cpu, mem, disk.
[[nodiscard]] const model::metric& worst_metric(const model::cluster_snapshot& snapshot) noexcept;

}  // namespace cluster_dial::display
