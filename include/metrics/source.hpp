#pragma once

#include "model/cluster_snapshot.hpp"

namespace cluster_dial::metrics {

class MetricsSource {
 public:
  // Never throws for a remote failure; the reason travels in the fetch_error.
  virtual model::fetch_result fetch() = 0;
  virtual ~MetricsSource() = default;
};

}  // namespace cluster_dial::metrics
