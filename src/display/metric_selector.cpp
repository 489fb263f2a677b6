#include "display/metric_selector.hpp"

#include <initializer_list>

namespace cluster_dial::display {

const model::metric& worst_metric(const model::cluster_snapshot& snapshot) noexcept {
  const model::metric* worst = &snapshot.cpu;
  for (const model::metric* candidate : {&snapshot.mem, &snapshot.disk}) {
    if (candidate->percent > worst->percent) {
      worst = candidate;
    }
  }
  return *worst;
}

}  // namespace cluster_dial::display
