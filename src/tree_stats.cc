#include "tree_stats.hh"
#include <iomanip>

namespace btree {

double TreeStats::FillRatio() const {
  if (node_count == 0 || order < 2) {
    return 0.0;
  }
  return static_cast<double>(key_count) /
         static_cast<double>(node_count * (order - 1));
}

std::ostream &operator<<(std::ostream &os, const TreeStats &stats) {
  os << "Tree Statistics:\n"
     << std::dec << "  Order:          " << stats.order << "\n"
     << "  Height:         " << stats.height << "\n"
     << "  Keys:           " << stats.key_count << "\n"
     << "  Nodes:          " << stats.node_count << "\n"
     << "  Leaf nodes:     " << stats.leaf_count << "\n"
     << "  Internal nodes: " << stats.internal_count << "\n"
     << "  Fill ratio:     " << std::fixed << std::setprecision(2)
     << 100. * stats.FillRatio() << "%";
  return os;
}

} // namespace btree
