#ifndef __BTREE_TREE_STATS_HH__
#define __BTREE_TREE_STATS_HH__

#include "node.hh"
#include <cstddef>
#include <ostream>

namespace btree {

// Shape summary of a tree
struct TreeStats {
  size_t order{0};
  size_t height{0};
  size_t node_count{0};
  size_t leaf_count{0};
  size_t internal_count{0};
  size_t key_count{0};

  // Fraction of key slots in use, where every node can hold order - 1 keys.
  double FillRatio() const;

  friend std::ostream &operator<<(std::ostream &os, const TreeStats &stats);
};

// Accumulates counts for the subtree rooted at `node` into `stats`.
template <typename K>
void CollectStats(const Node<K> &node, TreeStats &stats, size_t depth = 1) {
  stats.node_count++;
  stats.key_count += node.GetKeys().size();
  if (depth > stats.height) {
    stats.height = depth;
  }
  if (node.IsLeaf()) {
    stats.leaf_count++;
    return;
  }
  stats.internal_count++;
  for (const auto &child : node.GetChildren()) {
    CollectStats(*child, stats, depth + 1);
  }
}

} // namespace btree

#endif
