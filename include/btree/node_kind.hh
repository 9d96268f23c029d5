#ifndef __BTREE_NODE_KIND_HH__
#define __BTREE_NODE_KIND_HH__

#include <ostream>
#include <string>

namespace btree {

// Structural role of a node. Root and Internal behave identically during
// search and insertion; they differ only in the minimum number of children
// they must hold.
enum class NodeKind {
  Root,
  Internal,
  Leaf,
};

std::string ToString(NodeKind kind);
std::ostream &operator<<(std::ostream &os, NodeKind kind);

} // namespace btree

#endif
