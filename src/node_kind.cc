#include "node_kind.hh"

namespace btree {

std::string ToString(NodeKind kind) {
  switch (kind) {
  case NodeKind::Root:
    return "root";
  case NodeKind::Internal:
    return "internal";
  case NodeKind::Leaf:
    return "leaf";
  }
  __builtin_unreachable();
}

std::ostream &operator<<(std::ostream &os, NodeKind kind) {
  return os << ToString(kind);
}

} // namespace btree
