#include "invariant_checker.hh"

namespace btree {

std::string ToString(ViolationKind kind) {
  switch (kind) {
  case ViolationKind::KeyCount:
    return "key count";
  case ViolationKind::ChildCount:
    return "child count";
  case ViolationKind::LeafHasChildren:
    return "leaf has children";
  case ViolationKind::ChildKeyMismatch:
    return "child/key mismatch";
  case ViolationKind::RootChildren:
    return "root children";
  case ViolationKind::InternalUnderfull:
    return "internal underfull";
  case ViolationKind::MisplacedRoot:
    return "misplaced root";
  case ViolationKind::OrderMismatch:
    return "order mismatch";
  case ViolationKind::KeysNotSorted:
    return "keys not sorted";
  case ViolationKind::KeyOutOfRange:
    return "key out of range";
  case ViolationKind::UnevenLeafDepth:
    return "uneven leaf depth";
  }
  __builtin_unreachable();
}

// ceil(order / 2): splitting a full order-4 internal node leaves a right
// half with two children.
size_t MinimumInternalChildren(size_t order) { return (order + 1) / 2; }

InvariantViolation MakeViolation(ViolationKind kind, size_t depth,
                                 const std::string &detail) {
  return InvariantViolation{kind, depth, detail};
}

std::ostream &operator<<(std::ostream &os,
                         const InvariantViolation &violation) {
  return os << ToString(violation.kind) << " at depth " << violation.depth
            << ": " << violation.message;
}

} // namespace btree
