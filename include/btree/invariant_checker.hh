#ifndef __BTREE_INVARIANT_CHECKER_HH__
#define __BTREE_INVARIANT_CHECKER_HH__

#include "btree.hh"
#include "node.hh"
#include <cstddef>
#include <optional>
#include <ostream>
#include <string>

namespace btree {

enum class ViolationKind {
  KeyCount,         // keys >= order
  ChildCount,       // children >= order + 1
  LeafHasChildren,  // Leaf kind with children
  ChildKeyMismatch, // children != keys + 1
  RootChildren,     // Root with exactly one child
  InternalUnderfull,
  MisplacedRoot,    // Root kind below the top of the tree
  OrderMismatch,
  KeysNotSorted,
  KeyOutOfRange,    // child key outside the bounds set by its parent
  UnevenLeafDepth,
};

struct InvariantViolation {
  ViolationKind kind;
  size_t depth; // 0 for the node the check started from
  std::string message;

  friend std::ostream &operator<<(std::ostream &os,
                                  const InvariantViolation &violation);
};

std::string ToString(ViolationKind kind);

// Minimum number of children an Internal node must hold.
size_t MinimumInternalChildren(size_t order);

InvariantViolation MakeViolation(ViolationKind kind, size_t depth,
                                 const std::string &detail);

namespace detail {

struct CheckContext {
  size_t order;
  std::optional<size_t> leaf_depth;
};

template <typename K>
std::optional<InvariantViolation>
CheckNode(const Node<K> &node, size_t depth, const K *lower, const K *upper,
          CheckContext &ctx) {
  const auto &keys = node.GetKeys();
  const auto &children = node.GetChildren();
  const size_t order = node.GetOrder();

  if (keys.size() >= order) {
    return MakeViolation(ViolationKind::KeyCount, depth,
                         std::to_string(keys.size()) + " keys for order " +
                             std::to_string(order));
  }
  if (children.size() >= order + 1) {
    return MakeViolation(ViolationKind::ChildCount, depth,
                         std::to_string(children.size()) +
                             " children for order " + std::to_string(order));
  }

  switch (node.GetKind()) {
  case NodeKind::Root:
    if (depth > 0) {
      return MakeViolation(ViolationKind::MisplacedRoot, depth,
                           "root node below the top");
    }
    if (children.size() == 1) {
      return MakeViolation(ViolationKind::RootChildren, depth,
                           "root with a single child");
    }
    break;
  case NodeKind::Internal:
    if (children.size() < MinimumInternalChildren(order)) {
      return MakeViolation(ViolationKind::InternalUnderfull, depth,
                           std::to_string(children.size()) +
                               " children, minimum is " +
                               std::to_string(MinimumInternalChildren(order)));
    }
    break;
  case NodeKind::Leaf:
    if (!children.empty()) {
      return MakeViolation(ViolationKind::LeafHasChildren, depth,
                           std::to_string(children.size()) + " children");
    }
    break;
  }

  if (!children.empty() && children.size() != keys.size() + 1) {
    return MakeViolation(ViolationKind::ChildKeyMismatch, depth,
                         std::to_string(keys.size()) + " keys, " +
                             std::to_string(children.size()) + " children");
  }

  if (order != ctx.order) {
    return MakeViolation(ViolationKind::OrderMismatch, depth,
                         "order " + std::to_string(order) + ", expected " +
                             std::to_string(ctx.order));
  }

  for (size_t i = 0; i < keys.size(); ++i) {
    if (i > 0 && !(keys[i - 1] < keys[i])) {
      return MakeViolation(ViolationKind::KeysNotSorted, depth,
                           "key " + std::to_string(i) +
                               " does not follow key " + std::to_string(i - 1));
    }
    if ((lower && !(*lower < keys[i])) || (upper && !(keys[i] < *upper))) {
      return MakeViolation(ViolationKind::KeyOutOfRange, depth,
                           "key " + std::to_string(i) +
                               " outside the range of its parent slot");
    }
  }

  if (children.empty()) {
    if (!ctx.leaf_depth) {
      ctx.leaf_depth = depth;
    } else if (*ctx.leaf_depth != depth) {
      return MakeViolation(ViolationKind::UnevenLeafDepth, depth,
                           "leaf at depth " + std::to_string(depth) +
                               ", expected " +
                               std::to_string(*ctx.leaf_depth));
    }
    return std::nullopt;
  }

  for (size_t i = 0; i < children.size(); ++i) {
    const K *child_lower = i == 0 ? lower : &keys[i - 1];
    const K *child_upper = i == keys.size() ? upper : &keys[i];
    if (auto violation = CheckNode(*children[i], depth + 1, child_lower,
                                   child_upper, ctx)) {
      return violation;
    }
  }
  return std::nullopt;
}

} // namespace detail

/**
 * @brief Validates the structural invariants of a subtree
 *
 * @return The first violation found in pre-order, or std::nullopt if the
 * subtree rooted at `node` is a well-formed B-Tree.
 */
template <typename K>
std::optional<InvariantViolation> CheckInvariants(const Node<K> &node) {
  detail::CheckContext ctx{node.GetOrder(), std::nullopt};
  return detail::CheckNode<K>(node, 0, nullptr, nullptr, ctx);
}

template <typename K>
std::optional<InvariantViolation> CheckInvariants(const BTree<K> &tree) {
  return CheckInvariants(tree.GetRoot());
}

} // namespace btree

#endif
