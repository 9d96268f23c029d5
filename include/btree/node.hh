#ifndef __BTREE_NODE_HH__
#define __BTREE_NODE_HH__

#include "node_kind.hh"
#include "spdlog/spdlog.h"
#include <algorithm>
#include <cassert>
#include <cstddef>
#include <iterator>
#include <memory>
#include <optional>
#include <ostream>
#include <string>
#include <utility>
#include <vector>

namespace btree {

template <typename K> class BTree;

/**
 * @brief A single B-Tree node holding sorted keys and owned children
 *
 * @details A node with `k` keys and children holds exactly `k + 1` children.
 * A node without children is leaf-like regardless of its kind; this is how an
 * empty tree's root (kind Root, no children) accepts its first keys.
 *
 * Keys need `operator<` and must be copy constructible. Children are owned
 * exclusively through std::unique_ptr, so a subtree is never shared.
 */
template <typename K> class Node {
public:
  using NodePtr = std::unique_ptr<Node>;

  Node(size_t order, NodeKind kind) : order_(order), kind_(kind) {
    keys_.reserve(order);
  }

  Node(size_t order, NodeKind kind, std::vector<K> keys,
       std::vector<NodePtr> children)
      : order_(order), kind_(kind), keys_(std::move(keys)),
        children_(std::move(children)) {}

  static NodePtr Make(size_t order, NodeKind kind, std::vector<K> keys = {},
                      std::vector<NodePtr> children = {}) {
    return std::make_unique<Node>(order, kind, std::move(keys),
                                  std::move(children));
  }

  // Non-copyable
  Node(const Node &) = delete;
  Node &operator=(const Node &) = delete;

  // Membership lookup. Returns the searched key when present.
  std::optional<K> Get(const K &key) const {
    auto [found, index] = Locate(key);
    if (found) {
      return key;
    }
    if (children_.empty()) {
      return std::nullopt;
    }
    return children_[index]->Get(key);
  }

  // A node holding `order` keys must be split by its parent.
  bool IsOverflow() const { return keys_.size() == order_; }

  /**
   * @brief Inserts a key into this subtree
   *
   * Descends to the leaf that should hold the key and inserts it there.
   * While the recursion unwinds, any child left overflowing is split into
   * this node. This node's own overflow is left for the caller to resolve.
   *
   * @return false if the key was already present (nothing changes)
   */
  bool Insert(const K &key) {
    auto [found, index] = Locate(key);
    if (found) {
      return false;
    }

    if (children_.empty()) {
      keys_.insert(keys_.begin() + static_cast<std::ptrdiff_t>(index), key);
      return true;
    }

    const bool inserted = children_[index]->Insert(key);
    if (children_[index]->IsOverflow()) {
      SplitChildren(index);
    }
    return inserted;
  }

  /**
   * @brief Splits the overflowing child at `index` around its median key
   *
   * The child keeps the lower half of its keys (and children), a new right
   * sibling of the same kind takes the upper half, and the median key moves
   * into this node at `index`. The sibling is inserted at `index + 1`.
   *
   * @pre children_[index]->IsOverflow()
   */
  void SplitChildren(size_t index) {
    assert(index < children_.size());
    Node &child = *children_[index];
    assert(child.IsOverflow());

    const size_t split_at = child.order_ / 2;
    const auto key_split = child.keys_.begin() +
                           static_cast<std::ptrdiff_t>(split_at);

    std::vector<K> right_keys(std::make_move_iterator(key_split + 1),
                              std::make_move_iterator(child.keys_.end()));
    std::vector<NodePtr> right_children;
    if (!child.children_.empty()) {
      const auto child_split = child.children_.begin() +
                               static_cast<std::ptrdiff_t>(split_at + 1);
      right_children.assign(std::make_move_iterator(child_split),
                            std::make_move_iterator(child.children_.end()));
      child.children_.erase(child_split, child.children_.end());
    }

    K median = std::move(*key_split);
    child.keys_.erase(key_split, child.keys_.end());

    auto sibling = Make(child.order_, child.kind_, std::move(right_keys),
                        std::move(right_children));

    spdlog::trace("Split child {} at key {} ({} + {} keys)", index, split_at,
                  child.keys_.size(), sibling->keys_.size());

    keys_.insert(keys_.begin() + static_cast<std::ptrdiff_t>(index),
                 std::move(median));
    children_.insert(children_.begin() + static_cast<std::ptrdiff_t>(index + 1),
                     std::move(sibling));
  }

  // All keys of this subtree in ascending order.
  std::vector<K> Traverse() const {
    std::vector<K> extracted;
    AppendInOrder(extracted);
    return extracted;
  }

  // Writes one line per node, indented by depth.
  void Dump(std::ostream &os, size_t depth = 0) const {
    os << std::string(depth * 2, ' ') << kind_ << " [";
    for (size_t i = 0; i < keys_.size(); ++i) {
      if (i > 0) {
        os << ", ";
      }
      os << keys_[i];
    }
    os << "]\n";
    for (const auto &child : children_) {
      child->Dump(os, depth + 1);
    }
  }

  // Deep structural equality.
  bool operator==(const Node &other) const {
    if (order_ != other.order_ || kind_ != other.kind_ ||
        keys_ != other.keys_ || children_.size() != other.children_.size()) {
      return false;
    }
    return std::equal(children_.begin(), children_.end(),
                      other.children_.begin(),
                      [](const NodePtr &a, const NodePtr &b) {
                        return *a == *b;
                      });
  }
  bool operator!=(const Node &other) const { return !(*this == other); }

  size_t GetOrder() const { return order_; }
  NodeKind GetKind() const { return kind_; }
  const std::vector<K> &GetKeys() const { return keys_; }
  const std::vector<NodePtr> &GetChildren() const { return children_; }
  bool IsLeaf() const { return children_.empty(); }

private:
  friend class BTree<K>;

  // Binary search over keys_. Returns whether the key is present and either
  // its position or the index of the child subtree that would contain it.
  std::pair<bool, size_t> Locate(const K &key) const {
    auto it = std::lower_bound(keys_.begin(), keys_.end(), key);
    const auto index = static_cast<size_t>(std::distance(keys_.begin(), it));
    return {it != keys_.end() && !(key < *it), index};
  }

  void AppendInOrder(std::vector<K> &out) const {
    if (children_.empty()) {
      out.insert(out.end(), keys_.begin(), keys_.end());
      return;
    }
    children_[0]->AppendInOrder(out);
    for (size_t i = 0; i < keys_.size(); ++i) {
      out.push_back(keys_[i]);
      children_[i + 1]->AppendInOrder(out);
    }
  }

  size_t order_;
  NodeKind kind_;
  std::vector<K> keys_;
  std::vector<NodePtr> children_;
};

} // namespace btree

#endif
