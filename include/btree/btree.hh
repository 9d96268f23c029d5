#ifndef __BTREE_BTREE_HH__
#define __BTREE_BTREE_HH__

#include "node.hh"
#include "spdlog/spdlog.h"
#include "tree_stats.hh"
#include <cstddef>
#include <iterator>
#include <memory>
#include <optional>
#include <ostream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace btree {

// Smallest order for which splitting leaves both halves non-empty.
constexpr size_t kMinimumOrder = 3;

/**
 * @brief An in-memory B-Tree set
 *
 * @details Owns the root node. Insertion delegates to the root, which splits
 * overflowing descendants as the recursion unwinds; the tree then splits the
 * root itself if needed, which is the only way the height grows.
 *
 * Not thread-safe: callers must serialize all access.
 */
template <typename K> class BTree {
public:
  explicit BTree(size_t order)
      : order_(ValidateOrder(order)),
        root_(std::make_unique<Node<K>>(order, NodeKind::Root)) {}

  // Non-copyable
  BTree(const BTree &) = delete;
  BTree &operator=(const BTree &) = delete;
  BTree(BTree &&) noexcept = default;
  BTree &operator=(BTree &&) noexcept = default;

  std::optional<K> Get(const K &key) const { return root_->Get(key); }

  // Returns false if the key was already present.
  bool Insert(const K &key) {
    const bool inserted = root_->Insert(key);
    if (root_->IsOverflow()) {
      SplitRoot();
    }
    if (inserted) {
      size_++;
    }
    return inserted;
  }

  std::vector<K> Traverse() const { return root_->Traverse(); }

  TreeStats Stats() const {
    TreeStats stats;
    stats.order = order_;
    CollectStats(*root_, stats);
    return stats;
  }

  void Dump(std::ostream &os) const { root_->Dump(os); }

  size_t Size() const { return size_; }
  size_t Height() const { return height_; }
  size_t GetOrder() const { return order_; }
  const Node<K> &GetRoot() const { return *root_; }

private:
  static size_t ValidateOrder(size_t order) {
    if (order < kMinimumOrder) {
      spdlog::error("Invalid B-Tree order {} (minimum is {})", order,
                    kMinimumOrder);
      throw std::invalid_argument("Invalid B-Tree order (" +
                                  std::to_string(order) + ")");
    }
    return order;
  }

  // Replaces an overflowing root with a new root holding its median key and
  // two children built from its lower and upper halves.
  void SplitRoot() {
    const size_t index = root_->order_ / 2;
    auto &keys = root_->keys_;
    auto &children = root_->children_;
    const NodeKind half_kind =
        children.empty() ? NodeKind::Leaf : NodeKind::Internal;
    const auto key_split = keys.begin() + static_cast<std::ptrdiff_t>(index);

    std::vector<K> left_keys(std::make_move_iterator(keys.begin()),
                             std::make_move_iterator(key_split));
    std::vector<K> right_keys(std::make_move_iterator(key_split + 1),
                              std::make_move_iterator(keys.end()));
    std::vector<typename Node<K>::NodePtr> left_children;
    std::vector<typename Node<K>::NodePtr> right_children;
    if (!children.empty()) {
      const auto child_split =
          children.begin() + static_cast<std::ptrdiff_t>(index + 1);
      left_children.assign(std::make_move_iterator(children.begin()),
                           std::make_move_iterator(child_split));
      right_children.assign(std::make_move_iterator(child_split),
                            std::make_move_iterator(children.end()));
    }

    std::vector<K> root_keys;
    root_keys.push_back(std::move(*key_split));
    std::vector<typename Node<K>::NodePtr> root_children;
    root_children.push_back(Node<K>::Make(order_, half_kind,
                                          std::move(left_keys),
                                          std::move(left_children)));
    root_children.push_back(Node<K>::Make(order_, half_kind,
                                          std::move(right_keys),
                                          std::move(right_children)));

    root_ = Node<K>::Make(order_, NodeKind::Root, std::move(root_keys),
                          std::move(root_children));
    height_++;
    spdlog::debug("Root split, height is now {}", height_);
  }

  size_t order_;
  std::unique_ptr<Node<K>> root_;
  size_t size_{0};
  size_t height_{1};
};

} // namespace btree

#endif
