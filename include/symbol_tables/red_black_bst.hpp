// Copyright (c) 2025 Bryan Kressler
//
// SPDX-License-Identifier: BSD-3-Clause

#pragma once

#include <algorithm>
#include <cassert>
#include <concepts>
#include <cstddef>
#include <functional>
#include <initializer_list>
#include <memory>
#include <optional>
#include <queue>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

#include "exceptions.hpp"

namespace symbol_tables {

// Concept to enforce that a comparator is compatible with a key type
template <typename Key, typename Compare>
concept ComparatorCompatible = requires(Compare comp, Key a, Key b) {
  { comp(a, b) } -> std::convertible_to<bool>;
} && std::is_default_constructible_v<Compare>;

template <typename T>
struct is_optional : std::false_type {};

template <typename T>
struct is_optional<std::optional<T>> : std::true_type {};

/**
 * Returns true if the key is a null key: nullptr for pointer keys, nullopt
 * for std::optional keys. Always false for any other key type.
 */
template <typename Key>
constexpr bool is_null_key(const Key& key) {
  if constexpr (std::is_pointer_v<Key> || std::is_null_pointer_v<Key>) {
    return key == nullptr;
  } else if constexpr (is_optional<Key>::value) {
    return !key.has_value();
  } else {
    return false;
  }
}

/**
 * An ordered symbol table backed by a left-leaning red-black BST.
 *
 * Every red link leans left and every root-to-null path crosses the same
 * number of black links, so the tree is the binary encoding of a 2-3 tree and
 * its height never exceeds 2 * log2(n + 1). Each node caches the size of its
 * subtree, which makes rank() and select() O(log n).
 *
 * Mutations recurse down to the target key and repair the tree with local
 * rotations and color flips on the way back up. Each recursive call returns
 * the (possibly new) root of its subtree and the caller stores it in place of
 * its old child pointer.
 *
 * @tparam Key The key type (must be ComparatorCompatible with Compare)
 * @tparam Value The value type
 * @tparam Compare Strict weak ordering over keys (defaults to std::less<Key>)
 * @tparam Allocator The allocator type (defaults to
 *         std::allocator<value_type>), rebound to the internal node type
 *
 * Not thread-safe. Concurrent readers are fine, but a writer needs external
 * mutual exclusion.
 *
 * Example:
 * @code
 * red_black_bst<std::string, int> st;
 * st.put("L", 11);
 * st.put("P", 10);
 * st.rank("P");    // 1
 * st.select(0);    // "L"
 * st.floor("O");   // "L"
 * @endcode
 */
template <typename Key, typename Value, typename Compare = std::less<Key>,
          typename Allocator = std::allocator<std::pair<Key, Value>>>
  requires ComparatorCompatible<Key, Compare>
class red_black_bst {
 public:
  // Type aliases
  using key_type = Key;
  using mapped_type = Value;
  using value_type = std::pair<Key, Value>;
  using size_type = std::size_t;
  using allocator_type = Allocator;
  using key_compare = Compare;

  // Color of the link from a node's parent, stored on the child.
  enum class Color : bool { Black = false, Red = true };

 private:
  struct Node {
    Key key;
    Value value;
    Node* left;
    Node* right;
    Color color;
    size_type size;  // Nodes in the subtree rooted here, including this one

    template <typename V>
    Node(const Key& k, V&& v)
        : key(k),
          value(std::forward<V>(v)),
          left(nullptr),
          right(nullptr),
          color(Color::Red),
          size(1) {}
  };

 public:
  /**
   * Default constructor - creates an empty table.
   *
   * @param alloc Allocator to use for node allocation
   */
  explicit red_black_bst(const Allocator& alloc = Allocator());

  /**
   * Destructor - deallocates all nodes.
   */
  ~red_black_bst();

  /**
   * Copy constructor - clones the other tree node by node, keeping its shape
   * and colors.
   *
   * Complexity: O(n)
   */
  red_black_bst(const red_black_bst& other);

  /**
   * Copy assignment operator - replaces contents with a clone of other.
   *
   * Complexity: O(n + m) where n = this.size(), m = other.size()
   */
  red_black_bst& operator=(const red_black_bst& other);

  /**
   * Move constructor - takes ownership of another tree's nodes.
   * Leaves other empty.
   * Complexity: O(1)
   */
  red_black_bst(red_black_bst&& other) noexcept;

  /**
   * Move assignment operator - replaces contents by taking ownership.
   * Leaves other empty.
   * Complexity: O(n) where n is this tree's size (due to deallocation)
   */
  red_black_bst& operator=(red_black_bst&& other) noexcept;

  /**
   * Constructs the table from an initializer list. Later duplicates
   * overwrite earlier ones, as with put().
   * Complexity: O(n log n)
   */
  red_black_bst(std::initializer_list<value_type> init,
                const Allocator& alloc = Allocator());

  /**
   * Constructs the table from a range of key-value pairs.
   * Complexity: O(n log n) where n is the distance between first and last
   */
  template <typename InputIt>
  red_black_bst(InputIt first, InputIt last,
                const Allocator& alloc = Allocator());

  /**
   * Returns the number of key-value pairs in the table.
   * Complexity: O(1)
   */
  [[nodiscard]] size_type size() const { return node_size(root_); }

  /**
   * Returns true if the table is empty.
   * Complexity: O(1)
   */
  [[nodiscard]] bool empty() const { return root_ == nullptr; }

  /**
   * Returns the key comparison object.
   * Complexity: O(1)
   */
  key_compare key_comp() const { return comp_; }

  /**
   * Returns the allocator associated with the container.
   * Note: Returns a copy constructed from node_alloc_ via rebind.
   * Complexity: O(1)
   */
  allocator_type get_allocator() const { return allocator_type(node_alloc_); }

  /**
   * Inserts the key-value pair, overwriting the value if the key is already
   * present. Overwriting never changes the shape of the tree or size().
   *
   * @throws std::invalid_argument if key is a null key
   * Complexity: O(log n)
   */
  void put(const Key& key, const Value& value);

  /**
   * Move-aware overload of put().
   */
  void put(const Key& key, Value&& value);

  /**
   * Returns a copy of the value associated with key, or std::nullopt if the
   * key is absent.
   *
   * @throws std::invalid_argument if key is a null key
   * Complexity: O(log n)
   */
  std::optional<Value> get(const Key& key) const;

  /**
   * Returns a reference to the value associated with the specified key.
   *
   * @throws std::invalid_argument if key is a null key
   * @throws std::out_of_range if the key does not exist
   * Complexity: O(log n)
   */
  Value& at(const Key& key);

  /**
   * Returns a const reference to the value associated with the specified
   * key.
   *
   * @throws std::invalid_argument if key is a null key
   * @throws std::out_of_range if the key does not exist
   * Complexity: O(log n)
   */
  const Value& at(const Key& key) const;

  /**
   * Checks if there is an element with the specified key.
   *
   * @throws std::invalid_argument if key is a null key
   * Complexity: O(log n)
   */
  bool contains(const Key& key) const;

  /**
   * Removes the key and its value from the table.
   * Returns the number of elements removed (0 or 1). Removing an absent key
   * leaves the tree untouched.
   *
   * @throws std::invalid_argument if key is a null key
   * Complexity: O(log n)
   */
  size_type erase(const Key& key);

  /**
   * Removes the smallest key and its value.
   *
   * @throws underflow_error if the table is empty
   * Complexity: O(log n)
   */
  void erase_min();

  /**
   * Removes the largest key and its value.
   *
   * @throws underflow_error if the table is empty
   * Complexity: O(log n)
   */
  void erase_max();

  /**
   * Removes all elements from the table.
   * Complexity: O(n)
   */
  void clear();

  /**
   * Swaps the contents of this table with another table.
   * Complexity: O(1)
   */
  void swap(red_black_bst& other) noexcept;

  /**
   * Returns the smallest key. The reference stays valid until the next
   * mutation.
   *
   * @throws underflow_error if the table is empty
   * Complexity: O(log n)
   */
  const Key& min() const;

  /**
   * Returns the largest key. The reference stays valid until the next
   * mutation.
   *
   * @throws underflow_error if the table is empty
   * Complexity: O(log n)
   */
  const Key& max() const;

  /**
   * Returns the largest key less than or equal to key.
   *
   * @throws std::invalid_argument if key is a null key
   * @throws underflow_error if the table is empty
   * @throws key_not_found if every key in the table is greater than key
   * Complexity: O(log n)
   */
  const Key& floor(const Key& key) const;

  /**
   * Returns the smallest key greater than or equal to key.
   *
   * @throws std::invalid_argument if key is a null key
   * @throws underflow_error if the table is empty
   * @throws key_not_found if every key in the table is less than key
   * Complexity: O(log n)
   */
  const Key& ceil(const Key& key) const;

  /**
   * Returns the number of keys strictly less than key. The key itself need
   * not be present.
   *
   * @throws std::invalid_argument if key is a null key
   * Complexity: O(log n)
   */
  size_type rank(const Key& key) const;

  /**
   * Returns the key of the given rank, i.e. the (rank + 1)-th smallest key.
   * Inverse of rank() for present keys.
   *
   * @throws std::out_of_range if rank >= size()
   * Complexity: O(log n)
   */
  const Key& select(size_type rank) const;

  /**
   * Returns every key in ascending order. The result is a snapshot, not a
   * view; an empty table yields an empty vector.
   * Complexity: O(n)
   */
  std::vector<Key> keys() const;

  /**
   * Returns the keys in [lo, hi] in ascending order. Empty if lo > hi.
   *
   * @throws std::invalid_argument if lo or hi is a null key
   * Complexity: O(log n + k) where k is the number of keys returned
   */
  std::vector<Key> range_keys(const Key& lo, const Key& hi) const;

  /**
   * Returns the number of keys in [lo, hi]. Zero if lo > hi.
   *
   * @throws std::invalid_argument if lo or hi is a null key
   * Complexity: O(log n)
   */
  size_type key_size(const Key& lo, const Key& hi) const;

  /**
   * Returns the height of the tree: -1 when empty, 0 for a single node.
   * Complexity: O(n)
   */
  int height() const;

  /**
   * Returns the keys level by level, root first, each level left to right.
   * Meant for diagnostics.
   * Complexity: O(n)
   */
  std::vector<std::vector<Key>> level_order() const;

  /**
   * Calls fn(key, value) for every element in ascending key order.
   * Complexity: O(n)
   */
  template <typename Fn>
  void for_each(Fn&& fn) const;

  // Invariant checks. These walk the whole tree and are meant for tests and
  // debugging, not for the hot path.

  /**
   * Returns true if every node's key lies strictly between the keys of its
   * ancestors that bound it (symmetric order).
   */
  bool is_bst() const;

  /**
   * Returns true if every node's cached size equals 1 + size(left) +
   * size(right).
   */
  bool count_check() const;

  /**
   * Returns true if rank(select(i)) == i for every valid i and
   * select(rank(key)) == key for every present key.
   */
  bool rank_check() const;

  /**
   * Returns true if no right link is red and no path has two red links in a
   * row (1-1 correspondence with a 2-3 tree).
   */
  bool is_23() const;

  /**
   * Returns true if every path from the root to a null link crosses the same
   * number of black links.
   */
  bool is_balanced() const;

  /**
   * Runs every invariant check and additionally requires a black root.
   */
  bool check() const;

 private:
  using node_alloc_type =
      typename std::allocator_traits<Allocator>::template rebind_alloc<Node>;
  using node_alloc_traits = std::allocator_traits<node_alloc_type>;

  // Color and size of a possibly-null node; null links are black and empty.
  static bool is_red(const Node* node) {
    return node != nullptr && node->color == Color::Red;
  }
  static size_type node_size(const Node* node) {
    return node == nullptr ? 0 : node->size;
  }

  bool equal_keys(const Key& a, const Key& b) const {
    return !comp_(a, b) && !comp_(b, a);
  }

  /**
   * Throws std::invalid_argument naming the calling operation if key is a
   * null key.
   */
  static void require_key(const Key& key, const char* what);

  /**
   * Throws underflow_error naming the calling operation if the table is
   * empty.
   */
  void require_non_empty(const char* what) const;

  template <typename V>
  Node* allocate_node(const Key& key, V&& value);
  void deallocate_node(Node* node);
  void deallocate_subtree(Node* node);
  Node* clone_subtree(const Node* node);

  // Balancing primitives. Each returns the new root of the subtree.

  /**
   * Turns a right-leaning red link into a left-leaning one.
   * @pre is_red(h->right)
   */
  static Node* rotate_left(Node* h);

  /**
   * Turns a left-leaning red link into a right-leaning one.
   * @pre is_red(h->left)
   */
  static Node* rotate_right(Node* h);

  /**
   * Toggles the color of h and both of its children. Splits a temporary
   * 4-node on insertion, and borrows redness from the parent on deletion.
   * @pre h->left != nullptr && h->right != nullptr
   */
  static void flip_colors(Node* h);

  /**
   * Assuming h is red and both h->left and h->left->left are black, makes
   * h->left or one of its children red.
   */
  static Node* move_red_left(Node* h);

  /**
   * Assuming h is red and both h->right and h->right->left are black, makes
   * h->right or one of its children red.
   */
  static Node* move_red_right(Node* h);

  /**
   * Restores the left-leaning invariants at h after a deletion step and
   * recomputes its size.
   */
  static Node* balance(Node* h);

  template <typename V>
  Node* put_impl(Node* h, const Key& key, V&& value);
  Node* erase_impl(Node* h, const Key& key);
  Node* erase_min_impl(Node* h);
  Node* erase_max_impl(Node* h);

  Node* find_node(const Key& key) const;
  static Node* min_node(Node* node);
  static Node* max_node(Node* node);
  Node* floor_node(Node* node, const Key& key) const;
  Node* ceil_node(Node* node, const Key& key) const;
  size_type rank_impl(const Node* node, const Key& key) const;
  void collect_keys(const Node* node, std::vector<Key>& out, const Key& lo,
                    const Key& hi) const;
  static int height_impl(const Node* node);
  template <typename Fn>
  static void for_each_impl(const Node* node, Fn& fn);

  bool is_bst_impl(const Node* node, const Key* lo, const Key* hi) const;
  static bool count_check_impl(const Node* node);
  bool is_23_impl(const Node* node) const;
  static bool is_balanced_impl(const Node* node, int black);

  [[no_unique_address]] Compare comp_;
  [[no_unique_address]] node_alloc_type node_alloc_;
  Node* root_;
};

}  // namespace symbol_tables

// Include implementation
#include "red_black_bst.ipp"
