// Implementation file for red_black_bst.hpp
// This file contains all method implementations for the red_black_bst class.

namespace symbol_tables {

// Constructor
template <typename Key, typename Value, typename Compare, typename Allocator>
  requires ComparatorCompatible<Key, Compare>
red_black_bst<Key, Value, Compare, Allocator>::red_black_bst(
    const Allocator& alloc)
    : node_alloc_(alloc), root_(nullptr) {}

// Destructor
template <typename Key, typename Value, typename Compare, typename Allocator>
  requires ComparatorCompatible<Key, Compare>
red_black_bst<Key, Value, Compare, Allocator>::~red_black_bst() {
  deallocate_subtree(root_);
}

// Copy constructor
template <typename Key, typename Value, typename Compare, typename Allocator>
  requires ComparatorCompatible<Key, Compare>
red_black_bst<Key, Value, Compare, Allocator>::red_black_bst(
    const red_black_bst& other)
    : comp_(other.comp_),
      node_alloc_(node_alloc_traits::select_on_container_copy_construction(
          other.node_alloc_)),
      root_(nullptr) {
  root_ = clone_subtree(other.root_);
}

// Copy assignment operator
template <typename Key, typename Value, typename Compare, typename Allocator>
  requires ComparatorCompatible<Key, Compare>
red_black_bst<Key, Value, Compare, Allocator>&
red_black_bst<Key, Value, Compare, Allocator>::operator=(
    const red_black_bst& other) {
  if (this != &other) {
    // Clone first so a failed allocation leaves this table untouched
    Node* copy = clone_subtree(other.root_);
    deallocate_subtree(root_);
    root_ = copy;
    comp_ = other.comp_;
  }
  return *this;
}

// Move constructor
template <typename Key, typename Value, typename Compare, typename Allocator>
  requires ComparatorCompatible<Key, Compare>
red_black_bst<Key, Value, Compare, Allocator>::red_black_bst(
    red_black_bst&& other) noexcept
    : comp_(other.comp_),
      node_alloc_(std::move(other.node_alloc_)),
      root_(other.root_) {
  other.root_ = nullptr;
}

// Move assignment operator
template <typename Key, typename Value, typename Compare, typename Allocator>
  requires ComparatorCompatible<Key, Compare>
red_black_bst<Key, Value, Compare, Allocator>&
red_black_bst<Key, Value, Compare, Allocator>::operator=(
    red_black_bst&& other) noexcept {
  if (this != &other) {
    deallocate_subtree(root_);
    comp_ = other.comp_;
    root_ = other.root_;
    other.root_ = nullptr;
  }
  return *this;
}

// Initializer list constructor
template <typename Key, typename Value, typename Compare, typename Allocator>
  requires ComparatorCompatible<Key, Compare>
red_black_bst<Key, Value, Compare, Allocator>::red_black_bst(
    std::initializer_list<value_type> init, const Allocator& alloc)
    : red_black_bst(alloc) {
  for (const auto& elem : init) {
    put(elem.first, elem.second);
  }
}

// Range constructor
template <typename Key, typename Value, typename Compare, typename Allocator>
  requires ComparatorCompatible<Key, Compare>
template <typename InputIt>
red_black_bst<Key, Value, Compare, Allocator>::red_black_bst(
    InputIt first, InputIt last, const Allocator& alloc)
    : red_black_bst(alloc) {
  for (auto it = first; it != last; ++it) {
    put(it->first, it->second);
  }
}

// swap
template <typename Key, typename Value, typename Compare, typename Allocator>
  requires ComparatorCompatible<Key, Compare>
void red_black_bst<Key, Value, Compare, Allocator>::swap(
    red_black_bst& other) noexcept {
  using std::swap;
  swap(comp_, other.comp_);
  swap(node_alloc_, other.node_alloc_);
  swap(root_, other.root_);
}

// clear
template <typename Key, typename Value, typename Compare, typename Allocator>
  requires ComparatorCompatible<Key, Compare>
void red_black_bst<Key, Value, Compare, Allocator>::clear() {
  deallocate_subtree(root_);
  root_ = nullptr;
}

// require_key
template <typename Key, typename Value, typename Compare, typename Allocator>
  requires ComparatorCompatible<Key, Compare>
void red_black_bst<Key, Value, Compare, Allocator>::require_key(
    const Key& key, const char* what) {
  if (is_null_key(key)) {
    throw std::invalid_argument(std::string("red_black_bst::") + what +
                                ": null key");
  }
}

// require_non_empty
template <typename Key, typename Value, typename Compare, typename Allocator>
  requires ComparatorCompatible<Key, Compare>
void red_black_bst<Key, Value, Compare, Allocator>::require_non_empty(
    const char* what) const {
  if (root_ == nullptr) {
    throw underflow_error(std::string("red_black_bst::") + what +
                          ": symbol table underflow");
  }
}

// allocate_node
template <typename Key, typename Value, typename Compare, typename Allocator>
  requires ComparatorCompatible<Key, Compare>
template <typename V>
typename red_black_bst<Key, Value, Compare, Allocator>::Node*
red_black_bst<Key, Value, Compare, Allocator>::allocate_node(const Key& key,
                                                            V&& value) {
  Node* node = node_alloc_traits::allocate(node_alloc_, 1);
  try {
    node_alloc_traits::construct(node_alloc_, node, key,
                                 std::forward<V>(value));
  } catch (...) {
    node_alloc_traits::deallocate(node_alloc_, node, 1);
    throw;
  }
  return node;
}

// deallocate_node
template <typename Key, typename Value, typename Compare, typename Allocator>
  requires ComparatorCompatible<Key, Compare>
void red_black_bst<Key, Value, Compare, Allocator>::deallocate_node(
    Node* node) {
  node_alloc_traits::destroy(node_alloc_, node);
  node_alloc_traits::deallocate(node_alloc_, node, 1);
}

// deallocate_subtree
template <typename Key, typename Value, typename Compare, typename Allocator>
  requires ComparatorCompatible<Key, Compare>
void red_black_bst<Key, Value, Compare, Allocator>::deallocate_subtree(
    Node* node) {
  if (node == nullptr) {
    return;
  }
  deallocate_subtree(node->left);
  deallocate_subtree(node->right);
  deallocate_node(node);
}

// clone_subtree - copies shape, colors and sizes as well as the elements
template <typename Key, typename Value, typename Compare, typename Allocator>
  requires ComparatorCompatible<Key, Compare>
typename red_black_bst<Key, Value, Compare, Allocator>::Node*
red_black_bst<Key, Value, Compare, Allocator>::clone_subtree(
    const Node* node) {
  if (node == nullptr) {
    return nullptr;
  }
  Node* copy = allocate_node(node->key, node->value);
  copy->color = node->color;
  copy->size = node->size;
  try {
    copy->left = clone_subtree(node->left);
    copy->right = clone_subtree(node->right);
  } catch (...) {
    deallocate_subtree(copy);
    throw;
  }
  return copy;
}

// rotate_left
template <typename Key, typename Value, typename Compare, typename Allocator>
  requires ComparatorCompatible<Key, Compare>
typename red_black_bst<Key, Value, Compare, Allocator>::Node*
red_black_bst<Key, Value, Compare, Allocator>::rotate_left(Node* h) {
  assert(h != nullptr && is_red(h->right) &&
         "rotate_left requires a red right link");
  Node* x = h->right;
  h->right = x->left;
  x->left = h;
  x->color = h->color;
  h->color = Color::Red;
  x->size = h->size;
  h->size = 1 + node_size(h->left) + node_size(h->right);
  return x;
}

// rotate_right
template <typename Key, typename Value, typename Compare, typename Allocator>
  requires ComparatorCompatible<Key, Compare>
typename red_black_bst<Key, Value, Compare, Allocator>::Node*
red_black_bst<Key, Value, Compare, Allocator>::rotate_right(Node* h) {
  assert(h != nullptr && is_red(h->left) &&
         "rotate_right requires a red left link");
  Node* x = h->left;
  h->left = x->right;
  x->right = h;
  x->color = h->color;
  h->color = Color::Red;
  x->size = h->size;
  h->size = 1 + node_size(h->left) + node_size(h->right);
  return x;
}

// flip_colors
template <typename Key, typename Value, typename Compare, typename Allocator>
  requires ComparatorCompatible<Key, Compare>
void red_black_bst<Key, Value, Compare, Allocator>::flip_colors(Node* h) {
  assert(h->left != nullptr && h->right != nullptr &&
         "flip_colors requires two children");
  auto toggle = [](Color c) {
    return c == Color::Red ? Color::Black : Color::Red;
  };
  h->color = toggle(h->color);
  h->left->color = toggle(h->left->color);
  h->right->color = toggle(h->right->color);
}

// move_red_left
template <typename Key, typename Value, typename Compare, typename Allocator>
  requires ComparatorCompatible<Key, Compare>
typename red_black_bst<Key, Value, Compare, Allocator>::Node*
red_black_bst<Key, Value, Compare, Allocator>::move_red_left(Node* h) {
  flip_colors(h);
  // Right sibling is a 3-node: borrow its smaller key through the parent
  if (is_red(h->right->left)) {
    h->right = rotate_right(h->right);
    h = rotate_left(h);
    flip_colors(h);
  }
  return h;
}

// move_red_right
template <typename Key, typename Value, typename Compare, typename Allocator>
  requires ComparatorCompatible<Key, Compare>
typename red_black_bst<Key, Value, Compare, Allocator>::Node*
red_black_bst<Key, Value, Compare, Allocator>::move_red_right(Node* h) {
  flip_colors(h);
  if (is_red(h->left->left)) {
    h = rotate_right(h);
    flip_colors(h);
  }
  return h;
}

// balance
template <typename Key, typename Value, typename Compare, typename Allocator>
  requires ComparatorCompatible<Key, Compare>
typename red_black_bst<Key, Value, Compare, Allocator>::Node*
red_black_bst<Key, Value, Compare, Allocator>::balance(Node* h) {
  if (is_red(h->right) && !is_red(h->left)) {
    h = rotate_left(h);
  }
  if (is_red(h->left) && is_red(h->left->left)) {
    h = rotate_right(h);
  }
  if (is_red(h->left) && is_red(h->right)) {
    flip_colors(h);
  }
  h->size = 1 + node_size(h->left) + node_size(h->right);
  return h;
}

// put (copy)
template <typename Key, typename Value, typename Compare, typename Allocator>
  requires ComparatorCompatible<Key, Compare>
void red_black_bst<Key, Value, Compare, Allocator>::put(const Key& key,
                                                        const Value& value) {
  require_key(key, "put");
  root_ = put_impl(root_, key, value);
  root_->color = Color::Black;
}

// put (move)
template <typename Key, typename Value, typename Compare, typename Allocator>
  requires ComparatorCompatible<Key, Compare>
void red_black_bst<Key, Value, Compare, Allocator>::put(const Key& key,
                                                        Value&& value) {
  require_key(key, "put");
  root_ = put_impl(root_, key, std::move(value));
  root_->color = Color::Black;
}

// put_impl
// The descent only reads; the new node is allocated at the bottom before any
// link or color changes, so a throwing allocation leaves the tree intact.
template <typename Key, typename Value, typename Compare, typename Allocator>
  requires ComparatorCompatible<Key, Compare>
template <typename V>
typename red_black_bst<Key, Value, Compare, Allocator>::Node*
red_black_bst<Key, Value, Compare, Allocator>::put_impl(Node* h,
                                                       const Key& key,
                                                       V&& value) {
  if (h == nullptr) {
    return allocate_node(key, std::forward<V>(value));
  }

  if (comp_(key, h->key)) {
    h->left = put_impl(h->left, key, std::forward<V>(value));
  } else if (comp_(h->key, key)) {
    h->right = put_impl(h->right, key, std::forward<V>(value));
  } else {
    h->value = std::forward<V>(value);
  }

  // Fix up any right-leaning links
  if (is_red(h->right) && !is_red(h->left)) {
    h = rotate_left(h);
  }
  if (is_red(h->left) && is_red(h->left->left)) {
    h = rotate_right(h);
  }
  if (is_red(h->left) && is_red(h->right)) {
    flip_colors(h);
  }
  h->size = 1 + node_size(h->left) + node_size(h->right);
  return h;
}

// find_node
template <typename Key, typename Value, typename Compare, typename Allocator>
  requires ComparatorCompatible<Key, Compare>
typename red_black_bst<Key, Value, Compare, Allocator>::Node*
red_black_bst<Key, Value, Compare, Allocator>::find_node(
    const Key& key) const {
  Node* node = root_;
  while (node != nullptr) {
    if (comp_(key, node->key)) {
      node = node->left;
    } else if (comp_(node->key, key)) {
      node = node->right;
    } else {
      return node;
    }
  }
  return nullptr;
}

// get
template <typename Key, typename Value, typename Compare, typename Allocator>
  requires ComparatorCompatible<Key, Compare>
std::optional<Value> red_black_bst<Key, Value, Compare, Allocator>::get(
    const Key& key) const {
  require_key(key, "get");
  const Node* node = find_node(key);
  if (node == nullptr) {
    return std::nullopt;
  }
  return node->value;
}

// at (non-const)
template <typename Key, typename Value, typename Compare, typename Allocator>
  requires ComparatorCompatible<Key, Compare>
Value& red_black_bst<Key, Value, Compare, Allocator>::at(const Key& key) {
  require_key(key, "at");
  Node* node = find_node(key);
  if (node == nullptr) {
    throw std::out_of_range("red_black_bst::at: key not found");
  }
  return node->value;
}

// at (const)
template <typename Key, typename Value, typename Compare, typename Allocator>
  requires ComparatorCompatible<Key, Compare>
const Value& red_black_bst<Key, Value, Compare, Allocator>::at(
    const Key& key) const {
  require_key(key, "at");
  const Node* node = find_node(key);
  if (node == nullptr) {
    throw std::out_of_range("red_black_bst::at: key not found");
  }
  return node->value;
}

// contains
template <typename Key, typename Value, typename Compare, typename Allocator>
  requires ComparatorCompatible<Key, Compare>
bool red_black_bst<Key, Value, Compare, Allocator>::contains(
    const Key& key) const {
  require_key(key, "contains");
  return find_node(key) != nullptr;
}

// erase (by key)
template <typename Key, typename Value, typename Compare, typename Allocator>
  requires ComparatorCompatible<Key, Compare>
typename red_black_bst<Key, Value, Compare, Allocator>::size_type
red_black_bst<Key, Value, Compare, Allocator>::erase(const Key& key) {
  require_key(key, "erase");
  // erase_impl relies on the key being present: every step towards it
  // assumes the child it descends into exists.
  if (find_node(key) == nullptr) {
    return 0;
  }

  // If both children of root are black, set root to red
  if (!is_red(root_->left) && !is_red(root_->right)) {
    root_->color = Color::Red;
  }
  root_ = erase_impl(root_, key);
  if (root_ != nullptr) {
    root_->color = Color::Black;
  }
  return 1;
}

// erase_impl
template <typename Key, typename Value, typename Compare, typename Allocator>
  requires ComparatorCompatible<Key, Compare>
typename red_black_bst<Key, Value, Compare, Allocator>::Node*
red_black_bst<Key, Value, Compare, Allocator>::erase_impl(Node* h,
                                                         const Key& key) {
  if (comp_(key, h->key)) {
    if (!is_red(h->left) && !is_red(h->left->left)) {
      h = move_red_left(h);
    }
    h->left = erase_impl(h->left, key);
  } else {
    if (is_red(h->left)) {
      h = rotate_right(h);
    }
    if (equal_keys(key, h->key) && h->right == nullptr) {
      deallocate_node(h);
      return nullptr;
    }
    if (!is_red(h->right) && !is_red(h->right->left)) {
      h = move_red_right(h);
    }
    if (equal_keys(key, h->key)) {
      // Take over the successor's element and unlink the successor instead.
      // erase_min_impl never compares keys, so moving out of it is safe.
      Node* successor = min_node(h->right);
      h->key = std::move(successor->key);
      h->value = std::move(successor->value);
      h->right = erase_min_impl(h->right);
    } else {
      h->right = erase_impl(h->right, key);
    }
  }
  return balance(h);
}

// erase_min
template <typename Key, typename Value, typename Compare, typename Allocator>
  requires ComparatorCompatible<Key, Compare>
void red_black_bst<Key, Value, Compare, Allocator>::erase_min() {
  require_non_empty("erase_min");

  // If both children of root are black, set root to red
  if (!is_red(root_->left) && !is_red(root_->right)) {
    root_->color = Color::Red;
  }
  root_ = erase_min_impl(root_);
  if (root_ != nullptr) {
    root_->color = Color::Black;
  }
}

// erase_min_impl
template <typename Key, typename Value, typename Compare, typename Allocator>
  requires ComparatorCompatible<Key, Compare>
typename red_black_bst<Key, Value, Compare, Allocator>::Node*
red_black_bst<Key, Value, Compare, Allocator>::erase_min_impl(Node* h) {
  // No left child means no right child either (left-leaning + balanced)
  if (h->left == nullptr) {
    deallocate_node(h);
    return nullptr;
  }
  if (!is_red(h->left) && !is_red(h->left->left)) {
    h = move_red_left(h);
  }
  h->left = erase_min_impl(h->left);
  return balance(h);
}

// erase_max
template <typename Key, typename Value, typename Compare, typename Allocator>
  requires ComparatorCompatible<Key, Compare>
void red_black_bst<Key, Value, Compare, Allocator>::erase_max() {
  require_non_empty("erase_max");

  // If both children of root are black, set root to red
  if (!is_red(root_->left) && !is_red(root_->right)) {
    root_->color = Color::Red;
  }
  root_ = erase_max_impl(root_);
  if (root_ != nullptr) {
    root_->color = Color::Black;
  }
}

// erase_max_impl
template <typename Key, typename Value, typename Compare, typename Allocator>
  requires ComparatorCompatible<Key, Compare>
typename red_black_bst<Key, Value, Compare, Allocator>::Node*
red_black_bst<Key, Value, Compare, Allocator>::erase_max_impl(Node* h) {
  if (is_red(h->left)) {
    h = rotate_right(h);
  }
  if (h->right == nullptr) {
    deallocate_node(h);
    return nullptr;
  }
  if (!is_red(h->right) && !is_red(h->right->left)) {
    h = move_red_right(h);
  }
  h->right = erase_max_impl(h->right);
  return balance(h);
}

// min_node
template <typename Key, typename Value, typename Compare, typename Allocator>
  requires ComparatorCompatible<Key, Compare>
typename red_black_bst<Key, Value, Compare, Allocator>::Node*
red_black_bst<Key, Value, Compare, Allocator>::min_node(Node* node) {
  while (node->left != nullptr) {
    node = node->left;
  }
  return node;
}

// max_node
template <typename Key, typename Value, typename Compare, typename Allocator>
  requires ComparatorCompatible<Key, Compare>
typename red_black_bst<Key, Value, Compare, Allocator>::Node*
red_black_bst<Key, Value, Compare, Allocator>::max_node(Node* node) {
  while (node->right != nullptr) {
    node = node->right;
  }
  return node;
}

// min
template <typename Key, typename Value, typename Compare, typename Allocator>
  requires ComparatorCompatible<Key, Compare>
const Key& red_black_bst<Key, Value, Compare, Allocator>::min() const {
  require_non_empty("min");
  return min_node(root_)->key;
}

// max
template <typename Key, typename Value, typename Compare, typename Allocator>
  requires ComparatorCompatible<Key, Compare>
const Key& red_black_bst<Key, Value, Compare, Allocator>::max() const {
  require_non_empty("max");
  return max_node(root_)->key;
}

// floor
template <typename Key, typename Value, typename Compare, typename Allocator>
  requires ComparatorCompatible<Key, Compare>
const Key& red_black_bst<Key, Value, Compare, Allocator>::floor(
    const Key& key) const {
  require_key(key, "floor");
  require_non_empty("floor");
  const Node* node = floor_node(root_, key);
  if (node == nullptr) {
    throw key_not_found("red_black_bst::floor: argument is too small");
  }
  return node->key;
}

// floor_node
template <typename Key, typename Value, typename Compare, typename Allocator>
  requires ComparatorCompatible<Key, Compare>
typename red_black_bst<Key, Value, Compare, Allocator>::Node*
red_black_bst<Key, Value, Compare, Allocator>::floor_node(
    Node* node, const Key& key) const {
  if (node == nullptr) {
    return nullptr;
  }
  if (comp_(key, node->key)) {
    return floor_node(node->left, key);
  }
  if (!comp_(node->key, key)) {
    return node;
  }
  // node is a candidate; a larger one may still sit in the right subtree
  Node* candidate = floor_node(node->right, key);
  return candidate != nullptr ? candidate : node;
}

// ceil
template <typename Key, typename Value, typename Compare, typename Allocator>
  requires ComparatorCompatible<Key, Compare>
const Key& red_black_bst<Key, Value, Compare, Allocator>::ceil(
    const Key& key) const {
  require_key(key, "ceil");
  require_non_empty("ceil");
  const Node* node = ceil_node(root_, key);
  if (node == nullptr) {
    throw key_not_found("red_black_bst::ceil: argument is too large");
  }
  return node->key;
}

// ceil_node
template <typename Key, typename Value, typename Compare, typename Allocator>
  requires ComparatorCompatible<Key, Compare>
typename red_black_bst<Key, Value, Compare, Allocator>::Node*
red_black_bst<Key, Value, Compare, Allocator>::ceil_node(
    Node* node, const Key& key) const {
  if (node == nullptr) {
    return nullptr;
  }
  if (comp_(node->key, key)) {
    return ceil_node(node->right, key);
  }
  if (!comp_(key, node->key)) {
    return node;
  }
  Node* candidate = ceil_node(node->left, key);
  return candidate != nullptr ? candidate : node;
}

// rank
template <typename Key, typename Value, typename Compare, typename Allocator>
  requires ComparatorCompatible<Key, Compare>
typename red_black_bst<Key, Value, Compare, Allocator>::size_type
red_black_bst<Key, Value, Compare, Allocator>::rank(const Key& key) const {
  require_key(key, "rank");
  return rank_impl(root_, key);
}

// rank_impl
template <typename Key, typename Value, typename Compare, typename Allocator>
  requires ComparatorCompatible<Key, Compare>
typename red_black_bst<Key, Value, Compare, Allocator>::size_type
red_black_bst<Key, Value, Compare, Allocator>::rank_impl(
    const Node* node, const Key& key) const {
  if (node == nullptr) {
    return 0;
  }
  if (comp_(key, node->key)) {
    return rank_impl(node->left, key);
  }
  if (comp_(node->key, key)) {
    return 1 + node_size(node->left) + rank_impl(node->right, key);
  }
  return node_size(node->left);
}

// select
template <typename Key, typename Value, typename Compare, typename Allocator>
  requires ComparatorCompatible<Key, Compare>
const Key& red_black_bst<Key, Value, Compare, Allocator>::select(
    size_type rank) const {
  if (rank >= size()) {
    throw std::out_of_range("red_black_bst::select: rank out of range");
  }

  const Node* node = root_;
  while (true) {
    const size_type left_size = node_size(node->left);
    if (rank < left_size) {
      node = node->left;
    } else if (rank > left_size) {
      // Skip the left subtree and this node
      rank -= left_size + 1;
      node = node->right;
    } else {
      return node->key;
    }
  }
}

// keys
template <typename Key, typename Value, typename Compare, typename Allocator>
  requires ComparatorCompatible<Key, Compare>
std::vector<Key> red_black_bst<Key, Value, Compare, Allocator>::keys() const {
  if (empty()) {
    return {};
  }
  return range_keys(min(), max());
}

// range_keys
template <typename Key, typename Value, typename Compare, typename Allocator>
  requires ComparatorCompatible<Key, Compare>
std::vector<Key> red_black_bst<Key, Value, Compare, Allocator>::range_keys(
    const Key& lo, const Key& hi) const {
  require_key(lo, "range_keys");
  require_key(hi, "range_keys");
  std::vector<Key> out;
  if (comp_(hi, lo)) {
    return out;
  }
  collect_keys(root_, out, lo, hi);
  return out;
}

// collect_keys - in-order walk pruned to [lo, hi]
template <typename Key, typename Value, typename Compare, typename Allocator>
  requires ComparatorCompatible<Key, Compare>
void red_black_bst<Key, Value, Compare, Allocator>::collect_keys(
    const Node* node, std::vector<Key>& out, const Key& lo,
    const Key& hi) const {
  if (node == nullptr) {
    return;
  }
  const bool above_lo = comp_(lo, node->key);
  const bool below_hi = comp_(node->key, hi);
  if (above_lo) {
    collect_keys(node->left, out, lo, hi);
  }
  if (!comp_(node->key, lo) && !comp_(hi, node->key)) {
    out.push_back(node->key);
  }
  if (below_hi) {
    collect_keys(node->right, out, lo, hi);
  }
}

// key_size
template <typename Key, typename Value, typename Compare, typename Allocator>
  requires ComparatorCompatible<Key, Compare>
typename red_black_bst<Key, Value, Compare, Allocator>::size_type
red_black_bst<Key, Value, Compare, Allocator>::key_size(const Key& lo,
                                                       const Key& hi) const {
  require_key(lo, "key_size");
  require_key(hi, "key_size");
  if (comp_(hi, lo)) {
    return 0;
  }
  if (contains(hi)) {
    return rank(hi) - rank(lo) + 1;
  }
  return rank(hi) - rank(lo);
}

// height
template <typename Key, typename Value, typename Compare, typename Allocator>
  requires ComparatorCompatible<Key, Compare>
int red_black_bst<Key, Value, Compare, Allocator>::height() const {
  return height_impl(root_);
}

// height_impl
template <typename Key, typename Value, typename Compare, typename Allocator>
  requires ComparatorCompatible<Key, Compare>
int red_black_bst<Key, Value, Compare, Allocator>::height_impl(
    const Node* node) {
  if (node == nullptr) {
    return -1;
  }
  return 1 + std::max(height_impl(node->left), height_impl(node->right));
}

// level_order
template <typename Key, typename Value, typename Compare, typename Allocator>
  requires ComparatorCompatible<Key, Compare>
std::vector<std::vector<Key>>
red_black_bst<Key, Value, Compare, Allocator>::level_order() const {
  std::vector<std::vector<Key>> levels;
  if (root_ == nullptr) {
    return levels;
  }

  std::queue<const Node*> queue;
  queue.push(root_);
  while (!queue.empty()) {
    // Everything currently queued belongs to the same level
    std::vector<Key> level;
    level.reserve(queue.size());
    for (size_type remaining = queue.size(); remaining > 0; --remaining) {
      const Node* node = queue.front();
      queue.pop();
      level.push_back(node->key);
      if (node->left != nullptr) {
        queue.push(node->left);
      }
      if (node->right != nullptr) {
        queue.push(node->right);
      }
    }
    levels.push_back(std::move(level));
  }
  return levels;
}

// for_each
template <typename Key, typename Value, typename Compare, typename Allocator>
  requires ComparatorCompatible<Key, Compare>
template <typename Fn>
void red_black_bst<Key, Value, Compare, Allocator>::for_each(Fn&& fn) const {
  for_each_impl(root_, fn);
}

// for_each_impl
template <typename Key, typename Value, typename Compare, typename Allocator>
  requires ComparatorCompatible<Key, Compare>
template <typename Fn>
void red_black_bst<Key, Value, Compare, Allocator>::for_each_impl(
    const Node* node, Fn& fn) {
  if (node == nullptr) {
    return;
  }
  for_each_impl(node->left, fn);
  fn(node->key, node->value);
  for_each_impl(node->right, fn);
}

// is_bst
template <typename Key, typename Value, typename Compare, typename Allocator>
  requires ComparatorCompatible<Key, Compare>
bool red_black_bst<Key, Value, Compare, Allocator>::is_bst() const {
  return is_bst_impl(root_, nullptr, nullptr);
}

// is_bst_impl - every key strictly between lo and hi (null means unbounded)
template <typename Key, typename Value, typename Compare, typename Allocator>
  requires ComparatorCompatible<Key, Compare>
bool red_black_bst<Key, Value, Compare, Allocator>::is_bst_impl(
    const Node* node, const Key* lo, const Key* hi) const {
  if (node == nullptr) {
    return true;
  }
  if (lo != nullptr && !comp_(*lo, node->key)) {
    return false;
  }
  if (hi != nullptr && !comp_(node->key, *hi)) {
    return false;
  }
  return is_bst_impl(node->left, lo, &node->key) &&
         is_bst_impl(node->right, &node->key, hi);
}

// count_check
template <typename Key, typename Value, typename Compare, typename Allocator>
  requires ComparatorCompatible<Key, Compare>
bool red_black_bst<Key, Value, Compare, Allocator>::count_check() const {
  return count_check_impl(root_);
}

// count_check_impl
template <typename Key, typename Value, typename Compare, typename Allocator>
  requires ComparatorCompatible<Key, Compare>
bool red_black_bst<Key, Value, Compare, Allocator>::count_check_impl(
    const Node* node) {
  if (node == nullptr) {
    return true;
  }
  if (node->size != 1 + node_size(node->left) + node_size(node->right)) {
    return false;
  }
  return count_check_impl(node->left) && count_check_impl(node->right);
}

// rank_check
template <typename Key, typename Value, typename Compare, typename Allocator>
  requires ComparatorCompatible<Key, Compare>
bool red_black_bst<Key, Value, Compare, Allocator>::rank_check() const {
  for (size_type i = 0; i < size(); ++i) {
    if (rank(select(i)) != i) {
      return false;
    }
  }
  for (const auto& key : keys()) {
    if (!equal_keys(select(rank(key)), key)) {
      return false;
    }
  }
  return true;
}

// is_23
template <typename Key, typename Value, typename Compare, typename Allocator>
  requires ComparatorCompatible<Key, Compare>
bool red_black_bst<Key, Value, Compare, Allocator>::is_23() const {
  return is_23_impl(root_);
}

// is_23_impl
template <typename Key, typename Value, typename Compare, typename Allocator>
  requires ComparatorCompatible<Key, Compare>
bool red_black_bst<Key, Value, Compare, Allocator>::is_23_impl(
    const Node* node) const {
  if (node == nullptr) {
    return true;
  }
  if (is_red(node->right)) {
    return false;
  }
  if (node != root_ && is_red(node) && is_red(node->left)) {
    return false;
  }
  return is_23_impl(node->left) && is_23_impl(node->right);
}

// is_balanced
template <typename Key, typename Value, typename Compare, typename Allocator>
  requires ComparatorCompatible<Key, Compare>
bool red_black_bst<Key, Value, Compare, Allocator>::is_balanced() const {
  // Number of black links on the path from the root to the minimum
  int black = 0;
  for (const Node* node = root_; node != nullptr; node = node->left) {
    if (!is_red(node)) {
      ++black;
    }
  }
  return is_balanced_impl(root_, black);
}

// is_balanced_impl
template <typename Key, typename Value, typename Compare, typename Allocator>
  requires ComparatorCompatible<Key, Compare>
bool red_black_bst<Key, Value, Compare, Allocator>::is_balanced_impl(
    const Node* node, int black) {
  if (node == nullptr) {
    return black == 0;
  }
  if (!is_red(node)) {
    --black;
  }
  return is_balanced_impl(node->left, black) &&
         is_balanced_impl(node->right, black);
}

// check
template <typename Key, typename Value, typename Compare, typename Allocator>
  requires ComparatorCompatible<Key, Compare>
bool red_black_bst<Key, Value, Compare, Allocator>::check() const {
  return !is_red(root_) && is_bst() && count_check() && rank_check() &&
         is_23() && is_balanced();
}

}  // namespace symbol_tables
