#include "persistent_tree_map.hpp"
#include <algorithm>
#include "debug_log.hpp"
#include "errors.hpp"

namespace pcoll {

using NodeRef = TreeNode::Ptr;

namespace {

// Red-black helpers. Nodes are immutable: every "change" builds a new node
// that shares the untouched children.

bool isRed(const NodeRef& node) {
    return node && node->isRed();
}

Color flip(Color c) {
    return c == Color::RED ? Color::BLACK : Color::RED;
}

NodeRef makeTreeNode(const Value& key, const Value& val, Color color, NodeRef left, NodeRef right) {
    return makeNode<TreeNode>(key, val, color, std::move(left), std::move(right));
}

NodeRef withColor(const NodeRef& h, Color color) {
    if (h->color == color) return h;
    return makeTreeNode(h->key, h->value, color, h->left, h->right);
}

NodeRef withLeft(const NodeRef& h, NodeRef left) {
    return makeTreeNode(h->key, h->value, h->color, std::move(left), h->right);
}

NodeRef withRight(const NodeRef& h, NodeRef right) {
    return makeTreeNode(h->key, h->value, h->color, h->left, std::move(right));
}

NodeRef rotateLeft(const NodeRef& h) {
    const NodeRef& x = h->right;
    return makeTreeNode(x->key, x->value, h->color,
                        makeTreeNode(h->key, h->value, Color::RED, h->left, x->left),
                        x->right);
}

NodeRef rotateRight(const NodeRef& h) {
    const NodeRef& x = h->left;
    return makeTreeNode(x->key, x->value, h->color,
                        x->left,
                        makeTreeNode(h->key, h->value, Color::RED, x->right, h->right));
}

NodeRef flipColors(const NodeRef& h) {
    return makeTreeNode(h->key, h->value, flip(h->color),
                        h->left ? withColor(h->left, flip(h->left->color)) : NodeRef(),
                        h->right ? withColor(h->right, flip(h->right->color)) : NodeRef());
}

// Restore the left-leaning invariants on the way back up
NodeRef balance(NodeRef h) {
    // Right-leaning red - rotate left
    if (isRed(h->right) && !isRed(h->left)) {
        h = rotateLeft(h);
    }
    // Two reds in a row on left - rotate right
    if (isRed(h->left) && isRed(h->left->left)) {
        h = rotateRight(h);
    }
    // Both children red - flip colors
    if (isRed(h->left) && isRed(h->right)) {
        h = flipColors(h);
    }
    return h;
}

NodeRef moveRedLeft(NodeRef h) {
    h = flipColors(h);
    if (h->right && isRed(h->right->left)) {
        h = withRight(h, rotateRight(h->right));
        h = rotateLeft(h);
        h = flipColors(h);
    }
    return h;
}

NodeRef moveRedRight(NodeRef h) {
    h = flipColors(h);
    if (h->left && isRed(h->left->left)) {
        h = rotateRight(h);
        h = flipColors(h);
    }
    return h;
}

const TreeNode* findMin(const TreeNode* node) {
    while (node && node->left) {
        node = node->left.get();
    }
    return node;
}

const TreeNode* findMax(const TreeNode* node) {
    while (node && node->right) {
        node = node->right.get();
    }
    return node;
}

NodeRef removeMin(NodeRef h) {
    if (!h->left) {
        return NodeRef();
    }
    if (!isRed(h->left) && !isRed(h->left->left)) {
        h = moveRedLeft(h);
    }
    h = withLeft(h, removeMin(h->left));
    return balance(h);
}

size_t heightOf(const TreeNode* node) {
    if (!node) return 0;
    return 1 + std::max(heightOf(node->left.get()), heightOf(node->right.get()));
}

// Black height of the subtree, or -1 when a color rule is broken below it
int checkColors(const TreeNode* node) {
    if (!node) return 1;
    if (isRed(node->right)) return -1;
    if (node->isRed() && isRed(node->left)) return -1;

    int left = checkColors(node->left.get());
    int right = checkColors(node->right.get());
    if (left < 0 || right < 0 || left != right) return -1;
    return left + (node->isBlack() ? 1 : 0);
}

}  // namespace

//=============================================================================
// TreeSeq
//=============================================================================

SeqPtr TreeSeq::create(TreeNode::Ptr root, ComparatorPtr cmp, const Range& range,
                       bool ascending, Mode mode, size_t knownCount) {
    const std::optional<Bound>& start = ascending ? range.lower : range.upper;

    // Seek: the stack ends at the first node inside the start bound
    std::vector<const TreeNode*> stack;
    for (const TreeNode* node = root.get(); node;) {
        bool inside = true;
        if (start) {
            int c = (*cmp)(node->key, start->key);
            if (ascending) {
                inside = start->inclusive ? c >= 0 : c > 0;
            } else {
                inside = start->inclusive ? c <= 0 : c < 0;
            }
        }

        if (inside) {
            stack.push_back(node);
            node = ascending ? node->left.get() : node->right.get();
        } else {
            node = ascending ? node->right.get() : node->left.get();
        }
    }

    if (stack.empty()) {
        return nullptr;
    }

    auto seq = std::make_shared<const TreeSeq>(std::move(root), std::move(cmp), std::move(stack),
                                               ascending ? range.upper : range.lower,
                                               ascending, mode, knownCount);
    if (seq->pastStop(seq->stack_.back())) {
        return nullptr;
    }
    return seq;
}

void TreeSeq::pushSpine(std::vector<const TreeNode*>& stack, const TreeNode* node) const {
    while (node) {
        stack.push_back(node);
        node = ascending_ ? node->left.get() : node->right.get();
    }
}

bool TreeSeq::pastStop(const TreeNode* node) const {
    if (!stop_) {
        return false;
    }
    int c = (*cmp_)(node->key, stop_->key);
    if (ascending_) {
        return stop_->inclusive ? c > 0 : c >= 0;
    }
    return stop_->inclusive ? c < 0 : c <= 0;
}

Value TreeSeq::first() const {
    const TreeNode* node = stack_.back();
    switch (mode_) {
        case Mode::KEYS: return node->key;
        case Mode::VALUES: return node->value;
        case Mode::ENTRIES: break;
    }
    return MapEntry(node->key, node->value).toValue();
}

SeqPtr TreeSeq::next() const {
    std::vector<const TreeNode*> stack = stack_;
    const TreeNode* current = stack.back();
    stack.pop_back();
    pushSpine(stack, ascending_ ? current->right.get() : current->left.get());

    if (stack.empty() || pastStop(stack.back())) {
        return nullptr;
    }
    return std::make_shared<const TreeSeq>(root_, cmp_, std::move(stack), stop_, ascending_, mode_,
                                           knownCount_ == NO_COUNT ? NO_COUNT : knownCount_ - 1);
}

size_t TreeSeq::count() const {
    // Bounded ranges do not know their length up front
    return knownCount_ != NO_COUNT ? knownCount_ : ASeq::count();
}

//=============================================================================
// PersistentTreeMap
//=============================================================================

PersistentTreeMap::PersistentTreeMap()
    : cmp_(defaultComparator()), root_(nullptr), count_(0) {}

PersistentTreeMap::PersistentTreeMap(ComparatorPtr cmp)
    : cmp_(std::move(cmp)), root_(nullptr), count_(0) {
    if (!cmp_) {
        throw std::invalid_argument("PersistentTreeMap requires a comparator");
    }
}

PersistentTreeMap::PersistentTreeMap(ComparatorPtr cmp, TreeNode::Ptr root, size_t count)
    : cmp_(std::move(cmp)), root_(std::move(root)), count_(count) {}

// Core operations

PersistentTreeMap PersistentTreeMap::assoc(const Value& key, const Value& val) const {
    bool inserted = false;
    NodeRef newRoot = insert(root_, key, val, inserted);
    if (newRoot == root_) {
        return *this;
    }

    // Ensure root is black
    if (newRoot->isRed()) {
        PCOLL_TRACE("PersistentTreeMap", "fixing root color from RED to BLACK");
        newRoot = withColor(newRoot, Color::BLACK);
    }

    return PersistentTreeMap(cmp_, std::move(newRoot), inserted ? count_ + 1 : count_);
}

TreeNode::Ptr PersistentTreeMap::insert(const TreeNode::Ptr& node, const Value& key,
                                        const Value& val, bool& inserted) const {
    if (!node) {
        inserted = true;
        return makeTreeNode(key, val, Color::RED, NodeRef(), NodeRef());
    }

    int cmp = compareKeys(key, node->key);
    NodeRef h;

    if (cmp < 0) {
        NodeRef newLeft = insert(node->left, key, val, inserted);
        if (newLeft == node->left) return node;
        h = withLeft(node, std::move(newLeft));
    } else if (cmp > 0) {
        NodeRef newRight = insert(node->right, key, val, inserted);
        if (newRight == node->right) return node;
        h = withRight(node, std::move(newRight));
    } else {
        // Key exists, update value (the stored key is kept)
        if (node->value.identical(val)) return node;
        h = makeTreeNode(node->key, val, node->color, node->left, node->right);
    }

    return balance(std::move(h));
}

PersistentTreeMap PersistentTreeMap::dissoc(const Value& key) const {
    if (!root_ || !findNode(key)) {
        return *this;
    }

    NodeRef newRoot = root_;
    if (!isRed(newRoot->left) && !isRed(newRoot->right)) {
        newRoot = withColor(newRoot, Color::RED);
    }

    bool removed = false;
    newRoot = remove(std::move(newRoot), key, removed);
    if (!removed) {
        return *this;
    }

    // Ensure root is black
    if (newRoot && newRoot->isRed()) {
        newRoot = withColor(newRoot, Color::BLACK);
    }
    return PersistentTreeMap(cmp_, std::move(newRoot), count_ - 1);
}

TreeNode::Ptr PersistentTreeMap::remove(TreeNode::Ptr h, const Value& key, bool& removed) const {
    if (!h) {
        return h;
    }

    if (compareKeys(key, h->key) < 0) {
        if (!h->left) {
            return h;
        }
        if (!isRed(h->left) && !isRed(h->left->left)) {
            h = moveRedLeft(h);
        }
        h = withLeft(h, remove(h->left, key, removed));
    } else {
        if (isRed(h->left)) {
            h = rotateRight(h);
        }
        if (compareKeys(key, h->key) == 0 && !h->right) {
            removed = true;
            return NodeRef();
        }
        if (!h->right) {
            return balance(std::move(h));
        }
        if (!isRed(h->right) && !isRed(h->right->left)) {
            h = moveRedRight(h);
        }
        if (compareKeys(key, h->key) == 0) {
            // Replace with the successor, then drop the successor below
            removed = true;
            const TreeNode* successor = findMin(h->right.get());
            h = makeTreeNode(successor->key, successor->value, h->color, h->left, removeMin(h->right));
        } else {
            h = withRight(h, remove(h->right, key, removed));
        }
    }

    return balance(std::move(h));
}

const TreeNode* PersistentTreeMap::findNode(const Value& key) const {
    const TreeNode* node = root_.get();
    while (node) {
        int cmp = compareKeys(key, node->key);
        if (cmp < 0) {
            node = node->left.get();
        } else if (cmp > 0) {
            node = node->right.get();
        } else {
            return node;
        }
    }
    return nullptr;
}

Value PersistentTreeMap::get(const Value& key, const Value& default_val) const {
    const TreeNode* node = findNode(key);
    return node ? node->value : default_val;
}

std::optional<MapEntry> PersistentTreeMap::find(const Value& key) const {
    const TreeNode* node = findNode(key);
    if (!node) {
        return std::nullopt;
    }
    return MapEntry(node->key, node->value);
}

bool PersistentTreeMap::contains(const Value& key) const {
    return findNode(key) != nullptr;
}

// Ordered operations

MapEntry PersistentTreeMap::first() const {
    if (!root_) throw IllegalStateError("first() called on empty map");
    const TreeNode* min = findMin(root_.get());
    return MapEntry(min->key, min->value);
}

MapEntry PersistentTreeMap::last() const {
    if (!root_) throw IllegalStateError("last() called on empty map");
    const TreeNode* max = findMax(root_.get());
    return MapEntry(max->key, max->value);
}

SeqPtr PersistentTreeMap::subseq(const std::optional<Bound>& lower,
                                 const std::optional<Bound>& upper) const {
    return rangeView(lower, upper, true);
}

SeqPtr PersistentTreeMap::rsubseq(const std::optional<Bound>& lower,
                                  const std::optional<Bound>& upper) const {
    return rangeView(lower, upper, false);
}

SeqPtr PersistentTreeMap::rangeView(const std::optional<Bound>& lower,
                                    const std::optional<Bound>& upper, bool ascending) const {
    size_t known = (!lower && !upper) ? count_ : TreeSeq::NO_COUNT;
    return TreeSeq::create(root_, cmp_, {lower, upper}, ascending, TreeSeq::Mode::ENTRIES, known);
}

SeqPtr PersistentTreeMap::keyRange(const std::optional<Bound>& lower,
                                   const std::optional<Bound>& upper, bool ascending) const {
    size_t known = (!lower && !upper) ? count_ : TreeSeq::NO_COUNT;
    return TreeSeq::create(root_, cmp_, {lower, upper}, ascending, TreeSeq::Mode::KEYS, known);
}

SeqPtr PersistentTreeMap::seq() const {
    return TreeSeq::create(root_, cmp_, {}, true, TreeSeq::Mode::ENTRIES, count_);
}

SeqPtr PersistentTreeMap::reverseSeq() const {
    return TreeSeq::create(root_, cmp_, {}, false, TreeSeq::Mode::ENTRIES, count_);
}

SeqPtr PersistentTreeMap::keys() const {
    return TreeSeq::create(root_, cmp_, {}, true, TreeSeq::Mode::KEYS, count_);
}

SeqPtr PersistentTreeMap::vals() const {
    return TreeSeq::create(root_, cmp_, {}, true, TreeSeq::Mode::VALUES, count_);
}

Value PersistentTreeMap::conjoin(const Value& x) const {
    PersistentTreeMap result = *this;
    for (const MapEntry& entry : entriesForConjoin(x)) {
        result = result.assoc(entry.key, entry.value);
    }
    return Value::wrap(std::move(result));
}

// Structure

size_t PersistentTreeMap::height() const {
    return heightOf(root_.get());
}

bool PersistentTreeMap::verifyInvariants() const {
    if (isRed(root_) || checkColors(root_.get()) < 0) {
        return false;
    }

    // In-order keys strictly increasing under the comparator
    const TreeNode* prev = nullptr;
    std::vector<const TreeNode*> stack;
    const TreeNode* node = root_.get();
    size_t seen = 0;
    while (node || !stack.empty()) {
        while (node) {
            stack.push_back(node);
            node = node->left.get();
        }
        node = stack.back();
        stack.pop_back();
        if (prev && compareKeys(prev->key, node->key) >= 0) {
            return false;
        }
        prev = node;
        ++seen;
        node = node->right.get();
    }
    return seen == count_;
}

// Equality

bool PersistentTreeMap::operator==(const PersistentTreeMap& other) const {
    if (count_ != other.count_) return false;
    if (root_ == other.root_) return true;
    return equals(other);
}

// Factory methods

PersistentTreeMap PersistentTreeMap::of(std::initializer_list<MapEntry> entries, ComparatorPtr cmp) {
    PersistentTreeMap result(std::move(cmp));
    for (const MapEntry& entry : entries) {
        result = result.assoc(entry.key, entry.value);
    }
    return result;
}

PersistentTreeMap PersistentTreeMap::fromEntries(const std::vector<MapEntry>& entries, ComparatorPtr cmp) {
    PersistentTreeMap result(std::move(cmp));
    for (const MapEntry& entry : entries) {
        result = result.assoc(entry.key, entry.value);
    }
    return result;
}

}  // namespace pcoll
