#pragma once

/**
 * Arbor Decision Tree
 *
 * Binary classification tree induced by recursive information-gain splits.
 * Nodes live in one flat array owned by the tree: root at index 0, each
 * internal node followed by its match subtree, then its not-match subtree.
 */

#include "types.hpp"
#include "config.hpp"
#include "record.hpp"
#include "rule.hpp"
#include "split.hpp"
#include <iosfwd>
#include <optional>
#include <string>
#include <vector>

namespace arbor {

// ============================================================================
// Tree Node
// ============================================================================

/**
 * Leaf: category set, no rule, no children.
 * Internal: rule set, null category, both children set.
 */
struct DecisionNode {
    std::optional<Rule> rule;
    Category category;
    NodeIndex match_child = 0;
    NodeIndex not_match_child = 0;

    bool is_leaf() const { return !rule.has_value(); }

    bool operator==(const DecisionNode& other) const {
        return rule == other.rule &&
               category == other.category &&
               match_child == other.match_child &&
               not_match_child == other.not_match_child;
    }
    bool operator!=(const DecisionNode& other) const { return !(*this == other); }
};

// ============================================================================
// Traversal
// ============================================================================

enum class Branch : uint8_t {
    Root = 0,
    Match = 1,
    NotMatch = 2
};

/**
 * Pre-order visitor; the match subtree is visited before the not-match one.
 */
class TreeVisitor {
public:
    virtual ~TreeVisitor() = default;
    virtual void visit_internal(const DecisionNode& node, uint32_t depth, Branch branch) = 0;
    virtual void visit_leaf(const DecisionNode& node, uint32_t depth, Branch branch) = 0;
};

// ============================================================================
// Decision Tree
// ============================================================================

class DecisionTree {
public:
    DecisionTree() = default;

    /**
     * Induce a tree from labeled records.
     * An empty item set yields a single leaf with a null category.
     */
    static DecisionTree build(const RecordSet& items, const TreeConfig& config);
    static DecisionTree build(const RecordRefs& items, const TreeConfig& config);

    // Manual construction
    static DecisionTree leaf(Category category);
    static DecisionTree internal(Rule rule, const DecisionTree& match,
                                 const DecisionTree& not_match);

    // Walk from the root to a leaf; throws std::logic_error on an empty tree
    Category classify(const Record& record) const;

    // Classify many records (OpenMP-parallel when available)
    std::vector<Category> classify_batch(const RecordSet& records) const;

    /**
     * Collapse internal nodes whose children are leaves of one category.
     * Classification is unchanged and a second call is a no-op.
     */
    DecisionTree& merge_redundant_rules();

    void accept(TreeVisitor& visitor) const;

    // Structure
    bool empty() const { return nodes_.empty(); }
    bool is_leaf() const { return !empty() && root().is_leaf(); }
    const DecisionNode& root() const { return node(0); }
    const DecisionNode& node(NodeIndex idx) const;
    const std::vector<DecisionNode>& nodes() const { return nodes_; }
    size_t n_nodes() const { return nodes_.size(); }
    size_t n_leaves() const;
    uint32_t depth() const;

    // Indented rule listing
    std::string to_string() const;

    bool operator==(const DecisionTree& other) const { return nodes_ == other.nodes_; }
    bool operator!=(const DecisionTree& other) const { return nodes_ != other.nodes_; }

private:
    std::vector<DecisionNode> nodes_;

    NodeIndex add_node();
    void make_leaf(NodeIndex node_idx, const CategoryCounts& counts);

    void build_recursive(
        NodeIndex node_idx,
        const RecordRefs& items,
        const TreeConfig& config,
        const SplitFinder& finder
    );

    // Returns true if the subtree at node_idx is now a leaf
    bool merge_recursive(NodeIndex node_idx);

    // Re-lay out reachable nodes in pre-order, dropping orphans
    void compact();
    NodeIndex copy_subtree(const DecisionTree& source, NodeIndex idx);
};

// ============================================================================
// Visitors
// ============================================================================

class TreeStats : public TreeVisitor {
public:
    static TreeStats of(const DecisionTree& tree);

    void visit_internal(const DecisionNode& node, uint32_t depth, Branch branch) override;
    void visit_leaf(const DecisionNode& node, uint32_t depth, Branch branch) override;

    size_t n_nodes() const { return n_internal_ + n_leaves_; }
    size_t n_internal() const { return n_internal_; }
    size_t n_leaves() const { return n_leaves_; }
    uint32_t depth() const { return depth_; }

    // Leaf count per category
    const CategoryCounts& leaf_categories() const { return leaf_categories_; }

private:
    size_t n_internal_ = 0;
    size_t n_leaves_ = 0;
    uint32_t depth_ = 0;
    CategoryCounts leaf_categories_;
};

class TreePrinter : public TreeVisitor {
public:
    explicit TreePrinter(std::ostream& out, int indent = 2) : out_(out), indent_(indent) {}

    void visit_internal(const DecisionNode& node, uint32_t depth, Branch branch) override;
    void visit_leaf(const DecisionNode& node, uint32_t depth, Branch branch) override;

private:
    std::ostream& out_;
    int indent_;

    void write_prefix(uint32_t depth, Branch branch);
};

} // namespace arbor
