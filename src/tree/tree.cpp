/**
 * Arbor Decision Tree Implementation
 */

#include "arbor/tree.hpp"
#include <algorithm>
#include <exception>
#include <ostream>
#include <sstream>
#include <stack>
#include <stdexcept>
#include <tuple>

namespace arbor {

// ============================================================================
// Induction
// ============================================================================

DecisionTree DecisionTree::build(const RecordSet& items, const TreeConfig& config) {
    return build(make_refs(items), config);
}

DecisionTree DecisionTree::build(const RecordRefs& items, const TreeConfig& config) {
    DecisionTree tree;
    SplitFinder finder(config);
    NodeIndex root = tree.add_node();
    tree.build_recursive(root, items, config, finder);
    return tree;
}

NodeIndex DecisionTree::add_node() {
    nodes_.emplace_back();
    return static_cast<NodeIndex>(nodes_.size() - 1);
}

void DecisionTree::make_leaf(NodeIndex node_idx, const CategoryCounts& counts) {
    DecisionNode& node = nodes_[node_idx];
    node.rule.reset();
    node.category = most_frequent_category(counts);
    node.match_child = 0;
    node.not_match_child = 0;
}

void DecisionTree::build_recursive(
    NodeIndex node_idx,
    const RecordRefs& items,
    const TreeConfig& config,
    const SplitFinder& finder
) {
    CategoryCounts counts = count_categories(items);

    if (items.size() <= config.min_leaf_size) {
        make_leaf(node_idx, counts);
        return;
    }

    // Pure node
    double initial_entropy = entropy(counts);
    if (initial_entropy == 0.0) {
        make_leaf(node_idx, counts);
        return;
    }

    std::optional<SplitResult> best_split = finder.find_best_split(items, initial_entropy);
    if (!best_split) {
        make_leaf(node_idx, counts);
        return;
    }

    // Children are appended right after the parent (pre-order layout)
    NodeIndex match_child = add_node();
    build_recursive(match_child, best_split->matched, config, finder);
    NodeIndex not_match_child = add_node();
    build_recursive(not_match_child, best_split->not_matched, config, finder);

    DecisionNode& node = nodes_[node_idx];
    node.rule = std::move(best_split->rule);
    node.category = Category();
    node.match_child = match_child;
    node.not_match_child = not_match_child;
}

// ============================================================================
// Manual Construction
// ============================================================================

DecisionTree DecisionTree::leaf(Category category) {
    DecisionTree tree;
    NodeIndex root = tree.add_node();
    tree.nodes_[root].category = std::move(category);
    return tree;
}

DecisionTree DecisionTree::internal(Rule rule, const DecisionTree& match,
                                    const DecisionTree& not_match) {
    if (match.empty() || not_match.empty()) {
        throw std::invalid_argument("internal node requires two non-empty subtrees");
    }

    DecisionTree tree;
    NodeIndex root = tree.add_node();
    NodeIndex match_child = tree.copy_subtree(match, 0);
    NodeIndex not_match_child = tree.copy_subtree(not_match, 0);

    DecisionNode& node = tree.nodes_[root];
    node.rule = std::move(rule);
    node.match_child = match_child;
    node.not_match_child = not_match_child;
    return tree;
}

NodeIndex DecisionTree::copy_subtree(const DecisionTree& source, NodeIndex idx) {
    const DecisionNode& src = source.node(idx);
    NodeIndex out = add_node();
    nodes_[out].rule = src.rule;
    nodes_[out].category = src.category;

    if (!src.is_leaf()) {
        NodeIndex match_child = copy_subtree(source, src.match_child);
        NodeIndex not_match_child = copy_subtree(source, src.not_match_child);
        nodes_[out].match_child = match_child;
        nodes_[out].not_match_child = not_match_child;
    }
    return out;
}

const DecisionNode& DecisionTree::node(NodeIndex idx) const {
    if (idx >= nodes_.size()) {
        throw std::out_of_range("node index " + std::to_string(idx) +
                                " out of range (" + std::to_string(nodes_.size()) + " nodes)");
    }
    return nodes_[idx];
}

// ============================================================================
// Classification
// ============================================================================

Category DecisionTree::classify(const Record& record) const {
    if (nodes_.empty()) {
        throw std::logic_error("classify called on an empty tree");
    }

    NodeIndex idx = 0;
    for (;;) {
        const DecisionNode& node = nodes_[idx];
        if (node.is_leaf()) {
            return node.category;
        }

        NodeIndex next = node.rule->match(record) ? node.match_child : node.not_match_child;

        // Children always follow their parent; anything else is a corrupt tree
        if (next <= idx || next >= nodes_.size()) {
            throw std::logic_error("internal node " + std::to_string(idx) +
                                   " has an invalid child index");
        }
        idx = next;
    }
}

std::vector<Category> DecisionTree::classify_batch(const RecordSet& records) const {
    std::vector<Category> output(records.size());
    const int64_t n = static_cast<int64_t>(records.size());
    std::exception_ptr error;

    #pragma omp parallel for schedule(static)
    for (int64_t i = 0; i < n; ++i) {
        try {
            output[i] = classify(records[i]);
        } catch (...) {
            #pragma omp critical
            if (!error) error = std::current_exception();
        }
    }

    if (error) {
        std::rethrow_exception(error);
    }
    return output;
}

// ============================================================================
// Redundant Rule Merging
// ============================================================================

DecisionTree& DecisionTree::merge_redundant_rules() {
    if (nodes_.empty()) {
        return *this;
    }

    merge_recursive(0);

    // Collapsed subtrees leave unreachable nodes behind
    if (TreeStats::of(*this).n_nodes() != nodes_.size()) {
        compact();
    }
    return *this;
}

bool DecisionTree::merge_recursive(NodeIndex node_idx) {
    if (nodes_[node_idx].is_leaf()) {
        return true;
    }

    NodeIndex match_child = nodes_[node_idx].match_child;
    NodeIndex not_match_child = nodes_[node_idx].not_match_child;

    bool match_is_leaf = merge_recursive(match_child);
    bool not_match_is_leaf = merge_recursive(not_match_child);

    if (match_is_leaf && not_match_is_leaf &&
        nodes_[match_child].category == nodes_[not_match_child].category) {
        DecisionNode& node = nodes_[node_idx];
        node.category = nodes_[match_child].category;
        node.rule.reset();
        node.match_child = 0;
        node.not_match_child = 0;
        return true;
    }
    return false;
}

void DecisionTree::compact() {
    DecisionTree compacted;
    compacted.nodes_.reserve(nodes_.size());
    compacted.copy_subtree(*this, 0);
    nodes_ = std::move(compacted.nodes_);
}

// ============================================================================
// Traversal
// ============================================================================

void DecisionTree::accept(TreeVisitor& visitor) const {
    if (nodes_.empty()) {
        return;
    }

    std::stack<std::tuple<NodeIndex, uint32_t, Branch>> pending;
    pending.emplace(0, 0, Branch::Root);

    while (!pending.empty()) {
        NodeIndex idx;
        uint32_t depth;
        Branch branch;
        std::tie(idx, depth, branch) = pending.top();
        pending.pop();

        const DecisionNode& current = node(idx);
        if (current.is_leaf()) {
            visitor.visit_leaf(current, depth, branch);
            continue;
        }

        visitor.visit_internal(current, depth, branch);
        pending.emplace(current.not_match_child, depth + 1, Branch::NotMatch);
        pending.emplace(current.match_child, depth + 1, Branch::Match);
    }
}

size_t DecisionTree::n_leaves() const {
    return TreeStats::of(*this).n_leaves();
}

uint32_t DecisionTree::depth() const {
    return TreeStats::of(*this).depth();
}

std::string DecisionTree::to_string() const {
    std::ostringstream out;
    TreePrinter printer(out);
    accept(printer);
    return out.str();
}

// ============================================================================
// Visitors
// ============================================================================

TreeStats TreeStats::of(const DecisionTree& tree) {
    TreeStats stats;
    tree.accept(stats);
    return stats;
}

void TreeStats::visit_internal(const DecisionNode&, uint32_t depth, Branch) {
    ++n_internal_;
    depth_ = std::max(depth_, depth);
}

void TreeStats::visit_leaf(const DecisionNode& node, uint32_t depth, Branch) {
    ++n_leaves_;
    depth_ = std::max(depth_, depth);
    ++leaf_categories_[node.category];
}

void TreePrinter::write_prefix(uint32_t depth, Branch branch) {
    out_ << std::string(static_cast<size_t>(depth) * indent_, ' ');
    switch (branch) {
        case Branch::Root:     break;
        case Branch::Match:    out_ << "yes: "; break;
        case Branch::NotMatch: out_ << "no: "; break;
    }
}

void TreePrinter::visit_internal(const DecisionNode& node, uint32_t depth, Branch branch) {
    write_prefix(depth, branch);
    out_ << '[' << node.rule->to_string() << "]\n";
}

void TreePrinter::visit_leaf(const DecisionNode& node, uint32_t depth, Branch branch) {
    write_prefix(depth, branch);
    out_ << node.category << '\n';
}

} // namespace arbor
