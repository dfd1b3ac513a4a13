#ifndef KERF_CAM_BRANCH_TREE_H
#define KERF_CAM_BRANCH_TREE_H

#include <algorithm>
#include <cstddef>
#include <optional>
#include <stdexcept>
#include <vector>

namespace kerf {
namespace cam {

/**
 * Tree of values grown by repeatedly branching from leaves, read out as a
 * set of chains that visit every node exactly once.
 *
 * Nodes live in an arena and refer to each other by index. The root is
 * always node 0.
 */
template <typename T>
class BranchTree {
public:
    using NodeId = size_t;

    struct Node {
        T value;
        std::optional<NodeId> parent;
        std::vector<NodeId> children;
        bool locked;

        Node(const T& v, std::optional<NodeId> p) : value(v), parent(p), locked(false) {}
    };

    explicit BranchTree(const T& rootValue) {
        m_nodes.emplace_back(rootValue, std::nullopt);
    }

    NodeId root() const { return 0; }

    size_t size() const { return m_nodes.size(); }

    const Node& node(NodeId id) const { return m_nodes.at(id); }

    const T& value(NodeId id) const { return m_nodes.at(id).value; }

    /**
     * Add one child per item under parent
     * @param parent Node to grow from
     * @param items Values of the new children
     * @return Ids of the new children, in the order of items
     */
    std::vector<NodeId> branch(NodeId parent, const std::vector<T>& items) {
        if (parent >= m_nodes.size()) {
            throw std::out_of_range("Unknown branch tree node");
        }

        std::vector<NodeId> ids;
        for (const auto& item : items) {
            NodeId id = m_nodes.size();
            m_nodes.emplace_back(item, parent);
            m_nodes[parent].children.push_back(id);
            ids.push_back(id);
        }
        return ids;
    }

    // Mark a node as finished, it is skipped by nextUnlockedLeaf
    void lock(NodeId id) {
        m_nodes.at(id).locked = true;
    }

    bool isLeaf(NodeId id) const {
        return m_nodes.at(id).children.empty();
    }

    // Leaves in creation order
    std::vector<NodeId> leaves() const {
        std::vector<NodeId> result;
        for (NodeId id = 0; id < m_nodes.size(); ++id) {
            if (m_nodes[id].children.empty()) {
                result.push_back(id);
            }
        }
        return result;
    }

    /**
     * The first leaf, in creation order, that is not locked
     * @return The leaf, or nothing once every leaf is locked
     */
    std::optional<NodeId> nextUnlockedLeaf() const {
        for (NodeId id = 0; id < m_nodes.size(); ++id) {
            if (m_nodes[id].children.empty() && !m_nodes[id].locked) {
                return id;
            }
        }
        return std::nullopt;
    }

    // Path from a node up to the root, the node itself first
    std::vector<NodeId> traverse(NodeId id) const {
        std::vector<NodeId> path;
        std::optional<NodeId> current = id;
        while (current) {
            path.push_back(*current);
            current = m_nodes.at(*current).parent;
        }
        return path;
    }

    /**
     * Partition the tree into root-to-leaf chains.
     * The longest chain over the not yet used nodes is taken first, ties keep
     * leaf creation order. Every node appears in exactly one chain.
     * @return Chains of node ids, each ordered from the root side down to its leaf
     */
    std::vector<std::vector<NodeId>> sequences() const {
        std::vector<std::vector<NodeId>> candidates;
        for (NodeId leaf : leaves()) {
            candidates.push_back(traverse(leaf));
        }

        std::vector<bool> used(m_nodes.size(), false);
        std::vector<std::vector<NodeId>> result;

        while (!candidates.empty()) {
            std::stable_sort(candidates.begin(), candidates.end(),
                             [](const std::vector<NodeId>& a, const std::vector<NodeId>& b) {
                                 return a.size() > b.size();
                             });

            std::vector<NodeId> best = candidates.front();
            candidates.erase(candidates.begin());
            for (NodeId id : best) {
                used[id] = true;
            }
            std::reverse(best.begin(), best.end());
            result.push_back(best);

            std::vector<std::vector<NodeId>> remaining;
            for (const auto& candidate : candidates) {
                std::vector<NodeId> filtered;
                for (NodeId id : candidate) {
                    if (!used[id]) {
                        filtered.push_back(id);
                    }
                }
                if (!filtered.empty()) {
                    remaining.push_back(filtered);
                }
            }
            candidates = remaining;
        }

        return result;
    }

    // Same as sequences() but with the node values
    std::vector<std::vector<T>> valueSequences() const {
        std::vector<std::vector<T>> result;
        for (const auto& sequence : sequences()) {
            std::vector<T> values;
            for (NodeId id : sequence) {
                values.push_back(m_nodes[id].value);
            }
            result.push_back(values);
        }
        return result;
    }

private:
    std::vector<Node> m_nodes;
};

} // namespace cam
} // namespace kerf

#endif // KERF_CAM_BRANCH_TREE_H
