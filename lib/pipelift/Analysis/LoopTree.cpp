/*
 * Copyright (c) 2024, Trail of Bits, Inc.
 *
 * This source code is licensed in accordance with the terms specified in
 * the LICENSE file found in the root directory of this source tree.
 */

#include <pipelift/Analysis/LoopTree.hpp>

#include <pipelift/Util/Log.hpp>

namespace pipelift::analysis {

    const char *toString(Decision decision) {
        switch (decision) {
            case Decision::Unknown:
                return "unknown";
            case Decision::Convertible:
                return "convertible";
            case Decision::NotConvertible:
                return "not-convertible";
            case Decision::SkippedInnerConverted:
                return "skipped-inner-converted";
        }
        UNREACHABLE("unknown decision {0}", static_cast< int >(decision));
    }

    NodeId LoopTree::push(const ast::Stmt &loop, std::optional< LoopView > view, ScopeInfo scope) {
        NodeId id = nodes.size();
        LoopTreeNode node;
        node.parent = current();
        node.scope  = std::move(scope);
        node.loop   = &loop;
        node.view   = std::move(view);
        nodes.emplace_back(std::move(node));

        if (auto parent = nodes[id].parent) {
            nodes[*parent].children.push_back(id);
        }
        open.push_back(id);
        return id;
    }

    NodeId LoopTree::pop() {
        if (open.empty()) {
            UNREACHABLE("loop tree popped without an open loop");
        }
        auto id = open.back();
        open.pop_back();
        return id;
    }

    std::optional< NodeId > LoopTree::current() const {
        if (open.empty()) {
            return std::nullopt;
        }
        return open.back();
    }

    std::vector< NodeId > LoopTree::ancestors(NodeId id) const {
        std::vector< NodeId > result;
        for (auto parent = nodes[id].parent; parent; parent = nodes[*parent].parent) {
            result.push_back(*parent);
        }
        return result;
    }

    bool LoopTree::hasConvertibleDescendant(NodeId id) const {
        for (auto child : nodes[id].children) {
            if (nodes[child].decision == Decision::Convertible || hasConvertibleDescendant(child)) {
                return true;
            }
        }
        return false;
    }

    void LoopTree::postOrder(NodeId id, std::vector< NodeId > &out) const {
        for (auto child : nodes[id].children) {
            postOrder(child, out);
        }
        out.push_back(id);
    }

    std::vector< NodeId > LoopTree::postOrder() const {
        std::vector< NodeId > result;
        for (auto root : roots()) {
            postOrder(root, result);
        }
        return result;
    }

    std::vector< NodeId > LoopTree::roots() const {
        std::vector< NodeId > result;
        for (NodeId id = 0; id < nodes.size(); ++id) {
            if (!nodes[id].parent) {
                result.push_back(id);
            }
        }
        return result;
    }

    SafetyVerdict checkCaptureSafety(const LoopTree &tree, NodeId id) {
        const auto &referenced = tree.node(id).scope.referenced;
        for (auto ancestor : tree.ancestors(id)) {
            const auto &modified = tree.node(ancestor).scope.modified;
            for (const auto &name : referenced) {
                if (modified.count(name) != 0U) {
                    return SafetyVerdict::reject(
                        "variable '" + name + "' is modified by an enclosing loop"
                    );
                }
            }
        }
        return SafetyVerdict::accept();
    }

} // namespace pipelift::analysis
