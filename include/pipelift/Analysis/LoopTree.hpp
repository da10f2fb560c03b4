/*
 * Copyright (c) 2024, Trail of Bits, Inc.
 *
 * This source code is licensed in accordance with the terms specified in
 * the LICENSE file found in the root directory of this source tree.
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include <pipelift/AST/Syntax.hpp>
#include <pipelift/Analysis/LoopView.hpp>
#include <pipelift/Analysis/SafetyAnalyzer.hpp>
#include <pipelift/Analysis/ScopeScanner.hpp>
#include <pipelift/Model/LoopModel.hpp>

namespace pipelift::analysis {

    enum class Decision : uint8_t { Unknown = 0, Convertible, NotConvertible, SkippedInnerConverted };

    const char *toString(Decision decision);

    using NodeId = std::size_t;

    struct LoopTreeNode
    {
        std::optional< NodeId > parent;
        std::vector< NodeId > children;
        ScopeInfo scope;
        Decision decision    = Decision::Unknown;
        const ast::Stmt *loop = nullptr;
        // Set for loops in one of the convertible forms.
        std::optional< LoopView > view;
        // Cached for Convertible nodes.
        std::optional< model::LoopModel > model;
        std::string reason;
    };

    // Arena of the loops met during one traversal. Nodes are addressed by
    // index; parents are non-owning indices.
    class LoopTree
    {
      public:
        // Registers `loop` as a child of the innermost open loop and opens it.
        NodeId push(const ast::Stmt &loop, std::optional< LoopView > view, ScopeInfo scope);

        // Closes the innermost open loop and returns it.
        NodeId pop();

        std::optional< NodeId > current() const;

        LoopTreeNode &node(NodeId id) { return nodes[id]; }
        const LoopTreeNode &node(NodeId id) const { return nodes[id]; }

        std::size_t size() const { return nodes.size(); }

        // Nearest ancestor first.
        std::vector< NodeId > ancestors(NodeId id) const;

        bool hasConvertibleDescendant(NodeId id) const;

        // Node ids in decision order: children before their parents.
        std::vector< NodeId > postOrder() const;

        std::vector< NodeId > roots() const;

      private:
        void postOrder(NodeId id, std::vector< NodeId > &out) const;

        std::vector< LoopTreeNode > nodes;
        std::vector< NodeId > open;
    };

    // Names the loop reads or writes must not be modified by an enclosing loop.
    SafetyVerdict checkCaptureSafety(const LoopTree &tree, NodeId id);

} // namespace pipelift::analysis
