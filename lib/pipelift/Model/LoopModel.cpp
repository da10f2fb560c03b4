/*
 * Copyright (c) 2024, Trail of Bits, Inc.
 *
 * This source code is licensed in accordance with the terms specified in
 * the LICENSE file found in the root directory of this source tree.
 */

#include <pipelift/Model/LoopModel.hpp>

#include <type_traits>

#include <pipelift/Util/Log.hpp>

namespace pipelift::model {

    const char *toString(SourceKind kind) {
        switch (kind) {
            case SourceKind::Array:
                return "Array";
            case SourceKind::Collection:
                return "Collection";
            case SourceKind::Iterable:
                return "Iterable";
        }
        UNREACHABLE("unknown source kind {0}", static_cast< int >(kind));
    }

    const char *toString(CollectorKind kind) {
        switch (kind) {
            case CollectorKind::ToList:
                return "ToList";
            case CollectorKind::ToSet:
                return "ToSet";
        }
        UNREACHABLE("unknown collector kind {0}", static_cast< int >(kind));
    }

    const char *toString(MatchKind kind) {
        switch (kind) {
            case MatchKind::Any:
                return "Any";
            case MatchKind::None:
                return "None";
            case MatchKind::All:
                return "All";
        }
        UNREACHABLE("unknown match kind {0}", static_cast< int >(kind));
    }

    std::string LoopModel::currentVariable() const {
        for (auto op = operations.rbegin(); op != operations.rend(); ++op) {
            if (const auto *map = std::get_if< MapOp >(&*op)) {
                return map->produced_variable;
            }
        }
        return element.name;
    }

    void describe(const LoopModel &model, llvm::raw_ostream &os) {
        os << "source: " << toString(model.source.kind) << " " << model.source.expression;
        if (!model.source.element_type.empty()) {
            os << " of " << model.source.element_type;
        }
        os << "\n";
        os << "element: " << (model.element.is_final ? "final " : "") << model.element.type << " "
           << model.element.name << "\n";

        for (const auto &op : model.operations) {
            if (const auto *map = std::get_if< MapOp >(&op)) {
                os << "  map " << map->produced_variable << " = " << map->expression << "\n";
            } else if (const auto *filter = std::get_if< FilterOp >(&op)) {
                os << "  filter " << filter->predicate << "\n";
            }
        }

        if (!model.terminal) {
            os << "terminal: none\n";
            return;
        }

        std::visit(
            [&os](const auto &terminal) {
                using T = std::decay_t< decltype(terminal) >;
                if constexpr (std::is_same_v< T, ForEachTerminal >) {
                    os << "terminal: " << (terminal.ordered ? "forEachOrdered" : "forEach") << " ("
                       << terminal.body.size() << " statements)\n";
                } else if constexpr (std::is_same_v< T, CollectTerminal >) {
                    os << "terminal: collect " << toString(terminal.kind) << " into "
                       << terminal.target << "\n";
                } else if constexpr (std::is_same_v< T, ReduceTerminal >) {
                    os << "terminal: reduce " << toString(terminal.kind) << " into "
                       << terminal.accumulator << " with " << terminal.accumulator_fn << "\n";
                } else {
                    os << "terminal: match " << toString(terminal.kind) << " "
                       << terminal.condition << "\n";
                }
            },
            *model.terminal
        );
    }

} // namespace pipelift::model
