/*
 * Copyright (c) 2024, Trail of Bits, Inc.
 *
 * This source code is licensed in accordance with the terms specified in
 * the LICENSE file found in the root directory of this source tree.
 */

#include <pipelift/Analysis/SafetyAnalyzer.hpp>

#include <algorithm>

#include <llvm/ADT/StringSet.h>

#include <pipelift/AST/Printer.hpp>
#include <pipelift/AST/SyntaxUtils.hpp>
#include <pipelift/AST/SyntaxVisitor.hpp>
#include <pipelift/Analysis/ScopeScanner.hpp>
#include <pipelift/Util/Log.hpp>

namespace pipelift::analysis {

    namespace {

        const llvm::StringSet<> kCollectionTypes = {
            "Collection",    "List",          "ArrayList",     "LinkedList",
            "Set",           "HashSet",       "TreeSet",       "LinkedHashSet",
            "SortedSet",     "NavigableSet",  "Queue",         "Deque",
            "ArrayDeque",    "PriorityQueue", "Vector",        "Stack",
            "AbstractList",  "AbstractSet",   "AbstractCollection",
            "CopyOnWriteArrayList",  "CopyOnWriteArraySet",   "ConcurrentLinkedQueue",
            "ConcurrentLinkedDeque", "ConcurrentSkipListSet", "BlockingQueue",
            "LinkedBlockingQueue",   "ArrayBlockingQueue"
        };

        const llvm::StringSet<> kUnsupportedTypes = {
            "Map",      "HashMap",      "TreeMap",   "LinkedHashMap", "SortedMap",
            "NavigableMap", "ConcurrentMap", "ConcurrentHashMap", "Stream",
            "IntStream", "LongStream", "DoubleStream", "Iterator", "ListIterator",
            "Optional", "Enumeration"
        };

        const llvm::StringSet<> kConcurrentTypes = {
            "CopyOnWriteArrayList", "CopyOnWriteArraySet", "ConcurrentLinkedQueue",
            "ConcurrentLinkedDeque", "ConcurrentSkipListSet"
        };

        const llvm::StringSet<> kMutatingMethods = {
            "add",        "addAll",     "remove",           "removeAll",
            "removeIf",   "retainAll",  "clear",            "set",
            "sort",       "replaceAll", "put",              "putAll",
            "putIfAbsent", "compute",   "computeIfAbsent",  "computeIfPresent",
            "merge",      "replace",    "addFirst",         "addLast",
            "removeFirst", "removeLast", "push",            "pop",
            "offer",      "poll"
        };

        // Primitive arrays that `Arrays.stream` accepts directly.
        const llvm::StringSet<> kStreamablePrimitives = { "int", "long", "double" };

        bool isConfigured(const std::vector< std::string > &types, llvm::StringRef type) {
            auto raw = ast::erasure(type);
            return std::any_of(types.begin(), types.end(), [&](const std::string &configured) {
                return configured == type || ast::erasure(configured) == raw;
            });
        }

        bool isConcurrentType(llvm::StringRef type, const Options &options) {
            return kConcurrentTypes.contains(ast::erasure(type))
                || isConfigured(options.concurrent_types, type);
        }

        ThreadSafety classifyFactoryCall(const ast::CallExpr &call) {
            const auto *receiver = ast::asSimpleName(call.getReceiver());
            if (receiver == nullptr) {
                return ThreadSafety::PotentiallyShared;
            }
            llvm::StringRef owner  = receiver->getName();
            llvm::StringRef method = call.getMethod();
            if (owner == "Collections") {
                if (method.startswith("unmodifiable")) {
                    return ThreadSafety::Immutable;
                }
                if (method.startswith("synchronized")) {
                    return ThreadSafety::SynchronizedWrapper;
                }
                if (method.startswith("empty") || method == "singletonList" || method == "singleton") {
                    return ThreadSafety::Immutable;
                }
            }
            if ((owner == "List" || owner == "Set") && (method == "of" || method == "copyOf")) {
                return ThreadSafety::Immutable;
            }
            return ThreadSafety::PotentiallyShared;
        }

        // Classification of a value whose origin is the expression itself.
        std::optional< ThreadSafety >
        classifyOrigin(const ast::Expr *expr, const Options &options) {
            expr = ast::ignoreParens(expr);
            if (const auto *creation = llvm::dyn_cast_or_null< ast::NewExpr >(expr)) {
                return isConcurrentType(creation->getClassType(), options)
                    ? ThreadSafety::ConcurrentSafeType
                    : ThreadSafety::LocallyCreated;
            }
            if (const auto *call = llvm::dyn_cast_or_null< ast::CallExpr >(expr)) {
                auto safety = classifyFactoryCall(*call);
                if (safety != ThreadSafety::PotentiallyShared) {
                    return safety;
                }
            }
            return std::nullopt;
        }

        // Collects control-flow facts about a loop body, nested loops included.
        class ControlFlowScanner final : public ast::RecursiveSyntaxVisitor< ControlFlowScanner >
        {
          public:
            model::LoopMetadata metadata;

            bool TraverseLambda(const ast::LambdaExpr *) { return true; }

            bool VisitStmt(const ast::Stmt *stmt) {
                if (llvm::isa< ast::BreakStmt >(stmt)) {
                    metadata.has_break = true;
                } else if (const auto *jump = llvm::dyn_cast< ast::ContinueStmt >(stmt)) {
                    metadata.has_labeled_continue = metadata.has_labeled_continue || jump->hasLabel();
                }
                return true;
            }

            void scan(const std::vector< const ast::Stmt * > &body) {
                for (const auto *stmt : body) {
                    TraverseStmt(stmt);
                }
            }
        };

        // First statement kind that cannot move into a lambda, nested loops excluded.
        class DisallowedStmtFinder final
            : public ast::RecursiveSyntaxVisitor< DisallowedStmtFinder >
        {
          public:
            const ast::Stmt *found = nullptr;

            bool TraverseLoop(const ast::Stmt *) { return true; }

            bool TraverseLambda(const ast::LambdaExpr *) { return true; }

            bool VisitStmt(const ast::Stmt *stmt) {
                switch (stmt->getKind()) {
                    case ast::Stmt::Kind::Try:
                    case ast::Stmt::Kind::Switch:
                    case ast::Stmt::Kind::Synchronized:
                        found = stmt;
                        return false;
                    default:
                        return true;
                }
            }
        };

        // Mutating calls whose receiver is the iterated source.
        class SourceMutationFinder final
            : public ast::RecursiveSyntaxVisitor< SourceMutationFinder >
        {
          public:
            explicit SourceMutationFinder(std::string source) : source(std::move(source)) {}

            const ast::CallExpr *found = nullptr;

            bool VisitExpr(const ast::Expr *expr) {
                const auto *call = llvm::dyn_cast< ast::CallExpr >(expr);
                if (call == nullptr || call->getReceiver() == nullptr
                    || !kMutatingMethods.contains(call->getMethod()))
                {
                    return true;
                }
                if (ast::toString(*ast::ignoreParens(call->getReceiver())) == source) {
                    found = call;
                    return false;
                }
                return true;
            }

          private:
            std::string source;
        };

        // Simple names written by assignments and increments, lambdas excluded.
        class WriteCollector final : public ast::RecursiveSyntaxVisitor< WriteCollector >
        {
          public:
            std::vector< const ast::NameExpr * > writes;

            bool TraverseLambda(const ast::LambdaExpr *) { return true; }

            bool VisitExpr(const ast::Expr *expr) {
                const ast::NameExpr *target = nullptr;
                if (const auto *assign = llvm::dyn_cast< ast::AssignExpr >(expr)) {
                    target = ast::asSimpleName(assign->getLHS());
                } else if (const auto *unary = llvm::dyn_cast< ast::UnaryExpr >(expr)) {
                    if (unary->isIncrementOrDecrement()) {
                        target = ast::asSimpleName(unary->getOperand());
                    }
                }
                if (target != nullptr) {
                    writes.push_back(target);
                }
                return true;
            }
        };

        class DeclarationCollector final
            : public ast::RecursiveSyntaxVisitor< DeclarationCollector >
        {
          public:
            explicit DeclarationCollector(
                std::unordered_map< std::string, const ast::Expr * > &initializers
            )
                : initializers(initializers) {}

            bool VisitVarDecl(const ast::VarDecl &var) {
                initializers.try_emplace(var.name, var.init.get());
                return true;
            }

          private:
            std::unordered_map< std::string, const ast::Expr * > &initializers;
        };

        void collectDeclarations(
            const ast::Stmt *stmt, std::unordered_map< std::string, const ast::Expr * > &out
        ) {
            DeclarationCollector collector(out);
            collector.TraverseStmt(stmt);
        }

    } // namespace

    const char *toString(ThreadSafety safety) {
        switch (safety) {
            case ThreadSafety::LocallyCreated:
                return "locally-created";
            case ThreadSafety::ConcurrentSafeType:
                return "concurrent-safe-type";
            case ThreadSafety::Immutable:
                return "immutable";
            case ThreadSafety::SynchronizedWrapper:
                return "synchronized-wrapper";
            case ThreadSafety::PotentiallyShared:
                return "potentially-shared";
        }
        UNREACHABLE("unknown thread safety level {0}", static_cast< int >(safety));
    }

    MethodContext::MethodContext(const ast::MethodDecl &method) {
        for (const auto &param : method.params) {
            parameters.insert(param.name);
        }
        declared = parameters;
        if (method.body) {
            collectDeclarations(method.body.get(), initializers);
            modified = assignedNames(*method.body);
            auto locals = analysis::declaredNames({ method.body.get() });
            declared.insert(locals.begin(), locals.end());
        }
    }

    const ast::Expr *MethodContext::initializerOf(llvm::StringRef name) const {
        auto it = initializers.find(name.str());
        return it == initializers.end() ? nullptr : it->second;
    }

    bool MethodContext::isParameter(llvm::StringRef name) const {
        return parameters.count(name.str()) != 0U;
    }

    std::optional< model::SourceKind >
    classifySourceKind(llvm::StringRef type, const Options &options) {
        if (ast::isArrayType(type)) {
            auto element = ast::elementType(type);
            if (ast::isPrimitiveType(element) && !kStreamablePrimitives.contains(element)) {
                return std::nullopt;
            }
            return model::SourceKind::Array;
        }
        if (type.empty()) {
            return model::SourceKind::Collection;
        }

        auto raw = ast::erasure(type);
        if (isConfigured(options.collection_types, type) || kCollectionTypes.contains(raw)) {
            return model::SourceKind::Collection;
        }
        if (kUnsupportedTypes.contains(raw)) {
            return std::nullopt;
        }
        if (raw == "Iterable") {
            return model::SourceKind::Iterable;
        }
        return model::SourceKind::Collection;
    }

    ThreadSafety classifyThreadSafety(
        const ast::Expr &source, const MethodContext &method, const Options &options
    ) {
        const auto *expr = ast::ignoreParens(&source);
        if (const auto *name = llvm::dyn_cast< ast::NameExpr >(expr)) {
            const auto &binding = name->getBinding();
            switch (binding.kind) {
                case ast::BindingKind::Parameter:
                    return ThreadSafety::LocallyCreated;
                case ast::BindingKind::Local: {
                    if (auto origin = classifyOrigin(method.initializerOf(name->getName()), options)) {
                        return *origin;
                    }
                    return ThreadSafety::LocallyCreated;
                }
                case ast::BindingKind::Field:
                    return isConcurrentType(binding.type, options)
                        ? ThreadSafety::ConcurrentSafeType
                        : ThreadSafety::PotentiallyShared;
                case ast::BindingKind::Unresolved:
                    return ThreadSafety::PotentiallyShared;
            }
        }
        if (auto origin = classifyOrigin(expr, options)) {
            return *origin;
        }
        return ThreadSafety::PotentiallyShared;
    }

    model::LoopMetadata scanControlFlow(const LoopView &view) {
        ControlFlowScanner scanner;
        scanner.scan(view.body);
        return scanner.metadata;
    }

    SafetyVerdict
    checkStructure(const LoopView &view, const MethodContext &method, const Options &options) {
        auto source_type = view.sourceType();
        if (!classifySourceKind(source_type, options)) {
            return SafetyVerdict::reject("unsupported source type '" + source_type + "'");
        }

        auto metadata = scanControlFlow(view);
        if (metadata.has_break) {
            return SafetyVerdict::reject("loop body contains break");
        }
        if (metadata.has_labeled_continue) {
            return SafetyVerdict::reject("loop body contains a labeled continue");
        }

        for (const auto *stmt : view.body) {
            DisallowedStmtFinder finder;
            finder.TraverseStmt(stmt);
            if (finder.found != nullptr) {
                return SafetyVerdict::reject("loop body contains a try, switch or synchronized statement");
            }
        }

        SourceMutationFinder mutations(ast::toString(*ast::ignoreParens(view.source)));
        for (const auto *stmt : view.body) {
            if (!mutations.TraverseStmt(stmt)) {
                break;
            }
        }
        if (mutations.found != nullptr) {
            return SafetyVerdict::reject(
                "loop body modifies its source through '" + mutations.found->getMethod() + "'"
            );
        }

        if (view.form == LoopForm::IndexedFor) {
            auto safety = classifyThreadSafety(*view.source, method, options);
            if (safety == ThreadSafety::PotentiallyShared) {
                return SafetyVerdict::reject("indexed source is potentially shared between threads");
            }
        }
        return SafetyVerdict::accept();
    }

    SafetyVerdict checkSideEffects(const LoopView &view, const model::LoopModel &model) {
        auto locals = declaredNames(view.body);
        locals.insert(view.element_name);

        std::string accumulator;
        if (model.terminal) {
            if (const auto *reduce = std::get_if< model::ReduceTerminal >(&*model.terminal)) {
                accumulator = reduce->accumulator;
            }
        }

        WriteCollector collector;
        for (const auto *stmt : view.body) {
            collector.TraverseStmt(stmt);
        }
        for (const auto *write : collector.writes) {
            const auto &name = write->getName();
            if (write->getBinding().kind == ast::BindingKind::Field || locals.count(name) != 0U
                || name == accumulator)
            {
                continue;
            }
            return SafetyVerdict::reject("loop body assigns outer variable '" + name + "'");
        }
        return SafetyVerdict::accept();
    }

    SafetyVerdict checkCapturedVariables(const model::LoopModel &model, const MethodContext &method) {
        std::set< std::string > captured;
        auto gather = [&](const std::vector< std::string > &names) {
            captured.insert(names.begin(), names.end());
        };
        for (const auto &operation : model.operations) {
            std::visit([&](const auto &op) { gather(op.captured); }, operation);
        }
        if (model.terminal) {
            if (const auto *for_each = std::get_if< model::ForEachTerminal >(&*model.terminal)) {
                gather(for_each->captured);
            } else if (const auto *match = std::get_if< model::MatchTerminal >(&*model.terminal)) {
                gather(match->captured);
            }
        }

        const auto &modified = method.modifiedNames();
        for (const auto &name : captured) {
            if (modified.count(name) != 0U) {
                return SafetyVerdict::reject("captured variable '" + name + "' is not effectively final");
            }
        }
        return SafetyVerdict::accept();
    }

} // namespace pipelift::analysis
