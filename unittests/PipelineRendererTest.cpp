/*
 * Copyright (c) 2024, Trail of Bits, Inc.
 *
 * This source code is licensed in accordance with the terms specified in
 * the LICENSE file found in the root directory of this source tree.
 */

#include <gtest/gtest.h>

#include <llvm/Support/Error.h>

#include <pipelift/AST/Builder.hpp>
#include <pipelift/Render/PipelineRenderer.hpp>

using namespace pipelift;
using namespace pipelift::render;
namespace build = pipelift::ast::build;

namespace {

    model::LoopModel modelOver(
        std::string source, model::SourceKind kind = model::SourceKind::Collection,
        std::string element_type = "String"
    ) {
        model::LoopModel loop;
        loop.source  = model::SourceDescriptor{ .kind         = kind,
                                                .expression   = std::move(source),
                                                .element_type = element_type };
        loop.element = model::ElementBinding{ .name = "s", .type = std::move(element_type) };
        return loop;
    }

    model::ForEachTerminal printBody(std::string param = "s") {
        return model::ForEachTerminal{ .body              = { "System.out.println(" + param + ");" },
                                       .single_expression = true,
                                       .consumed          = { param } };
    }

    model::MapOp trimmed() {
        return model::MapOp{ .expression        = "s.trim()",
                             .produced_variable = "t",
                             .output_type       = std::string("String"),
                             .consumed          = { "s" } };
    }

    model::FilterOp nonEmpty(std::string param) {
        return model::FilterOp{ .predicate = "!" + param + ".isEmpty()", .consumed = { param } };
    }

    model::CollectTerminal collectInto(std::string target) {
        return model::CollectTerminal{ .kind        = model::CollectorKind::ToList,
                                       .target      = std::move(target),
                                       .target_type = "List<String>" };
    }

    Replacement renderOk(const model::LoopModel &loop, const RenderContext &context = {}) {
        auto result = renderPipeline(loop, context);
        if (!result) {
            ADD_FAILURE() << llvm::toString(result.takeError());
            return {};
        }
        return std::move(*result);
    }

    std::string renderError(const model::LoopModel &loop) {
        auto result = renderPipeline(loop, RenderContext{});
        if (result) {
            return {};
        }
        return llvm::toString(result.takeError());
    }

} // namespace

TEST(PipelineRendererTest, DirectForEachOnCollection) {
    auto loop     = modelOver("items");
    loop.terminal = printBody();
    auto out      = renderOk(loop);
    ASSERT_EQ(out.statements.size(), 1U);
    EXPECT_EQ(out.statements.front(), "items.forEach(s -> System.out.println(s));");
    EXPECT_TRUE(out.required_symbols.empty());
}

TEST(PipelineRendererTest, BlockBodyForEach) {
    auto loop     = modelOver("items");
    loop.terminal = model::ForEachTerminal{
        .body = { "String u = s.toUpperCase();", "sink.add(u);" },
    };
    EXPECT_EQ(
        renderOk(loop).statements.front(),
        "items.forEach(s -> { String u = s.toUpperCase(); sink.add(u); });"
    );
}

TEST(PipelineRendererTest, ArraySourcesGoThroughArrays) {
    auto loop     = modelOver("values", model::SourceKind::Array, "int");
    loop.terminal = printBody();
    auto out      = renderOk(loop);
    EXPECT_EQ(out.statements.front(), "Arrays.stream(values).boxed().forEach(s -> System.out.println(s));");
    EXPECT_EQ(out.required_symbols, (std::vector< std::string >{ kArraysSymbol }));

    auto objects     = modelOver("names", model::SourceKind::Array, "String");
    objects.terminal = printBody();
    EXPECT_EQ(
        renderOk(objects).statements.front(),
        "Arrays.stream(names).forEach(s -> System.out.println(s));"
    );
}

TEST(PipelineRendererTest, IterableSourceUsesSpliterator) {
    auto loop = modelOver("paths", model::SourceKind::Iterable);
    loop.operations.emplace_back(nonEmpty("s"));
    loop.terminal = printBody();
    auto out      = renderOk(loop);
    EXPECT_EQ(
        out.statements.front(),
        "StreamSupport.stream(paths.spliterator(), false).filter(s -> !s.isEmpty())"
        ".forEach(s -> System.out.println(s));"
    );
    EXPECT_EQ(out.required_symbols, (std::vector< std::string >{ kStreamSupportSymbol }));
}

TEST(PipelineRendererTest, MapThenFilterUsesProducedVariable) {
    auto loop = modelOver("items");
    loop.operations.emplace_back(trimmed());
    loop.operations.emplace_back(nonEmpty("t"));
    auto terminal    = printBody("t");
    terminal.ordered = true;
    loop.terminal    = terminal;
    EXPECT_EQ(
        renderOk(loop).statements.front(),
        "items.stream().map(s -> s.trim()).filter(t -> !t.isEmpty())"
        ".forEachOrdered(t -> System.out.println(t));"
    );
}

TEST(PipelineRendererTest, CollectAssignsTarget) {
    auto loop = modelOver("items");
    loop.operations.emplace_back(trimmed());
    loop.terminal = collectInto("result");
    auto out      = renderOk(loop);
    EXPECT_EQ(
        out.statements.front(),
        "result = items.stream().map(s -> s.trim()).collect(Collectors.toList());"
    );
    EXPECT_EQ(out.required_symbols, (std::vector< std::string >{ kCollectorsSymbol }));
    EXPECT_TRUE(out.removed.empty());
}

TEST(PipelineRendererTest, CollectMergesIntoEmptyDeclaration) {
    auto decl = build::decl("List<String>", "result", build::newObject("ArrayList<>"));
    auto loop = modelOver("items");
    loop.terminal = collectInto("result");

    RenderContext context;
    context.preceding = decl.get();
    auto out          = renderOk(loop, context);
    EXPECT_EQ(out.statements.front(), "List<String> result = items.stream().collect(Collectors.toList());");
    EXPECT_EQ(out.removed, (std::vector< const ast::Stmt * >{ decl.get() }));

    context.merge_declarations = false;
    EXPECT_EQ(
        renderOk(loop, context).statements.front(),
        "result = items.stream().collect(Collectors.toList());"
    );
}

TEST(PipelineRendererTest, CollectKeepsPopulatedDeclaration) {
    auto decl = build::decl(
        "List<String>", "result",
        build::newObject("ArrayList<>", build::exprs(build::name("seed", build::local("List<String>"))))
    );
    auto loop     = modelOver("items");
    loop.terminal = collectInto("result");

    RenderContext context;
    context.preceding = decl.get();
    auto out          = renderOk(loop, context);
    EXPECT_EQ(out.statements.front(), "result = items.stream().collect(Collectors.toList());");
    EXPECT_TRUE(out.removed.empty());
}

TEST(PipelineRendererTest, ReduceAssignsAccumulator) {
    auto loop = modelOver("values", model::SourceKind::Collection, "Integer");
    loop.element.name = "x";
    loop.operations.emplace_back(model::MapOp{ .expression        = "f(x)",
                                               .produced_variable = "_mapped",
                                               .consumed          = { "x" } });
    loop.terminal = model::ReduceTerminal{ .identity         = "sum",
                                           .accumulator_fn   = "Integer::sum",
                                           .kind             = model::ReducerKind::Sum,
                                           .accumulator      = "sum",
                                           .accumulator_type = "int" };
    EXPECT_EQ(
        renderOk(loop).statements.front(), "sum = values.stream().map(x -> f(x)).reduce(sum, Integer::sum);"
    );
}

TEST(PipelineRendererTest, MatchKinds) {
    auto loop = modelOver("items");
    auto with = [&](model::MatchKind kind) {
        loop.terminal = model::MatchTerminal{ .kind      = kind,
                                              .condition = "s.isEmpty()",
                                              .consumed  = { "s" } };
        return renderOk(loop).statements.front();
    };
    EXPECT_EQ(with(model::MatchKind::Any), "if (items.stream().anyMatch(s -> s.isEmpty())) { return true; }");
    EXPECT_EQ(
        with(model::MatchKind::None), "if (!items.stream().noneMatch(s -> s.isEmpty())) { return false; }"
    );
    EXPECT_EQ(
        with(model::MatchKind::All), "if (!items.stream().allMatch(s -> s.isEmpty())) { return false; }"
    );
}

TEST(PipelineRendererTest, ReceiverWithSpaceIsParenthesized) {
    auto loop     = modelOver("flag ? left : right");
    loop.terminal = printBody();
    EXPECT_EQ(
        renderOk(loop).statements.front(), "(flag ? left : right).forEach(s -> System.out.println(s));"
    );
}

TEST(PipelineRendererTest, CompanionIsRemoved) {
    auto companion = build::decl(
        "Iterator<String>", "it", build::call(build::name("items", build::local("List<String>")), "iterator")
    );
    auto loop     = modelOver("items");
    loop.terminal = printBody();

    RenderContext context;
    context.companion = companion.get();
    EXPECT_EQ(renderOk(loop, context).removed, (std::vector< const ast::Stmt * >{ companion.get() }));
}

TEST(PipelineRendererTest, ScopeValidation) {
    auto loop = modelOver("items");
    loop.operations.emplace_back(trimmed());
    // `s` was superseded by the map to `t`.
    loop.terminal = printBody("s");
    EXPECT_EQ(renderError(loop), "variable 's' is not in scope at forEach body");

    auto filtered = modelOver("items");
    filtered.operations.emplace_back(nonEmpty("u"));
    filtered.terminal = printBody();
    EXPECT_EQ(renderError(filtered), "variable 'u' is not in scope at filter '!u.isEmpty()'");

    auto bare = modelOver("items");
    EXPECT_EQ(renderError(bare), "loop model is not convertible");
}

TEST(PipelineRendererTest, ConcatenationOfTwoMembers) {
    auto decl  = build::decl("List<String>", "result", build::newObject("ArrayList<>"));
    auto first = build::empty();
    auto second = build::empty();

    auto left     = modelOver("left");
    left.terminal = collectInto("result");
    auto right    = modelOver("right");
    right.operations.emplace_back(nonEmpty("s"));
    right.terminal = collectInto("result");

    RenderContext context;
    context.loop      = first.get();
    context.preceding = decl.get();
    auto result = renderConcatenation({ left, right }, { first.get(), second.get() }, context);
    ASSERT_TRUE(static_cast< bool >(result)) << llvm::toString(result.takeError());

    EXPECT_EQ(result->loop, first.get());
    ASSERT_EQ(result->statements.size(), 1U);
    EXPECT_EQ(
        result->statements.front(),
        "List<String> result = Stream.concat(left.stream(), right.stream().filter(s -> !s.isEmpty()))"
        ".collect(Collectors.toList());"
    );
    EXPECT_EQ(result->removed, (std::vector< const ast::Stmt * >{ second.get(), decl.get() }));
    EXPECT_EQ(
        result->required_symbols, (std::vector< std::string >{ kStreamSymbol, kCollectorsSymbol })
    );
}

TEST(PipelineRendererTest, ConcatenationNestsLeftToRight) {
    std::vector< ast::StmtPtr > loops;
    std::vector< model::LoopModel > members;
    for (const char *source : { "a", "b", "c" }) {
        loops.push_back(build::empty());
        members.push_back(modelOver(source));
        members.back().terminal = collectInto("all");
    }
    RenderContext context;
    context.loop = loops[0].get();
    auto result  = renderConcatenation(members, { loops[0].get(), loops[1].get(), loops[2].get() }, context);
    ASSERT_TRUE(static_cast< bool >(result)) << llvm::toString(result.takeError());
    EXPECT_EQ(
        result->statements.front(),
        "all = Stream.concat(Stream.concat(a.stream(), b.stream()), c.stream())"
        ".collect(Collectors.toList());"
    );
}

TEST(PipelineRendererTest, ConcatenationRejectsBadGroups) {
    auto loop = build::empty();
    auto one  = modelOver("a");
    one.terminal = collectInto("result");
    auto single = renderConcatenation({ one }, { loop.get() }, RenderContext{});
    EXPECT_EQ(llvm::toString(single.takeError()), "a concatenation needs at least two member loops");

    auto other     = modelOver("b");
    other.terminal = collectInto("elsewhere");
    auto mismatched =
        renderConcatenation({ one, other }, { loop.get(), loop.get() }, RenderContext{});
    EXPECT_EQ(llvm::toString(mismatched.takeError()), "group members collect into different targets");
}

TEST(ReplacementTest, JsonShape) {
    auto loop = build::forEach(
        build::var("String", "s"), build::name("items", build::param("List<String>")), build::block()
    );
    Replacement replacement;
    replacement.loop = loop.get();
    replacement.statements.push_back("items.forEach(s -> {});");
    replacement.require(kStreamSymbol);
    replacement.require(kStreamSymbol);

    auto value = toJSON(replacement);
    const auto *object = value.getAsObject();
    ASSERT_NE(object, nullptr);
    ASSERT_NE(object->getObject("replaced"), nullptr);
    EXPECT_NE(object->getObject("replaced")->getString("text"), llvm::None);
    EXPECT_EQ(object->getArray("removed")->size(), 0U);
    EXPECT_EQ(object->getArray("statements")->size(), 1U);
    EXPECT_EQ(object->getArray("symbols")->size(), 1U);
}
