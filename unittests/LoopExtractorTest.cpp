/*
 * Copyright (c) 2024, Trail of Bits, Inc.
 *
 * This source code is licensed in accordance with the terms specified in
 * the LICENSE file found in the root directory of this source tree.
 */

#include <set>

#include <gtest/gtest.h>

#include <pipelift/AST/Builder.hpp>
#include <pipelift/Analysis/LoopExtractor.hpp>
#include <pipelift/Util/Options.hpp>

using namespace pipelift;
using namespace pipelift::analysis;
namespace build = pipelift::ast::build;

class LoopExtractorTest : public ::testing::Test
{
  protected:
    // for (<type> <element> : <source>) { <body> }
    const model::LoopModel *extract(
        std::string element_type, std::string element, ast::ExprPtr source,
        std::vector< ast::StmtPtr > body, const ast::Stmt *following = nullptr
    ) {
        loop = build::forEach(
            build::var(std::move(element_type), std::move(element)), std::move(source),
            build::block(std::move(body))
        );
        view   = viewEnhancedFor(llvm::cast< ast::ForEachStmt >(*loop));
        result = extractLoopModel(
            *view, ExtractionContext{ .following = following, .names_in_use = names_in_use }, options
        );
        return std::get_if< model::LoopModel >(&result);
    }

    std::string abortReason() const {
        const auto *aborted = std::get_if< Aborted >(&result);
        return aborted != nullptr ? aborted->reason : std::string();
    }

    static ast::ExprPtr strings() { return build::name("items", build::param("List<String>")); }
    static ast::ExprPtr numbers() { return build::name("values", build::param("List<Integer>")); }

    static ast::ExprPtr isEmpty(const char *name) {
        return build::call(build::name(name, build::local("String")), "isEmpty");
    }

    Options options;
    std::set< std::string > names_in_use;
    ast::StmtPtr loop;
    std::optional< LoopView > view;
    ModelResult result = Aborted{};
};

TEST_F(LoopExtractorTest, LoneGuardContinueYieldsFilterAndEmptyForEach) {
    const auto *model = extract(
        "String", "s", strings(),
        build::stmts(build::ifStmt(isEmpty("s"), build::block(build::stmts(build::continueStmt()))))
    );
    ASSERT_NE(model, nullptr) << abortReason();
    ASSERT_EQ(model->operations.size(), 1U);
    const auto *filter = std::get_if< model::FilterOp >(&model->operations.front());
    ASSERT_NE(filter, nullptr);
    EXPECT_EQ(filter->predicate, "!s.isEmpty()");

    const auto *terminal = std::get_if< model::ForEachTerminal >(&*model->terminal);
    ASSERT_NE(terminal, nullptr);
    EXPECT_TRUE(terminal->body.empty());
    EXPECT_TRUE(model->isConvertible());
}

TEST_F(LoopExtractorTest, SumOfMappedValues) {
    const auto *model = extract(
        "Integer", "x", numbers(),
        build::stmts(build::exprStmt(build::assign(
            "+=", build::name("sum", build::local("int")),
            build::call(nullptr, "f", build::exprs(build::name("x", build::local("Integer"))))
        )))
    );
    ASSERT_NE(model, nullptr) << abortReason();

    ASSERT_EQ(model->operations.size(), 1U);
    const auto *map = std::get_if< model::MapOp >(&model->operations.front());
    ASSERT_NE(map, nullptr);
    EXPECT_EQ(map->expression, "f(x)");
    EXPECT_EQ(map->produced_variable, "x");
    EXPECT_EQ(map->consumed, std::vector< std::string >{ "x" });

    const auto *reduce = std::get_if< model::ReduceTerminal >(&*model->terminal);
    ASSERT_NE(reduce, nullptr);
    EXPECT_EQ(reduce->kind, model::ReducerKind::Sum);
    EXPECT_EQ(reduce->accumulator, "sum");
    EXPECT_EQ(reduce->identity, "sum");
    EXPECT_EQ(reduce->accumulator_fn, "Integer::sum");
}

TEST_F(LoopExtractorTest, CountingAfterFilter) {
    const auto *model = extract(
        "String", "s", strings(),
        build::stmts(
            build::ifStmt(isEmpty("s"), build::continueStmt()),
            build::exprStmt(build::unary(ast::UnaryOp::PostInc, build::name("count", build::local("long"))))
        )
    );
    ASSERT_NE(model, nullptr) << abortReason();
    ASSERT_EQ(model->operations.size(), 2U);
    EXPECT_TRUE(std::holds_alternative< model::FilterOp >(model->operations[0]));
    const auto &counting = std::get< model::MapOp >(model->operations[1]);
    EXPECT_EQ(counting.expression, "1L");
    EXPECT_EQ(counting.produced_variable, model::kCountingVariable);

    const auto &reduce = std::get< model::ReduceTerminal >(*model->terminal);
    EXPECT_EQ(reduce.kind, model::ReducerKind::Increment);
    EXPECT_EQ(reduce.accumulator_fn, "Long::sum");
}

TEST_F(LoopExtractorTest, CollectWithMapping) {
    const auto *model = extract(
        "String", "s", strings(),
        build::stmts(build::exprStmt(build::call(
            build::name("result", build::local("List<String>")), "add",
            build::exprs(build::call(build::name("s", build::local("String")), "trim"))
        )))
    );
    ASSERT_NE(model, nullptr) << abortReason();
    ASSERT_EQ(model->operations.size(), 1U);
    const auto &map = std::get< model::MapOp >(model->operations.front());
    EXPECT_EQ(map.expression, "s.trim()");
    ASSERT_TRUE(map.output_type.has_value());
    EXPECT_EQ(*map.output_type, "String");

    const auto &collect = std::get< model::CollectTerminal >(*model->terminal);
    EXPECT_EQ(collect.kind, model::CollectorKind::ToList);
    EXPECT_EQ(collect.target, "result");
}

TEST_F(LoopExtractorTest, CollectIntoSet) {
    const auto *model = extract(
        "String", "s", strings(),
        build::stmts(build::exprStmt(build::call(
            build::name("seen", build::local("Set<String>")), "add",
            build::exprs(build::name("s", build::local("String")))
        )))
    );
    ASSERT_NE(model, nullptr) << abortReason();
    EXPECT_TRUE(model->operations.empty());
    EXPECT_EQ(std::get< model::CollectTerminal >(*model->terminal).kind, model::CollectorKind::ToSet);
}

TEST_F(LoopExtractorTest, MapDeclarationThenForEach) {
    const auto *model = extract(
        "String", "s", strings(),
        build::stmts(
            build::decl("String", "t", build::call(build::name("s", build::local("String")), "trim")),
            build::exprStmt(build::call(
                build::fieldAccess(build::name("System"), "out"), "println",
                build::exprs(build::name("t", build::local("String")))
            ))
        )
    );
    ASSERT_NE(model, nullptr) << abortReason();
    ASSERT_EQ(model->operations.size(), 1U);
    EXPECT_EQ(std::get< model::MapOp >(model->operations.front()).produced_variable, "t");
    EXPECT_EQ(model->currentVariable(), "t");

    const auto &for_each = std::get< model::ForEachTerminal >(*model->terminal);
    EXPECT_TRUE(for_each.ordered);
    EXPECT_TRUE(for_each.single_expression);
    EXPECT_EQ(for_each.body, std::vector< std::string >{ "System.out.println(t);" });
}

TEST_F(LoopExtractorTest, AnyMatchBeforeReturnFalse) {
    auto after        = build::returnStmt(build::boolLit(false));
    const auto *model = extract(
        "String", "s", strings(),
        build::stmts(build::ifStmt(
            isEmpty("s"), build::block(build::stmts(build::returnStmt(build::boolLit(true))))
        )),
        after.get()
    );
    ASSERT_NE(model, nullptr) << abortReason();
    const auto &match = std::get< model::MatchTerminal >(*model->terminal);
    EXPECT_EQ(match.kind, model::MatchKind::Any);
    EXPECT_EQ(match.condition, "s.isEmpty()");
}

TEST_F(LoopExtractorTest, AllMatchBeforeReturnTrue) {
    auto after        = build::returnStmt(build::boolLit(true));
    const auto *model = extract(
        "String", "s", strings(),
        build::stmts(build::ifStmt(
            build::logicalNot(isEmpty("s")),
            build::block(build::stmts(build::returnStmt(build::boolLit(false))))
        )),
        after.get()
    );
    ASSERT_NE(model, nullptr) << abortReason();
    const auto &match = std::get< model::MatchTerminal >(*model->terminal);
    EXPECT_EQ(match.kind, model::MatchKind::All);
    EXPECT_EQ(match.condition, "s.isEmpty()");
}

TEST_F(LoopExtractorTest, BreakMakesModelNonConvertible) {
    const auto *model = extract(
        "String", "s", strings(),
        build::stmts(build::ifStmt(isEmpty("s"), build::block(build::stmts(build::breakStmt()))))
    );
    ASSERT_NE(model, nullptr) << abortReason();
    EXPECT_TRUE(model->metadata.has_break);
    EXPECT_FALSE(model->isConvertible());
}

TEST_F(LoopExtractorTest, LabeledContinueMakesModelNonConvertible) {
    const auto *model = extract(
        "String", "s", strings(),
        build::stmts(
            build::ifStmt(isEmpty("s"), build::block(build::stmts(build::continueStmt("outer"))))
        )
    );
    ASSERT_NE(model, nullptr) << abortReason();
    EXPECT_TRUE(model->metadata.has_labeled_continue);
    EXPECT_FALSE(model->isConvertible());
}

TEST_F(LoopExtractorTest, ContinueOutsideGuardAborts) {
    const auto *model = extract(
        "String", "s", strings(),
        build::stmts(
            build::ifStmt(
                isEmpty("s"),
                build::block(build::stmts(
                    build::exprStmt(build::call(nullptr, "skip", build::exprs(build::name("s")))),
                    build::continueStmt()
                ))
            ),
            build::exprStmt(build::call(nullptr, "keep", build::exprs(build::name("s"))))
        )
    );
    EXPECT_EQ(model, nullptr);
    EXPECT_EQ(abortReason(), "continue statement outside a guard");
}

TEST_F(LoopExtractorTest, NonBooleanReturnAborts) {
    const auto *model = extract(
        "String", "s", strings(),
        build::stmts(build::ifStmt(
            isEmpty("s"), build::block(build::stmts(build::returnStmt(build::name("s"))))
        ))
    );
    EXPECT_EQ(model, nullptr);
    EXPECT_EQ(abortReason(), "return statement outside a match shape");
}

TEST_F(LoopExtractorTest, UnsupportedSourceAborts) {
    const auto *model = extract(
        "String", "k", build::name("table", build::param("Map<String, Integer>")),
        build::stmts(build::exprStmt(build::call(nullptr, "use", build::exprs(build::name("k")))))
    );
    EXPECT_EQ(model, nullptr);
    EXPECT_NE(abortReason().find("unsupported source type"), std::string::npos);
}

TEST_F(LoopExtractorTest, CapturedOuterLocalsAreRecorded) {
    const auto *model = extract(
        "String", "s", strings(),
        build::stmts(build::exprStmt(build::call(
            build::name("sink", build::local("Consumer<String>")), "accept",
            build::exprs(build::binary(
                "+", build::name("prefix", build::local("String")),
                build::name("s", build::local("String")), "String"
            ))
        )))
    );
    ASSERT_NE(model, nullptr) << abortReason();
    const auto &for_each = std::get< model::ForEachTerminal >(*model->terminal);
    EXPECT_FALSE(for_each.ordered);
    EXPECT_EQ(for_each.consumed, std::vector< std::string >{ "s" });
    EXPECT_EQ(for_each.captured, (std::vector< std::string >{ "sink", "prefix" }));
}

TEST_F(LoopExtractorTest, GuardedAppendYieldsFilterMapAndCollect) {
    const auto *model = extract(
        "String", "s", strings(),
        build::stmts(build::ifStmt(
            build::logicalNot(isEmpty("s")),
            build::block(build::stmts(build::exprStmt(build::call(
                build::name("result", build::local("List<String>")), "add",
                build::exprs(build::call(build::name("s", build::local("String")), "trim"))
            ))))
        ))
    );
    ASSERT_NE(model, nullptr) << abortReason();
    ASSERT_EQ(model->operations.size(), 2U);
    const auto *filter = std::get_if< model::FilterOp >(&model->operations[0]);
    ASSERT_NE(filter, nullptr);
    EXPECT_EQ(filter->predicate, "!s.isEmpty()");
    const auto *map = std::get_if< model::MapOp >(&model->operations[1]);
    ASSERT_NE(map, nullptr);
    EXPECT_EQ(map->expression, "s.trim()");

    const auto *collect = std::get_if< model::CollectTerminal >(&*model->terminal);
    ASSERT_NE(collect, nullptr);
    EXPECT_EQ(collect->target, "result");
}

TEST_F(LoopExtractorTest, GuardedAccumulationYieldsFilterMapAndReduce) {
    const auto *model = extract(
        "Integer", "x", numbers(),
        build::stmts(build::ifStmt(
            build::binary(">", build::name("x", build::local("Integer")), build::intLit(0), "boolean"),
            build::block(build::stmts(build::exprStmt(build::assign(
                "+=", build::name("sum", build::local("int")),
                build::call(nullptr, "f", build::exprs(build::name("x", build::local("Integer"))))
            ))))
        ))
    );
    ASSERT_NE(model, nullptr) << abortReason();
    ASSERT_EQ(model->operations.size(), 2U);
    EXPECT_EQ(std::get< model::FilterOp >(model->operations[0]).predicate, "x > 0");
    EXPECT_EQ(std::get< model::MapOp >(model->operations[1]).expression, "f(x)");

    const auto *reduce = std::get_if< model::ReduceTerminal >(&*model->terminal);
    ASSERT_NE(reduce, nullptr);
    EXPECT_EQ(reduce->kind, model::ReducerKind::Sum);
    EXPECT_EQ(reduce->accumulator, "sum");
}

TEST_F(LoopExtractorTest, GuardReadingTheTargetKeepsForEach) {
    const auto *model = extract(
        "String", "s", strings(),
        build::stmts(build::ifStmt(
            build::logicalNot(build::call(
                build::name("result", build::local("List<String>")), "contains",
                build::exprs(build::name("s", build::local("String")))
            )),
            build::block(build::stmts(build::exprStmt(build::call(
                build::name("result", build::local("List<String>")), "add",
                build::exprs(build::name("s", build::local("String")))
            ))))
        ))
    );
    ASSERT_NE(model, nullptr) << abortReason();
    EXPECT_TRUE(std::holds_alternative< model::ForEachTerminal >(*model->terminal));
}

TEST_F(LoopExtractorTest, CombinerParametersAvoidMethodLocals) {
    names_in_use      = { "a", "values" };
    const auto *model = extract(
        "Integer", "x", numbers(),
        build::stmts(build::exprStmt(build::assign(
            "*=", build::name("a", build::local("int")), build::name("x", build::local("Integer"))
        )))
    );
    ASSERT_NE(model, nullptr) << abortReason();
    const auto &reduce = std::get< model::ReduceTerminal >(*model->terminal);
    EXPECT_EQ(reduce.kind, model::ReducerKind::Product);
    EXPECT_EQ(reduce.accumulator_fn, "(a1, b) -> a1 * b");
}

TEST_F(LoopExtractorTest, ElementUsedAfterMapAborts) {
    const auto *model = extract(
        "String", "s", strings(),
        build::stmts(
            build::decl("String", "t", build::call(build::name("s", build::local("String")), "trim")),
            build::exprStmt(build::call(
                build::name("result", build::local("List<String>")), "add",
                build::exprs(build::name("s", build::local("String")))
            ))
        )
    );
    EXPECT_EQ(model, nullptr);
    EXPECT_EQ(abortReason(), "'s' is used after the pipeline moved on to 't'");
}
