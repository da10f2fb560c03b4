/*
 * Copyright (c) 2024, Trail of Bits, Inc.
 *
 * This source code is licensed in accordance with the terms specified in
 * the LICENSE file found in the root directory of this source tree.
 */

#include <gtest/gtest.h>

#include <pipelift/AST/Builder.hpp>
#include <pipelift/AST/Printer.hpp>
#include <pipelift/Analysis/PatternDetectors.hpp>

using namespace pipelift;
using namespace pipelift::analysis::patterns;
namespace build = pipelift::ast::build;

namespace {

    ast::StmtPtr returnBool(bool value) { return build::returnStmt(build::boolLit(value)); }

    ast::StmtPtr ifReturn(ast::ExprPtr cond, bool value) {
        return build::ifStmt(std::move(cond), build::block(build::stmts(returnBool(value))));
    }

    ast::ExprPtr isEmpty(const char *name) { return build::call(build::name(name), "isEmpty"); }

} // namespace

TEST(PatternDetectorsTest, GuardContinue) {
    auto guard = build::ifStmt(isEmpty("s"), build::block(build::stmts(build::continueStmt())));
    const auto *cond = matchGuardContinue(*guard);
    ASSERT_NE(cond, nullptr);
    EXPECT_EQ(ast::toString(*cond), "s.isEmpty()");

    auto labeled = build::ifStmt(isEmpty("s"), build::continueStmt("outer"));
    EXPECT_EQ(matchGuardContinue(*labeled), nullptr);

    auto with_else =
        build::ifStmt(isEmpty("s"), build::continueStmt(), build::exprStmt(isEmpty("t")));
    EXPECT_EQ(matchGuardContinue(*with_else), nullptr);
}

TEST(PatternDetectorsTest, EarlyReturnAnyMatch) {
    auto stmt  = ifReturn(isEmpty("s"), true);
    auto after = returnBool(false);
    auto match = matchEarlyReturn(*stmt, after.get());
    ASSERT_TRUE(match.has_value());
    EXPECT_EQ(match->kind, model::MatchKind::Any);
    EXPECT_EQ(ast::toString(*match->condition), "s.isEmpty()");
}

TEST(PatternDetectorsTest, EarlyReturnAllMatchStripsNegation) {
    auto stmt  = ifReturn(build::logicalNot(isEmpty("s")), false);
    auto after = returnBool(true);
    auto match = matchEarlyReturn(*stmt, after.get());
    ASSERT_TRUE(match.has_value());
    EXPECT_EQ(match->kind, model::MatchKind::All);
    EXPECT_EQ(ast::toString(*match->condition), "s.isEmpty()");
}

TEST(PatternDetectorsTest, EarlyReturnNoneMatch) {
    auto stmt  = ifReturn(isEmpty("s"), false);
    auto match = matchEarlyReturn(*stmt, nullptr);
    ASSERT_TRUE(match.has_value());
    EXPECT_EQ(match->kind, model::MatchKind::None);
}

TEST(PatternDetectorsTest, EarlyReturnRejectsSameValueAfterLoop) {
    auto stmt  = ifReturn(isEmpty("s"), true);
    auto after = returnBool(true);
    EXPECT_FALSE(matchEarlyReturn(*stmt, after.get()).has_value());

    auto non_boolean = build::ifStmt(
        isEmpty("s"), build::block(build::stmts(build::returnStmt(build::name("s"))))
    );
    EXPECT_FALSE(matchEarlyReturn(*non_boolean, nullptr).has_value());
}

TEST(PatternDetectorsTest, MapDeclarationAndReassignment) {
    auto decl = build::decl("String", "t", build::call(build::name("s"), "trim"));
    const auto *var = matchMapDeclaration(*decl);
    ASSERT_NE(var, nullptr);
    EXPECT_EQ(var->name, "t");

    auto bare = build::decl("String", "t");
    EXPECT_EQ(matchMapDeclaration(*bare), nullptr);

    auto reassign =
        build::exprStmt(build::assign("=", build::name("s"), build::call(build::name("s"), "trim")));
    const auto *value = matchReassignment(*reassign, "s");
    ASSERT_NE(value, nullptr);
    EXPECT_EQ(ast::toString(*value), "s.trim()");
    EXPECT_EQ(matchReassignment(*reassign, "t"), nullptr);
}

TEST(PatternDetectorsTest, Collect) {
    auto add = build::exprStmt(build::call(
        build::name("out", build::local("List<String>")), "add",
        build::exprs(build::call(build::name("s"), "trim"))
    ));
    auto collect = matchCollect(*add);
    ASSERT_TRUE(collect.has_value());
    EXPECT_EQ(collect->target->getName(), "out");
    EXPECT_EQ(ast::toString(*collect->value), "s.trim()");

    auto chained = build::exprStmt(build::call(
        build::call(build::name("holder"), "list"), "add", build::exprs(build::name("s"))
    ));
    EXPECT_FALSE(matchCollect(*chained).has_value());
}

TEST(PatternDetectorsTest, AccumulationKinds) {
    auto count = [] { return build::name("n", build::local("int")); };
    auto text  = [] { return build::name("acc", build::local("String")); };

    auto inc = build::exprStmt(build::unary(ast::UnaryOp::PostInc, count()));
    ASSERT_TRUE(matchAccumulation(*inc).has_value());
    EXPECT_EQ(matchAccumulation(*inc)->kind, model::ReducerKind::Increment);
    EXPECT_EQ(matchAccumulation(*inc)->value, nullptr);

    auto plus_one = build::exprStmt(build::assign("+=", count(), build::intLit(1)));
    EXPECT_EQ(matchAccumulation(*plus_one)->kind, model::ReducerKind::Increment);

    auto sum = build::exprStmt(build::assign("+=", count(), build::name("x")));
    EXPECT_EQ(matchAccumulation(*sum)->kind, model::ReducerKind::Sum);

    auto concat = build::exprStmt(build::assign("+=", text(), build::name("x")));
    EXPECT_EQ(matchAccumulation(*concat)->kind, model::ReducerKind::StringConcat);

    auto minus = build::exprStmt(build::assign("-=", count(), build::name("x")));
    EXPECT_EQ(matchAccumulation(*minus)->kind, model::ReducerKind::Decrement);
    EXPECT_NE(matchAccumulation(*minus)->value, nullptr);

    auto times = build::exprStmt(build::assign("*=", count(), build::name("x")));
    EXPECT_EQ(matchAccumulation(*times)->kind, model::ReducerKind::Product);

    auto shift = build::exprStmt(build::assign("<<=", count(), build::intLit(1)));
    EXPECT_FALSE(matchAccumulation(*shift).has_value());
}

TEST(PatternDetectorsTest, MinMaxInEitherArgumentOrder) {
    auto best = [] { return build::name("best", build::local("int")); };

    auto max_stmt = build::exprStmt(build::assign(
        "=", best(),
        build::call(build::name("Math"), "max", build::exprs(best(), build::name("x")))
    ));
    auto max = matchAccumulation(*max_stmt);
    ASSERT_TRUE(max.has_value());
    EXPECT_EQ(max->kind, model::ReducerKind::Max);
    EXPECT_EQ(ast::toString(*max->value), "x");

    auto min_stmt = build::exprStmt(build::assign(
        "=", best(),
        build::call(build::name("Math"), "min", build::exprs(build::name("x"), best()))
    ));
    auto min = matchAccumulation(*min_stmt);
    ASSERT_TRUE(min.has_value());
    EXPECT_EQ(min->kind, model::ReducerKind::Min);
    EXPECT_EQ(ast::toString(*min->value), "x");

    auto unrelated = build::exprStmt(build::assign(
        "=", best(),
        build::call(build::name("Math"), "max", build::exprs(build::name("y"), build::name("x")))
    ));
    EXPECT_FALSE(matchAccumulation(*unrelated).has_value());
}
