/*
 * Copyright (c) 2024, Trail of Bits, Inc.
 *
 * This source code is licensed in accordance with the terms specified in
 * the LICENSE file found in the root directory of this source tree.
 */

#include <gtest/gtest.h>

#include <pipelift/AST/Builder.hpp>
#include <pipelift/AST/Printer.hpp>
#include <pipelift/AST/SyntaxUtils.hpp>

using namespace pipelift::ast;

TEST(PrinterTest, CallChainAndLiterals) {
    auto expr = build::call(
        build::name("out", build::field("PrintStream")), "println",
        build::exprs(build::binary("+", build::strLit("n="), build::name("n"), "String"))
    );
    EXPECT_EQ(toString(*expr), "out.println(\"n=\" + n)");
}

TEST(PrinterTest, ParenthesesOnlyWhereTheTreeHasThem) {
    auto sum = build::binary(
        "*", build::paren(build::binary("+", build::name("a"), build::intLit(1))),
        build::name("b")
    );
    EXPECT_EQ(toString(*sum), "(a + 1) * b");
}

TEST(PrinterTest, PostfixAndPrefixUnary) {
    EXPECT_EQ(toString(*build::unary(UnaryOp::PostInc, build::name("i"))), "i++");
    EXPECT_EQ(toString(*build::unary(UnaryOp::PreDec, build::name("i"))), "--i");
    EXPECT_EQ(toString(*build::logicalNot(build::name("done"))), "!done");
}

TEST(PrinterTest, LambdaAndMethodReference) {
    auto single = build::lambda({ "x" }, build::call(build::name("x"), "trim"));
    EXPECT_EQ(toString(*single), "x -> x.trim()");

    auto pair = build::lambda({ "a", "b" }, build::binary("+", build::name("a"), build::name("b")));
    EXPECT_EQ(toString(*pair), "(a, b) -> a + b");

    EXPECT_EQ(toString(*build::methodRef("Integer", "sum")), "Integer::sum");
}

TEST(PrinterTest, CastConditionalAndNew) {
    auto expr = build::conditional(
        build::name("flag"), build::cast("long", build::name("n")),
        build::newObject("ArrayList<>", build::exprs(build::intLit(16)))
    );
    EXPECT_EQ(toString(*expr), "flag ? (long) n : new ArrayList<>(16)");
}

TEST(PrinterTest, EnhancedForLoop) {
    auto loop = build::forEach(
        build::finalVar("String", "s"), build::name("items", build::param("List<String>")),
        build::block(build::stmts(build::exprStmt(build::call(build::name("s"), "trim"))))
    );
    EXPECT_EQ(toString(*loop), "for (final String s : items) { s.trim(); }");
}

TEST(PrinterTest, ClassicForLoopHeader) {
    auto loop = build::forStmt(
        build::stmts(build::decl("int", "i", build::intLit(0))),
        build::binary("<", build::name("i"), build::fieldAccess(build::name("a"), "length")),
        build::exprs(build::unary(UnaryOp::PostInc, build::name("i"))), build::block()
    );
    EXPECT_EQ(toString(*loop), "for (int i = 0; i < a.length; i++) { }");
}

TEST(PrinterTest, IfElseAndJumps) {
    auto stmt = build::ifStmt(
        build::name("x"), build::block(build::stmts(build::continueStmt())),
        build::block(build::stmts(build::breakStmt("outer")))
    );
    EXPECT_EQ(toString(*stmt), "if (x) { continue; } else { break outer; }");
}

TEST(PrinterTest, MultipleDeclarators) {
    std::vector< VarDecl > vars;
    vars.push_back(build::finalVar("int", "a", build::intLit(1)));
    vars.push_back(build::var("int", "b"));

    std::string out;
    llvm::raw_string_ostream os(out);
    printDeclarators(vars, os);
    EXPECT_EQ(os.str(), "final int a = 1, b");
}

TEST(SyntaxUtilsTest, NegatedText) {
    EXPECT_EQ(negatedText(*build::name("ok")), "!ok");
    EXPECT_EQ(negatedText(*build::logicalNot(build::name("ok"))), "ok");
    EXPECT_EQ(
        negatedText(*build::binary("&&", build::name("a"), build::name("b"))), "!(a && b)"
    );
}

TEST(SyntaxUtilsTest, TypeNames) {
    EXPECT_EQ(erasure("java.util.List<String>"), "List");
    EXPECT_TRUE(isArrayType("int[]"));
    EXPECT_FALSE(isArrayType("List<int[]>"));
    EXPECT_EQ(elementType("int[]"), "int");
    EXPECT_EQ(elementType("Map<String, Integer>"), "String");
    EXPECT_EQ(elementType("List<? extends Number>"), "Number");
    EXPECT_TRUE(elementType("Object").empty());
}
