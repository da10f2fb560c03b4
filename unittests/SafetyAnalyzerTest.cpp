/*
 * Copyright (c) 2024, Trail of Bits, Inc.
 *
 * This source code is licensed in accordance with the terms specified in
 * the LICENSE file found in the root directory of this source tree.
 */

#include <gtest/gtest.h>

#include <pipelift/AST/Builder.hpp>
#include <pipelift/Analysis/LoopExtractor.hpp>
#include <pipelift/Analysis/SafetyAnalyzer.hpp>
#include <pipelift/Util/Options.hpp>

using namespace pipelift;
using namespace pipelift::analysis;
namespace build = pipelift::ast::build;

namespace {

    ast::ExprPtr items() { return build::name("items", build::param("List<String>")); }

    ast::ExprPtr element() { return build::name("s", build::local("String")); }

    ast::StmtPtr println(ast::ExprPtr value) {
        return build::exprStmt(build::call(
            build::fieldAccess(build::name("System"), "out"), "println", build::exprs(std::move(value))
        ));
    }

    // Method `m(List<String> items)` whose body is `body`; the loop is body[loop_index].
    struct MethodFixture
    {
        ast::MethodDecl method;

        explicit MethodFixture(std::vector< ast::StmtPtr > body) {
            std::vector< ast::VarDecl > params;
            params.push_back(build::var("List<String>", "items"));
            method = build::method("m", "void", std::move(params), std::move(body));
        }

        const ast::ForEachStmt &loop(std::size_t index) const {
            return llvm::cast< ast::ForEachStmt >(*method.body->body()[index]);
        }
    };

    std::vector< ast::StmtPtr > one(ast::StmtPtr stmt) { return build::stmts(std::move(stmt)); }

} // namespace

TEST(SafetyAnalyzerTest, SourceKinds) {
    Options options;
    EXPECT_EQ(classifySourceKind("int[]", options), model::SourceKind::Array);
    EXPECT_EQ(classifySourceKind("String[]", options), model::SourceKind::Array);
    EXPECT_FALSE(classifySourceKind("char[]", options).has_value());
    EXPECT_EQ(classifySourceKind("java.util.List<String>", options), model::SourceKind::Collection);
    EXPECT_EQ(classifySourceKind("Iterable<Path>", options), model::SourceKind::Iterable);
    EXPECT_FALSE(classifySourceKind("Map<String, Integer>", options).has_value());
    EXPECT_FALSE(classifySourceKind("Stream<String>", options).has_value());
    EXPECT_EQ(classifySourceKind("", options), model::SourceKind::Collection);
}

TEST(SafetyAnalyzerTest, ConfiguredCollectionTypesWin) {
    Options options;
    options.collection_types.push_back("com.acme.Stream");
    EXPECT_EQ(classifySourceKind("com.acme.Stream<String>", options), model::SourceKind::Collection);
}

TEST(SafetyAnalyzerTest, ThreadSafetyOfLocalsFollowsInitializer) {
    Options options;
    MethodFixture fixture(build::stmts(
        build::decl("List<String>", "fresh", build::newObject("ArrayList<>")),
        build::decl(
            "List<String>", "frozen",
            build::call(build::name("Collections"), "unmodifiableList", build::exprs(items()))
        ),
        build::decl(
            "List<String>", "guarded",
            build::call(build::name("Collections"), "synchronizedList", build::exprs(items()))
        ),
        build::decl("List<String>", "safe", build::newObject("CopyOnWriteArrayList<>"))
    ));
    MethodContext context(fixture.method);

    auto local = [](const char *name) { return build::name(name, build::local("List<String>")); };
    EXPECT_EQ(classifyThreadSafety(*local("fresh"), context, options), ThreadSafety::LocallyCreated);
    EXPECT_EQ(classifyThreadSafety(*local("frozen"), context, options), ThreadSafety::Immutable);
    EXPECT_EQ(
        classifyThreadSafety(*local("guarded"), context, options), ThreadSafety::SynchronizedWrapper
    );
    EXPECT_EQ(classifyThreadSafety(*local("safe"), context, options), ThreadSafety::ConcurrentSafeType);
    EXPECT_EQ(classifyThreadSafety(*items(), context, options), ThreadSafety::LocallyCreated);
}

TEST(SafetyAnalyzerTest, ThreadSafetyOfFields) {
    Options options;
    options.concurrent_types.push_back("LockFreeList");
    MethodFixture fixture(build::stmts());
    MethodContext context(fixture.method);

    auto plain = build::name("names", build::field("List<String>"));
    EXPECT_EQ(classifyThreadSafety(*plain, context, options), ThreadSafety::PotentiallyShared);

    auto concurrent = build::name("queue", build::field("ConcurrentLinkedQueue<String>"));
    EXPECT_EQ(classifyThreadSafety(*concurrent, context, options), ThreadSafety::ConcurrentSafeType);

    auto configured = build::name("fast", build::field("LockFreeList<String>"));
    EXPECT_EQ(classifyThreadSafety(*configured, context, options), ThreadSafety::ConcurrentSafeType);

    auto unresolved = build::name("mystery");
    EXPECT_EQ(classifyThreadSafety(*unresolved, context, options), ThreadSafety::PotentiallyShared);
}

TEST(SafetyAnalyzerTest, StructureRejectsBreak) {
    Options options;
    MethodFixture fixture(one(build::forEach(
        build::var("String", "s"), items(),
        build::block(build::stmts(build::ifStmt(
            build::call(element(), "isEmpty"), build::breakStmt()
        )))
    )));
    MethodContext context(fixture.method);
    auto view    = viewEnhancedFor(fixture.loop(0));
    auto verdict = checkStructure(*view, context, options);
    EXPECT_FALSE(static_cast< bool >(verdict));
    EXPECT_EQ(verdict.reason, "loop body contains break");
}

TEST(SafetyAnalyzerTest, StructureRejectsBreakOfNestedSwitch) {
    Options options;
    std::vector< ast::SwitchCase > cases;
    cases.push_back(ast::SwitchCase{ .labels = build::exprs(build::intLit(1)),
                                     .body   = build::stmts(build::breakStmt()) });
    MethodFixture fixture(one(build::forEach(
        build::var("String", "s"), items(),
        build::block(build::stmts(
            build::switchStmt(build::call(element(), "length"), std::move(cases))
        ))
    )));
    MethodContext context(fixture.method);
    auto view = viewEnhancedFor(fixture.loop(0));
    EXPECT_FALSE(static_cast< bool >(checkStructure(*view, context, options)));
}

TEST(SafetyAnalyzerTest, StructureRejectsLabeledContinue) {
    Options options;
    MethodFixture fixture(one(build::forEach(
        build::var("String", "s"), items(),
        build::block(build::stmts(
            build::ifStmt(build::call(element(), "isEmpty"), build::continueStmt("outer"))
        ))
    )));
    MethodContext context(fixture.method);
    auto view    = viewEnhancedFor(fixture.loop(0));
    auto verdict = checkStructure(*view, context, options);
    EXPECT_EQ(verdict.reason, "loop body contains a labeled continue");
}

TEST(SafetyAnalyzerTest, StructureRejectsTryAndSourceMutation) {
    Options options;
    MethodFixture fixture(build::stmts(
        build::forEach(
            build::var("String", "s"), items(),
            build::block(build::stmts(build::tryStmt(build::block(build::stmts(println(element()))), {})))
        ),
        build::forEach(
            build::var("String", "s"), items(),
            build::block(build::stmts(
                build::exprStmt(build::call(items(), "remove", build::exprs(element())))
            ))
        )
    ));
    MethodContext context(fixture.method);

    auto with_try = viewEnhancedFor(fixture.loop(0));
    EXPECT_EQ(
        checkStructure(*with_try, context, options).reason,
        "loop body contains a try, switch or synchronized statement"
    );

    auto mutating = viewEnhancedFor(fixture.loop(1));
    EXPECT_EQ(
        checkStructure(*mutating, context, options).reason,
        "loop body modifies its source through 'remove'"
    );
}

TEST(SafetyAnalyzerTest, StructureAcceptsPlainBody) {
    Options options;
    MethodFixture fixture(one(
        build::forEach(build::var("String", "s"), items(), build::block(build::stmts(println(element()))))
    ));
    MethodContext context(fixture.method);
    auto view = viewEnhancedFor(fixture.loop(0));
    EXPECT_TRUE(static_cast< bool >(checkStructure(*view, context, options)));
}

TEST(SafetyAnalyzerTest, SideEffectsAllowOnlyLocalsFieldsAndAccumulator) {
    Options options;
    MethodFixture fixture(build::stmts(
        build::decl("int", "last", build::intLit(0)),
        build::forEach(
            build::var("String", "s"), items(),
            build::block(build::stmts(
                build::exprStmt(build::assign("=", build::name("last", build::local("int")),
                                              build::call(element(), "length"))),
                println(element())
            ))
        ),
        build::forEach(
            build::var("String", "s"), items(),
            build::block(build::stmts(
                build::exprStmt(build::assign("=", build::name("hits", build::field("int")),
                                              build::call(element(), "length"))),
                println(element())
            ))
        )
    ));

    model::LoopModel no_accumulator;

    auto outer   = viewEnhancedFor(fixture.loop(1));
    auto verdict = checkSideEffects(*outer, no_accumulator);
    EXPECT_FALSE(static_cast< bool >(verdict));
    EXPECT_EQ(verdict.reason, "loop body assigns outer variable 'last'");

    auto field = viewEnhancedFor(fixture.loop(2));
    EXPECT_TRUE(static_cast< bool >(checkSideEffects(*field, no_accumulator)));
}

TEST(SafetyAnalyzerTest, SideEffectsAllowReduceAccumulator) {
    MethodFixture fixture(one(build::forEach(
        build::var("String", "s"), items(),
        build::block(build::stmts(build::exprStmt(build::assign(
            "+=", build::name("total", build::local("int")), build::call(element(), "length")
        ))))
    )));
    model::LoopModel reduce;
    reduce.terminal = model::ReduceTerminal{ .accumulator = "total" };

    auto view = viewEnhancedFor(fixture.loop(0));
    EXPECT_TRUE(static_cast< bool >(checkSideEffects(*view, reduce)));
}

TEST(SafetyAnalyzerTest, CapturedVariablesMustBeEffectivelyFinal) {
    Options options;
    auto prefix = [] { return build::name("prefix", build::local("String")); };
    MethodFixture fixture(build::stmts(
        build::decl("String", "prefix", build::strLit(">")),
        build::forEach(
            build::var("String", "s"), items(),
            build::block(build::stmts(
                println(build::binary("+", prefix(), element(), "String"))
            ))
        ),
        build::exprStmt(build::assign("=", prefix(), build::strLit("<")))
    ));
    MethodContext context(fixture.method);
    EXPECT_EQ(context.modifiedNames().count("prefix"), 1U);

    auto view  = viewEnhancedFor(fixture.loop(1));
    auto extracted = extractLoopModel(*view, ExtractionContext{}, options);
    const auto *loop_model = std::get_if< model::LoopModel >(&extracted);
    ASSERT_NE(loop_model, nullptr);
    auto verdict = checkCapturedVariables(*loop_model, context);
    EXPECT_FALSE(static_cast< bool >(verdict));
    EXPECT_EQ(verdict.reason, "captured variable 'prefix' is not effectively final");
}
