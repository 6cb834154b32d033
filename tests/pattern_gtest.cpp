#include <gtest/gtest.h>
#include "alkey/pattern.hpp"
#include "fixtures.hpp"
#include <functional>
#include <thread>

using namespace alkey;
using alkey_test::Recorder;

namespace {

Handler returns(int n){ return [n](const Instance&){ return value(n); }; }

struct PatternGTest : ::testing::Test {
    std::shared_ptr<EventSink> sink = std::make_shared<EventSink>();
    Registry reg{sink};
    PatternCompiler pc{reg, sink};
    void SetUp() override {
        reg.define(alkey_test::option_type());
        reg.define(alkey_test::point_type());
    }
};

CompileError compile_error(PatternCompiler& pc, std::string_view type, std::vector<Clause> cs){
    try { pc.compile(type, std::move(cs)); }
    catch (const CompileError& e) { return e; }
    ADD_FAILURE() << "compile succeeded";
    return CompileError(CompileErrorKind::UnknownType, make_diag("none", "none"));
}

} // namespace

TEST_F(PatternGTest, FullCoverageIsExhaustive){
    auto p = pc.compile("Option", {on("Some", returns(1)), on("None", returns(0))});
    EXPECT_TRUE(p.table().exhaustive);
    EXPECT_TRUE(p.table().fallback.empty());
    EXPECT_EQ(p.type_name(), "Option");
    EXPECT_EQ(p.table().arms.at("Some"), std::vector<size_t>{0});
    EXPECT_EQ(p.table().arms.at("None"), std::vector<size_t>{1});
}

// Every N-variant sum: all N unconditional clauses compile exhaustively, and dropping any one
// clause (no wildcard) reports exactly that variant as missing.
TEST_F(PatternGTest, ExhaustivenessAcrossVariantCounts){
    for(size_t n=1; n<=6; ++n){
        const std::string name = "E" + std::to_string(n);
        reg.define(alkey_test::enum_type(name, n));
        std::vector<Clause> all;
        for(size_t i=0;i<n;++i) all.push_back(on("V" + std::to_string(i), returns(static_cast<int>(i))));
        EXPECT_TRUE(pc.compile(name, all).table().exhaustive) << name;

        for(size_t drop=0; drop<n; ++drop){
            std::vector<Clause> some;
            for(size_t i=0;i<n;++i) if(i != drop) some.push_back(all[i]);
            auto e = compile_error(pc, name, some);
            EXPECT_EQ(e.kind(), CompileErrorKind::NonExhaustiveMatch) << name << " drop " << drop;
            EXPECT_EQ(e.code(), "E1420");
            EXPECT_EQ(e.missing_variants(), std::vector<std::string>{"V" + std::to_string(drop)}) << name;
        }
    }
}

TEST_F(PatternGTest, MissingVariantsAreNamedInDeclarationOrder){
    reg.define(alkey_test::enum_type("Five", 5));
    auto e = compile_error(pc, "Five", {on("V3", returns(3)), on("V1", returns(1))});
    EXPECT_EQ(e.missing_variants(), (std::vector<std::string>{"V0", "V2", "V4"}));
    EXPECT_NE(std::string(e.what()).find("missing V0, V2, V4"), std::string::npos) << e.what();
}

TEST_F(PatternGTest, GuardedClausesDoNotCoverTheirVariant){
    auto positive = [](const Instance& i){ return i.at("value").as<int64_t>() > 0; };
    auto e = compile_error(pc, "Option", {on_if("Some", positive, returns(1), "positive"), on("None", returns(0))});
    EXPECT_EQ(e.kind(), CompileErrorKind::NonExhaustiveMatch);
    EXPECT_EQ(e.missing_variants(), std::vector<std::string>{"Some"});

    auto both = pc.compile("Option", {on_if("Some", positive, returns(1), "positive"), on("Some", returns(2)), on("None", returns(0))});
    EXPECT_TRUE(both.table().exhaustive);
    EXPECT_EQ(both.table().arms.at("Some"), (std::vector<size_t>{0, 1}));

    // a guarded wildcard still counts as a wildcard
    auto wild = pc.compile("Option", {on("Some", returns(1)), on_if("_", positive, returns(3), "positive")});
    EXPECT_FALSE(wild.table().exhaustive);
    EXPECT_EQ(wild.table().fallback, std::vector<size_t>{1});
}

// Removing the only unguarded clause of a variant leaves it missing, even when guarded clauses
// for it remain.
TEST_F(PatternGTest, DroppingTheUnguardedClauseReportsTheVariant){
    auto positive = [](const Instance& i){ return i.at("value").as<int64_t>() > 0; };
    EXPECT_TRUE(pc.compile("Option", {on_if("Some", positive, returns(1), "positive"), on("Some", returns(2)), on("None", returns(0))}).table().exhaustive);
    auto e = compile_error(pc, "Option", {on_if("Some", positive, returns(1), "positive"), on("None", returns(0))});
    EXPECT_EQ(e.code(), "E1420");
    EXPECT_EQ(e.missing_variants(), std::vector<std::string>{"Some"});
}

TEST_F(PatternGTest, GuardedOnlyVariantKeepsTheWildcard){
    auto positive = [](const Instance& i){ return i.at("value").as<int64_t>() > 0; };
    auto p = pc.compile("Option", {on_if("Some", positive, returns(1), "positive"), on("None", returns(0)), otherwise(returns(9))});
    EXPECT_FALSE(p.table().exhaustive);
    EXPECT_EQ(p.table().fallback, std::vector<size_t>{2});
}

TEST_F(PatternGTest, WildcardMakesAMatchTotalButNotExhaustive){
    auto p = pc.compile("Option", {on("Some", returns(1)), otherwise(returns(9))});
    EXPECT_FALSE(p.table().exhaustive);
    EXPECT_EQ(p.table().fallback, std::vector<size_t>{1});

    // a wildcard after full coverage is unreachable and dropped
    auto full = pc.compile("Option", {on("Some", returns(1)), on("None", returns(0)), otherwise(returns(9))});
    EXPECT_TRUE(full.table().exhaustive);
    EXPECT_TRUE(full.table().fallback.empty());
}

TEST_F(PatternGTest, CompileErrors){
    EXPECT_EQ(compile_error(pc, "Option", {on("Some", returns(1)), on("Some", returns(2)), on("None", returns(0))}).kind(), CompileErrorKind::DuplicateVariant);
    EXPECT_EQ(compile_error(pc, "Option", {otherwise(returns(1)), otherwise(returns(2))}).kind(), CompileErrorKind::DuplicateVariant);
    EXPECT_EQ(compile_error(pc, "Option", {on("Some", returns(1)), on("Maybe", returns(2)), on("None", returns(0))}).kind(), CompileErrorKind::UnknownVariant);
    EXPECT_EQ(compile_error(pc, "Nope", {otherwise(returns(1))}).kind(), CompileErrorKind::UnknownType);
    EXPECT_EQ(compile_error(pc, "Point", {otherwise(returns(1))}).kind(), CompileErrorKind::NotASumType);
    EXPECT_EQ(compile_error(pc, "Option", {on("Some", returns(1)), Clause{"None", {}, {}, {}}}).kind(), CompileErrorKind::MissingHandler);
    EXPECT_EQ(compile_error(pc, "Option", {on("Some", returns(1))}).code(), "E1420");
    // failures are not cached
    EXPECT_EQ(pc.cache_size(), 0u);
}

TEST_F(PatternGTest, MissingHandlerIsCheckedOnCacheHits){
    auto first = pc.compile("Option", {on("Some", returns(1)), on("None", returns(0))});
    EXPECT_FALSE(first.cache_hit());
    auto e = compile_error(pc, "Option", {on("Some", returns(1)), Clause{"None", {}, {}, {}}});
    EXPECT_EQ(e.kind(), CompileErrorKind::MissingHandler);
    EXPECT_EQ(e.code(), "E1425");
    EXPECT_EQ(pc.analysis_count(), 1u);
}

TEST_F(PatternGTest, SameShapeIsACacheHit){
    Recorder rec(*sink);
    std::vector<Clause> shape{on("Some", returns(1)), on("None", returns(0))};
    auto first = pc.compile("Option", shape);
    EXPECT_FALSE(first.cache_hit());
    EXPECT_EQ(pc.analysis_count(), 1u);

    // another call site with the same shape but its own handlers
    auto second = pc.compile("Option", {on("Some", returns(10)), on("None", returns(20))});
    EXPECT_TRUE(second.cache_hit());
    EXPECT_EQ(pc.analysis_count(), 1u);
    EXPECT_EQ(pc.cache_size(), 1u);
    EXPECT_EQ(&first.table(), &second.table());
    EXPECT_EQ(second.clauses()[0].handler(Instance{}).as<int64_t>(), 10);

    auto compiled = rec.of(EventKind::PatternCompiled);
    ASSERT_EQ(compiled.size(), 2u);
    EXPECT_FALSE(compiled[0].get<events::PatternCompiled>()->cache_hit);
    EXPECT_TRUE(compiled[1].get<events::PatternCompiled>()->cache_hit);
    EXPECT_TRUE(compiled[1].get<events::PatternCompiled>()->exhaustive);
    EXPECT_EQ(compiled[1].get<events::PatternCompiled>()->clause_signature, first.table().signature);
}

TEST_F(PatternGTest, ClauseOrderAndGuardKeysAreDistinctShapes){
    pc.compile("Option", {on("Some", returns(1)), on("None", returns(0))});
    pc.compile("Option", {on("None", returns(0)), on("Some", returns(1))});
    auto pos = [](const Instance&){ return true; };
    pc.compile("Option", {on_if("Some", pos, returns(1), "a"), otherwise(returns(0))});
    pc.compile("Option", {on_if("Some", pos, returns(1), "b"), otherwise(returns(0))});
    EXPECT_EQ(pc.analysis_count(), 4u);
    EXPECT_EQ(pc.cache_size(), 4u);
}

TEST_F(PatternGTest, SignatureFormat){
    auto pos = [](const Instance&){ return true; };
    std::vector<Clause> cs{on("Some", returns(1)), on_if("None", pos, returns(0), "positive"), otherwise(returns(2))};
    EXPECT_EQ(PatternCompiler::signature_of("Option", 3, cs), "Option@3:Some|None?positive|_");
}

TEST_F(PatternGTest, RedefinitionInvalidatesByRevision){
    std::vector<Clause> shape{on("Some", returns(1)), on("None", returns(0))};
    pc.compile("Option", shape);
    reg.define(TypeDefinition::sum("Option", {{"Some", {{"value", scalar_tag(TypeTag::Kind::Int)}}}, {"None", {}}, {"Unknown", {}}}));
    auto e = compile_error(pc, "Option", shape);
    EXPECT_EQ(e.missing_variants(), std::vector<std::string>{"Unknown"});
    EXPECT_EQ(pc.analysis_count(), 2u);
}

TEST_F(PatternGTest, ClearCacheForcesReanalysis){
    std::vector<Clause> shape{on("Some", returns(1)), on("None", returns(0))};
    pc.compile("Option", shape);
    pc.clear_cache();
    EXPECT_EQ(pc.cache_size(), 0u);
    EXPECT_FALSE(pc.compile("Option", shape).cache_hit());
    EXPECT_EQ(pc.analysis_count(), 2u);
}

TEST_F(PatternGTest, CompileFailureEmitsEvent){
    Recorder rec(*sink);
    EXPECT_THROW(pc.compile("Option", {on("None", returns(0))}), CompileError);
    auto failed = rec.of(EventKind::CompileFailed);
    ASSERT_EQ(failed.size(), 1u);
    EXPECT_EQ(failed[0].get<events::CompileFailed>()->error_kind, CompileErrorKind::NonExhaustiveMatch);
    EXPECT_EQ(rec.count(EventKind::PatternCompiled), 0u);
}

TEST_F(PatternGTest, ConcurrentCompilesShareOneEntry){
    std::vector<std::thread> ts;
    for(int t=0;t<8;++t) ts.emplace_back([&]{
        for(int i=0;i<50;++i) pc.compile("Option", {on("Some", returns(1)), on("None", returns(0))});
    });
    for(auto& t : ts) t.join();
    EXPECT_EQ(pc.cache_size(), 1u);
    // racing first compiles may each analyze, but never more than once per thread
    EXPECT_GE(pc.analysis_count(), 1u);
    EXPECT_LE(pc.analysis_count(), 8u);
}
