#include <gtest/gtest.h>
#include "alkey/dispatch.hpp"
#include "alkey/validator.hpp"
#include "fixtures.hpp"

using namespace alkey;
using alkey_test::Recorder;

namespace {

struct DispatchGTest : ::testing::Test {
    std::shared_ptr<EventSink> sink = std::make_shared<EventSink>();
    Registry reg{sink};
    Validator v{reg, sink};
    PatternCompiler pc{reg, sink};
    Dispatcher d{sink};
    void SetUp() override {
        reg.define(alkey_test::option_type());
        reg.define(alkey_test::result_type());
        reg.define(alkey_test::point_type());
    }
    instance_ptr some(int n){ return v.construct_variant("Option", "Some", {{"value", n}}); }
    instance_ptr none(){ return v.construct_variant("Option", "None", {}); }
};

Guard value_above(int64_t floor){ return [floor](const Instance& i){ return i.at("value").as<int64_t>() > floor; }; }

} // namespace

TEST_F(DispatchGTest, SelectsTheVariantsHandler){
    auto p = pc.compile("Option", {
        on("Some", [](const Instance& i){ return value(i.at("value").as<int64_t>() * 2); }),
        on("None", [](const Instance&){ return value("none"); }),
    });
    EXPECT_EQ(d.dispatch(p, some(21)).as<int64_t>(), 42);
    EXPECT_EQ(d.dispatch(p, none()).as<std::string>(), "none");
}

TEST_F(DispatchGTest, FirstPassingGuardWinsThenUnguarded){
    auto p = pc.compile("Option", {
        on_if("Some", value_above(100), [](const Instance&){ return value("huge"); }, "gt100"),
        on_if("Some", value_above(10), [](const Instance&){ return value("big"); }, "gt10"),
        on("Some", [](const Instance&){ return value("small"); }),
        on("None", [](const Instance&){ return value("none"); }),
    });
    EXPECT_EQ(d.dispatch(p, some(500)).as<std::string>(), "huge");
    EXPECT_EQ(d.dispatch(p, some(50)).as<std::string>(), "big");
    EXPECT_EQ(d.dispatch(p, some(5)).as<std::string>(), "small");
}

TEST_F(DispatchGTest, WildcardIsConsultedAfterTheVariantsOwnClauses){
    // the wildcard comes first in source order but only catches what Some's clauses reject
    auto p = pc.compile("Option", {
        otherwise([](const Instance& i){ return value("fallback " + *i.variant); }),
        on_if("Some", value_above(0), [](const Instance&){ return value("positive"); }, "pos"),
    });
    EXPECT_EQ(d.dispatch(p, some(1)).as<std::string>(), "positive");
    EXPECT_EQ(d.dispatch(p, some(-1)).as<std::string>(), "fallback Some");
    EXPECT_EQ(d.dispatch(p, none()).as<std::string>(), "fallback None");
}

// Guards are not checked at compile time. A variant left to guarded clauses and a guarded
// wildcard fails at dispatch when every guard rejects, and the compiled table stays usable.
TEST_F(DispatchGTest, GuardExhaustionFailure){
    Recorder rec(*sink);
    auto p = pc.compile("Option", {
        on_if("Some", value_above(0), [](const Instance&){ return value("positive"); }, "pos"),
        on_if("Some", [](const Instance& i){ return i.at("value").as<int64_t>() < 0; }, [](const Instance&){ return value("negative"); }, "neg"),
        on("None", [](const Instance&){ return value("none"); }),
        on_if("_", [](const Instance& i){ return i.find("value") == nullptr; }, [](const Instance&){ return value("empty"); }, "no_value"),
    });
    ASSERT_FALSE(p.table().exhaustive);
    EXPECT_EQ(d.dispatch(p, some(3)).as<std::string>(), "positive");
    EXPECT_EQ(d.dispatch(p, some(-3)).as<std::string>(), "negative");
    try {
        d.dispatch(p, some(0));
        FAIL() << "zero passes no guard";
    } catch (const DispatchError& e) {
        EXPECT_EQ(e.kind(), DispatchErrorKind::GuardExhaustionFailure);
        EXPECT_EQ(e.code(), "E1430");
        EXPECT_NE(std::string(e.what()).find("Option.Some"), std::string::npos) << e.what();
    }
    // recoverable: the same compiled match keeps working
    EXPECT_EQ(d.dispatch(p, none()).as<std::string>(), "none");

    auto failed = rec.of(EventKind::DispatchFailed);
    ASSERT_EQ(failed.size(), 1u);
    EXPECT_EQ(failed[0].get<events::DispatchFailed>()->error_kind, DispatchErrorKind::GuardExhaustionFailure);
    EXPECT_EQ(rec.count(EventKind::PatternDispatched), 3u);
}

TEST_F(DispatchGTest, GuardedWildcardCanAlsoExhaust){
    auto p = pc.compile("Option", {
        on("Some", [](const Instance&){ return value(1); }),
        on_if("_", [](const Instance&){ return false; }, [](const Instance&){ return value(2); }, "never"),
    });
    EXPECT_THROW(d.dispatch(p, none()), DispatchError);
    EXPECT_EQ(d.dispatch(p, some(1)).as<int64_t>(), 1);
}

TEST_F(DispatchGTest, UnguardedWildcardCatchesRejectedGuards){
    auto p = pc.compile("Option", {
        on_if("Some", value_above(0), [](const Instance&){ return value("positive"); }, "pos"),
        on("None", [](const Instance&){ return value("none"); }),
        otherwise([](const Instance&){ return value("other"); }),
    });
    EXPECT_EQ(d.dispatch(p, some(1)).as<std::string>(), "positive");
    EXPECT_EQ(d.dispatch(p, some(-1)).as<std::string>(), "other");
    EXPECT_EQ(d.dispatch(p, none()).as<std::string>(), "none");
}

TEST_F(DispatchGTest, WildcardAfterUnguardedCoverageIsUnreachable){
    auto p = pc.compile("Option", {
        on("Some", [](const Instance&){ return value("some"); }),
        on("None", [](const Instance&){ return value("none"); }),
        otherwise([](const Instance&){ return value("other"); }),
    });
    EXPECT_TRUE(p.table().fallback.empty());
    EXPECT_EQ(d.dispatch(p, some(-1)).as<std::string>(), "some");
}

TEST_F(DispatchGTest, TypeMismatch){
    auto p = pc.compile("Option", {on("Some", [](const Instance&){ return value(1); }), on("None", [](const Instance&){ return value(0); })});
    auto err = v.construct_variant("Result", "Error", {{"message", "boom"}});
    auto pt = v.construct_product("Point", {{"x", 1}, {"y", 2}});
    auto kind_of = [&](const instance_ptr& i){
        try { d.dispatch(p, i); } catch (const DispatchError& e) { return e.kind(); }
        ADD_FAILURE() << "dispatch succeeded";
        return DispatchErrorKind::GuardExhaustionFailure;
    };
    EXPECT_EQ(kind_of(err), DispatchErrorKind::TypeMismatch);
    EXPECT_EQ(kind_of(pt), DispatchErrorKind::TypeMismatch);
    EXPECT_EQ(kind_of(nullptr), DispatchErrorKind::TypeMismatch);

    // an instance built before a redefinition does not run against the new table, and vice versa
    auto old = some(1);
    reg.define(alkey_test::option_type());
    auto fresh = pc.compile("Option", {on("Some", [](const Instance&){ return value(1); }), on("None", [](const Instance&){ return value(0); })});
    EXPECT_FALSE(fresh.cache_hit());
    EXPECT_THROW(d.dispatch(fresh, old), DispatchError);
    EXPECT_THROW(d.dispatch(p, some(1)), DispatchError);
    EXPECT_EQ(d.dispatch(fresh, some(1)).as<int64_t>(), 1);
}

TEST_F(DispatchGTest, DispatchDoesNotMutateTheInstance){
    auto s = some(7);
    Instance before = *s;
    auto p = pc.compile("Option", {on("Some", [](const Instance& i){ return i.at("value"); }), otherwise([](const Instance&){ return value(); })});
    EXPECT_EQ(d.dispatch(p, s).as<int64_t>(), 7);
    EXPECT_TRUE(equal(before, *s));
}

TEST_F(DispatchGTest, EmitsPatternDispatched){
    Recorder rec(*sink);
    auto p = pc.compile("Option", {on("Some", [](const Instance&){ return value(1); }), on("None", [](const Instance&){ return value(0); })});
    d.dispatch(p, none());
    auto evs = rec.of(EventKind::PatternDispatched);
    ASSERT_EQ(evs.size(), 1u);
    EXPECT_EQ(evs[0].get<events::PatternDispatched>()->type, "Option");
    EXPECT_EQ(evs[0].get<events::PatternDispatched>()->variant, "None");
}
