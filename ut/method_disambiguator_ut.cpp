#include <gtest/gtest.h>

#include "method_disambiguator.hpp"

TEST(MethodDisambiguator, SingleOverloadUsesBareName) {
    MethodDisambiguator disambiguator;
    disambiguator.observe("Foo", "run", "(int)");
    EXPECT_EQ(disambiguator.disambiguate("Foo", "run", "(int)"), "run");
    EXPECT_EQ(disambiguator.overload_count("Foo", "run"), 1u);
}

TEST(MethodDisambiguator, OverloadsGetParameterLists) {
    MethodDisambiguator disambiguator;
    disambiguator.observe("Foo", "run", "(int)");
    disambiguator.observe("Foo", "run", "string");
    disambiguator.observe("Foo", "run", "");

    EXPECT_EQ(disambiguator.disambiguate("Foo", "run", "(int)"), "run(int)");
    EXPECT_EQ(disambiguator.disambiguate("Foo", "run", "string"), "run(string)");
    EXPECT_EQ(disambiguator.disambiguate("Foo", "run", ""), "run()");
}

TEST(MethodDisambiguator, OtherClassesAreIndependent) {
    MethodDisambiguator disambiguator;
    disambiguator.observe("Foo", "run", "(int)");
    disambiguator.observe("Foo", "run", "(long)");
    disambiguator.observe("Bar", "run", "(int)");

    EXPECT_EQ(disambiguator.disambiguate("Bar", "run", "(int)"), "run");
    EXPECT_EQ(disambiguator.overload_count("Baz", "run"), 0u);
}

TEST(MethodDisambiguator, LaterOverloadInvalidatesRendering) {
    MethodDisambiguator disambiguator;
    EXPECT_EQ(disambiguator.disambiguate("Foo", "run", "(int)"), "run");
    disambiguator.observe("Foo", "run", "(long)");
    EXPECT_EQ(disambiguator.disambiguate("Foo", "run", "(int)"), "run(int)");
}
