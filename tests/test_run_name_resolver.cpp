#include <gtest/gtest.h>
#include <managers/run_name_resolver.hpp>
#include <core/name_pattern.hpp>
#include "fakes.hpp"

TEST(RunNameResolver, AcceptsValidName) {
    FakeHistory history;
    RunNameResolver resolver(history);

    auto r = resolver.resolve(std::string("my-run"), true);
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(r.value, "my-run");
    EXPECT_EQ(history.exists_calls, 1);
}

TEST(RunNameResolver, ResolvedNameIsStableOnSecondPass) {
    FakeHistory history;
    RunNameResolver resolver(history);

    auto r = resolver.resolve(std::string("alpha-beta-1"), true);
    ASSERT_TRUE(r.is_ok()) << r.error;
    auto again = resolver.resolve(r.value, true);
    ASSERT_TRUE(again.is_ok()) << again.error;
    EXPECT_EQ(again.value, r.value);
}

TEST(RunNameResolver, ReservedNameLast) {
    FakeHistory enabled;
    RunNameResolver r1(enabled);
    auto a = r1.resolve(std::string("last"), true);
    EXPECT_TRUE(a.is_err());
    EXPECT_EQ(a.kind, ErrorKind::ReservedRunName);

    FakeHistory disabled(false);
    RunNameResolver r2(disabled);
    auto b = r2.resolve(std::string("last"), true);
    EXPECT_EQ(b.kind, ErrorKind::ReservedRunName);

    FakeHistory with_last;
    with_last.names.insert("last");
    RunNameResolver r3(with_last);
    EXPECT_EQ(r3.resolve(std::string("last"), false).kind, ErrorKind::ReservedRunName);
}

TEST(RunNameResolver, ReservedNameIsCaseSensitive) {
    FakeHistory history;
    RunNameResolver resolver(history);
    auto r = resolver.resolve(std::string("Last"), false);
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(r.value, "Last");
}

TEST(RunNameResolver, ClusterGrammarCheckedBeforeNormalization) {
    FakeHistory history;
    RunNameResolver resolver(history);

    // "my-run" would be fine, but the raw name is what gets checked
    auto r = resolver.resolve(std::string("My_Run"), true);
    EXPECT_TRUE(r.is_err());
    EXPECT_EQ(r.kind, ErrorKind::InvalidClusterName);
    EXPECT_NE(r.error.find("K8s pod name"), std::string::npos);
    EXPECT_EQ(history.exists_calls, 0);
}

TEST(RunNameResolver, UnderscoreRejectedForClusterRuns) {
    FakeHistory history;
    RunNameResolver resolver(history);
    EXPECT_EQ(resolver.resolve(std::string("my_run"), true).kind, ErrorKind::InvalidClusterName);
}

TEST(RunNameResolver, UnderscoreNormalizedWhenNotClusterBound) {
    FakeHistory history;
    RunNameResolver resolver(history);
    auto r = resolver.resolve(std::string("my_run"), false);
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(r.value, "my-run");
}

TEST(RunNameResolver, MalformedName) {
    FakeHistory history;
    RunNameResolver resolver(history);

    // Passes the cluster grammar, fails the run-name grammar
    auto r = resolver.resolve(std::string("9lives"), true);
    EXPECT_TRUE(r.is_err());
    EXPECT_EQ(r.kind, ErrorKind::MalformedRunName);
    EXPECT_NE(r.error.find("It must match the pattern"), std::string::npos);
    EXPECT_NE(r.error.find(run_name_grammar_description()), std::string::npos);

    EXPECT_EQ(resolver.resolve(std::string("a.b"), true).kind, ErrorKind::MalformedRunName);
    EXPECT_EQ(resolver.resolve(std::string(81, 'a'), true).kind, ErrorKind::MalformedRunName);
}

TEST(RunNameResolver, MissingNameWithoutHistory) {
    FakeHistory history(false);
    RunNameResolver resolver(history);

    auto r = resolver.resolve(std::nullopt, true);
    EXPECT_TRUE(r.is_err());
    EXPECT_EQ(r.kind, ErrorKind::MissingRunName);
    EXPECT_EQ(history.generate_calls, 0);
}

TEST(RunNameResolver, EmptyNameCountsAsMissing) {
    FakeHistory history(false);
    RunNameResolver resolver(history);
    EXPECT_EQ(resolver.resolve(std::string(""), true).kind, ErrorKind::MissingRunName);
}

TEST(RunNameResolver, GeneratesNameFromHistory) {
    FakeHistory history;
    history.names = {"old-run"};
    history.mint_queue = {"quirky-einstein"};
    RunNameResolver resolver(history);

    auto r = resolver.resolve(std::nullopt, true);
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(r.value, "quirky-einstein");
    EXPECT_EQ(history.names.count(r.value), 0u);
    EXPECT_EQ(history.generate_calls, 1);
    // Minted names are not re-checked
    EXPECT_EQ(history.exists_calls, 0);
}

TEST(RunNameResolver, GeneratedNameIsNeverAnExistingOne) {
    FakeHistory history;
    history.names = {"happy-curie"};
    history.mint_queue = {"happy-curie", "sleepy-turing"};
    RunNameResolver resolver(history);

    auto r = resolver.resolve(std::nullopt, true);
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(r.value, "sleepy-turing");
}

TEST(RunNameResolver, DuplicateName) {
    FakeHistory history;
    history.names = {"old-run"};
    RunNameResolver resolver(history);

    auto r = resolver.resolve(std::string("old-run"), true);
    EXPECT_TRUE(r.is_err());
    EXPECT_EQ(r.kind, ErrorKind::DuplicateRunName);
    EXPECT_NE(r.error.find("already used"), std::string::npos);
}

TEST(RunNameResolver, DisabledHistorySkipsDuplicateCheck) {
    FakeHistory history(false);
    history.names = {"old-run"};
    RunNameResolver resolver(history);

    auto r = resolver.resolve(std::string("old-run"), true);
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(history.exists_calls, 0);
}
