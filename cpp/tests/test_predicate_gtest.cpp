// ==============================================================================
// test_predicate_gtest.cpp - Тесты предикатов запросов (GoogleTest)
// ==============================================================================
//
// query::predicate: eq? / not-eq? / match? / not-match? (Boost.Regex) / any-of?
//
// ==============================================================================

#include "moss/predicate.hpp"

#include <gtest/gtest.h>
#include <string>
#include <vector>

namespace moss::query::test {

namespace {

PredicateArg cap(uint32_t index) {
    return CaptureArg{index};
}

PredicateArg lit(std::string value) {
    return PredicateArg{std::move(value)};
}

}  // namespace

// ==============================================================================
// Разбор операторов
// ==============================================================================

TEST(PredicateTest, ParseOp_KnownNames) {
    EXPECT_EQ(parse_predicate_op("eq?"), PredicateOp::Eq);
    EXPECT_EQ(parse_predicate_op("not-eq?"), PredicateOp::NotEq);
    EXPECT_EQ(parse_predicate_op("match?"), PredicateOp::Match);
    EXPECT_EQ(parse_predicate_op("not-match?"), PredicateOp::NotMatch);
    EXPECT_EQ(parse_predicate_op("any-of?"), PredicateOp::AnyOf);
}

TEST(PredicateTest, ParseOp_LeadingHashIsStripped) {
    EXPECT_EQ(parse_predicate_op("#eq?"), PredicateOp::Eq);
    EXPECT_EQ(parse_predicate_op("#any-of?"), PredicateOp::AnyOf);
}

TEST(PredicateTest, ParseOp_UnknownName) {
    EXPECT_EQ(parse_predicate_op("set!"), PredicateOp::Unknown);
    EXPECT_EQ(parse_predicate_op("is?"), PredicateOp::Unknown);
    EXPECT_EQ(to_string(PredicateOp::Unknown), "unknown");
    EXPECT_EQ(to_string(PredicateOp::NotMatch), "not-match?");
}

// ==============================================================================
// eq? / not-eq?
// ==============================================================================

TEST(PredicateTest, Eq_CaptureEqualsLiteral_Passes) {
    // Arrange
    std::vector<Predicate> preds = {make_predicate("eq?", {cap(1), lit("dbg")})};
    std::vector<CapturedText> captures = {{0, "dbg!(x)"}, {1, "dbg"}};

    // Act & Assert
    EXPECT_TRUE(evaluate_predicates(preds, captures));
}

TEST(PredicateTest, Eq_CaptureDiffersFromLiteral_Rejects) {
    std::vector<Predicate> preds = {make_predicate("eq?", {cap(1), lit("dbg")})};
    std::vector<CapturedText> captures = {{1, "println"}};

    EXPECT_FALSE(evaluate_predicates(preds, captures));
}

TEST(PredicateTest, Eq_TwoCaptures) {
    std::vector<Predicate> preds = {make_predicate("eq?", {cap(0), cap(1)})};

    EXPECT_TRUE(evaluate_predicates(preds, {{0, "a"}, {1, "a"}}));
    EXPECT_FALSE(evaluate_predicates(preds, {{0, "a"}, {1, "b"}}));
}

TEST(PredicateTest, Eq_MissingCaptureResolvesToEmpty) {
    std::vector<Predicate> preds = {make_predicate("eq?", {cap(5), lit("")})};

    EXPECT_TRUE(evaluate_predicates(preds, {{0, "x"}}));
}

TEST(PredicateTest, NotEq_Inverts) {
    std::vector<Predicate> preds = {make_predicate("not-eq?", {cap(0), lit("self")})};

    EXPECT_TRUE(evaluate_predicates(preds, {{0, "other"}}));
    EXPECT_FALSE(evaluate_predicates(preds, {{0, "self"}}));
}

TEST(PredicateTest, Eq_FewerThanTwoArgs_Passes) {
    std::vector<Predicate> preds = {make_predicate("eq?", {cap(0)})};

    EXPECT_TRUE(evaluate_predicates(preds, {{0, "anything"}}));
}

TEST(PredicateTest, Eq_FirstNodeOfCaptureIsUsed) {
    std::vector<Predicate> preds = {make_predicate("eq?", {cap(0), lit("first")})};
    std::vector<CapturedText> captures = {{0, "first"}, {0, "second"}};

    EXPECT_TRUE(evaluate_predicates(preds, captures));
}

// ==============================================================================
// match? / not-match?
// ==============================================================================

TEST(PredicateTest, Match_SearchesSubstring) {
    std::vector<Predicate> preds = {make_predicate("match?", {cap(0), lit("print")})};

    EXPECT_TRUE(evaluate_predicates(preds, {{0, "Sprintf"}}));
    EXPECT_FALSE(evaluate_predicates(preds, {{0, "Errorf"}}));
}

TEST(PredicateTest, Match_AnchoredPattern) {
    std::vector<Predicate> preds = {make_predicate("match?", {cap(0), lit("^Print")})};

    EXPECT_TRUE(evaluate_predicates(preds, {{0, "Println"}}));
    EXPECT_FALSE(evaluate_predicates(preds, {{0, "Sprintln"}}));
}

TEST(PredicateTest, NotMatch_Inverts) {
    std::vector<Predicate> preds = {make_predicate("not-match?", {cap(0), lit("^test_")})};

    EXPECT_TRUE(evaluate_predicates(preds, {{0, "helper"}}));
    EXPECT_FALSE(evaluate_predicates(preds, {{0, "test_parse"}}));
}

TEST(PredicateTest, Match_InvalidRegex_AlwaysPasses) {
    // Arrange
    Predicate p = make_predicate("match?", {cap(0), lit("([unclosed")});

    // Assert
    EXPECT_FALSE(p.regex.has_value());
    EXPECT_TRUE(evaluate_predicates({p}, {{0, "anything"}}));
}

TEST(PredicateTest, Match_LiteralFirstArg_Passes) {
    std::vector<Predicate> preds = {make_predicate("match?", {lit("abc"), lit("^z")})};

    EXPECT_TRUE(evaluate_predicates(preds, {}));
}

TEST(PredicateTest, Match_RegexIsPrecompiled) {
    Predicate p = make_predicate("#match?", {cap(0), lit("^[a-z]+$")});

    EXPECT_EQ(p.op, PredicateOp::Match);
    EXPECT_EQ(p.name, "#match?");
    EXPECT_TRUE(p.regex.has_value());
}

TEST(PredicateTest, Match_InlineFlagsAndNamedGroups) {
    // Arrange
    Predicate icase = make_predicate("match?", {cap(0), lit("(?i)^todo")});
    Predicate named = make_predicate("match?", {cap(0), lit("^(?P<word>[a-z]+)_[0-9]+$")});
    Predicate extended = make_predicate("match?", {cap(0), lit("(?x) ^ fix  me $")});

    // Assert
    ASSERT_TRUE(icase.regex.has_value());
    ASSERT_TRUE(named.regex.has_value());
    ASSERT_TRUE(extended.regex.has_value());
    EXPECT_TRUE(evaluate_predicates({icase}, {{0, "TODO: later"}}));
    EXPECT_TRUE(evaluate_predicates({named}, {{0, "abc_42"}}));
    EXPECT_FALSE(evaluate_predicates({named}, {{0, "abc_x"}}));
    EXPECT_TRUE(evaluate_predicates({extended}, {{0, "fixme"}}));
}

TEST(PredicateTest, Match_AnchorsAreTextBoundaries) {
    std::vector<Predicate> preds = {make_predicate("match?", {cap(0), lit("^b$")})};

    EXPECT_FALSE(evaluate_predicates(preds, {{0, "a\nb\nc"}}));
    EXPECT_TRUE(evaluate_predicates(preds, {{0, "b"}}));
}

TEST(PredicateTest, NotMatch_LargeCapture_DoesNotCrash) {
    // Arrange: 200 KB capture без "TODO"
    Predicate p = make_predicate("not-match?", {cap(0), lit("^(a|b)*TODO")});
    ASSERT_TRUE(p.regex.has_value());
    const std::string big(200000, 'a');

    // Act / Assert: либо честный результат (нет совпадения), либо лимит
    // сложности Boost, который трактуется как прохождение предиката
    EXPECT_TRUE(evaluate_predicates({p}, {{0, big}}));
}

TEST(PredicateTest, Match_LargeCapture_FindsTail) {
    Predicate p = make_predicate("match?", {cap(0), lit("TODO$")});
    std::string big(250000, 'x');
    big += "TODO";

    EXPECT_TRUE(evaluate_predicates({p}, {{0, big}}));
}

// ==============================================================================
// any-of?
// ==============================================================================

TEST(PredicateTest, AnyOf_MatchesOneOfLiterals) {
    std::vector<Predicate> preds = {
        make_predicate("any-of?", {cap(0), lit("todo"), lit("unimplemented")})};

    EXPECT_TRUE(evaluate_predicates(preds, {{0, "todo"}}));
    EXPECT_TRUE(evaluate_predicates(preds, {{0, "unimplemented"}}));
    EXPECT_FALSE(evaluate_predicates(preds, {{0, "panic"}}));
}

TEST(PredicateTest, AnyOf_CaptureArgsInListAreIgnored) {
    std::vector<Predicate> preds = {make_predicate("any-of?", {cap(0), cap(0)})};

    EXPECT_FALSE(evaluate_predicates(preds, {{0, "x"}}));
}

// ==============================================================================
// Комбинации
// ==============================================================================

TEST(PredicateTest, UnknownOperator_NeverRejects) {
    std::vector<Predicate> preds = {make_predicate("is-not?", {cap(0), lit("local")}),
                                    make_predicate("set!", {lit("key"), lit("value")})};

    EXPECT_TRUE(evaluate_predicates(preds, {{0, "local"}}));
}

TEST(PredicateTest, AllPredicatesMustPass) {
    std::vector<Predicate> preds = {make_predicate("eq?", {cap(0), lit("fmt")}),
                                    make_predicate("match?", {cap(1), lit("^Print")})};

    EXPECT_TRUE(evaluate_predicates(preds, {{0, "fmt"}, {1, "Println"}}));
    EXPECT_FALSE(evaluate_predicates(preds, {{0, "log"}, {1, "Println"}}));
    EXPECT_FALSE(evaluate_predicates(preds, {{0, "fmt"}, {1, "Errorf"}}));
}

TEST(PredicateTest, EmptyPredicateList_Passes) {
    EXPECT_TRUE(evaluate_predicates({}, {}));
}

}  // namespace moss::query::test
