/**
 * Arbor Record, Predicate and Rule Tests
 */

#include <gtest/gtest.h>
#include "arbor/rule.hpp"

#include <limits>
#include <unordered_set>

using namespace arbor;

TEST(RecordTest, AttributesAndCategory) {
    Record record({{"color", "red"}, {"size", 3}}, "A");

    EXPECT_TRUE(record.has("color"));
    EXPECT_FALSE(record.has("shape"));
    EXPECT_EQ(record.value("color"), Value("red"));
    EXPECT_EQ(record.value("size"), Value(3));
    EXPECT_EQ(record.category(), Value("A"));
    EXPECT_EQ(record.n_attributes(), 2u);
}

TEST(RecordTest, AttributeNamesSorted) {
    Record record({{"z", 1}, {"a", 2}, {"m", 3}});

    std::vector<std::string> expected = {"a", "m", "z"};
    EXPECT_EQ(record.attribute_names(), expected);
    EXPECT_TRUE(record.category().is_null());
}

TEST(RecordTest, SetOverwrites) {
    Record record;
    record.set("x", 1).set("x", 2.5);
    record.set_category("B");

    EXPECT_EQ(record.value("x"), Value(2.5));
    EXPECT_EQ(record.category(), Value("B"));
}

TEST(RecordTest, MissingAttributeThrows) {
    Record record({{"color", "red"}}, "A");

    EXPECT_THROW(record.value("shape"), MissingAttributeError);
    try {
        record.value("shape");
        FAIL() << "expected MissingAttributeError";
    } catch (const MissingAttributeError& e) {
        EXPECT_EQ(e.attribute(), "shape");
    }
}

TEST(RecordTest, ToString) {
    Record record({{"a", 1}, {"b", "x"}}, "C");
    EXPECT_EQ(record.to_string(), "{a: 1, b: x} -> C");
}

TEST(PredicateTest, Equality) {
    auto eq = predicates::equal();
    auto ne = predicates::not_equal();

    EXPECT_TRUE(eq->test(Value("red"), Value("red")));
    EXPECT_FALSE(eq->test(Value("red"), Value("blue")));
    EXPECT_TRUE(eq->test(Value(2), Value(2.0)));
    EXPECT_TRUE(ne->test(Value("red"), Value("blue")));
    EXPECT_FALSE(ne->test(Value(1), Value(1)));
}

TEST(PredicateTest, Ordering) {
    EXPECT_TRUE(predicates::less()->test(Value(1), Value(2)));
    EXPECT_FALSE(predicates::less()->test(Value(2), Value(2)));
    EXPECT_TRUE(predicates::less_equal()->test(Value(2), Value(2.0)));
    EXPECT_TRUE(predicates::greater()->test(Value("b"), Value("a")));
    EXPECT_TRUE(predicates::greater_equal()->test(Value(3.5), Value(3)));
}

TEST(PredicateTest, OrderingRejectsMixedKinds) {
    EXPECT_FALSE(predicates::less()->test(Value(1), Value("z")));
    EXPECT_FALSE(predicates::greater_equal()->test(Value("z"), Value(1)));
    EXPECT_FALSE(predicates::less_equal()->test(Value(), Value()));
}

TEST(PredicateTest, SharedInstances) {
    EXPECT_EQ(predicates::equal(), predicates::equal());
    EXPECT_EQ(predicates::builtin().size(), 6u);
    EXPECT_EQ(predicates::by_name("<="), predicates::less_equal());
    EXPECT_EQ(predicates::by_name("!="), predicates::not_equal());
    EXPECT_THROW(predicates::by_name("~"), std::invalid_argument);
}

TEST(RuleTest, Match) {
    Rule rule("color", predicates::equal(), "red");

    EXPECT_TRUE(rule.match(Record({{"color", "red"}})));
    EXPECT_FALSE(rule.match(Record({{"color", "blue"}})));
    EXPECT_THROW(rule.match(Record({{"shape", "circle"}})), MissingAttributeError);
}

TEST(RuleTest, NaNReferenceMatchesOnlyNaN) {
    const double nan = std::numeric_limits<double>::quiet_NaN();
    Rule rule("x", predicates::equal(), nan);

    EXPECT_FALSE(rule.match(Record({{"x", 5}})));
    EXPECT_FALSE(rule.match(Record({{"x", 1.0}})));
    EXPECT_TRUE(rule.match(Record({{"x", nan}})));
}

TEST(RuleTest, ValueEquality) {
    Rule a("x", predicates::less_equal(), 3);
    Rule b("x", predicates::less_equal(), 3.0);
    Rule c("x", predicates::less(), 3);
    Rule d("y", predicates::less_equal(), 3);
    Rule e("x", predicates::less_equal(), 4);

    EXPECT_EQ(a, b);
    EXPECT_EQ(a.hash(), b.hash());
    EXPECT_NE(a, c);
    EXPECT_NE(a, d);
    EXPECT_NE(a, e);

    std::unordered_set<Rule> rules = {a, b, c, d, e};
    EXPECT_EQ(rules.size(), 4u);
}

TEST(RuleTest, RequiresPredicate) {
    EXPECT_THROW(Rule("x", nullptr, 1), std::invalid_argument);
}

TEST(RuleTest, ToString) {
    Rule rule("size", predicates::greater(), 10);
    EXPECT_EQ(rule.to_string(), "size > 10");
}
