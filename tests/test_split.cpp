/**
 * Arbor Split Search Tests
 */

#include <gtest/gtest.h>
#include "arbor/split.hpp"

#include <algorithm>
#include <cmath>

using namespace arbor;

namespace {

RecordSet colors() {
    return {
        Record({{"color", "red"},  {"shape", "circle"}}, "A"),
        Record({{"color", "red"},  {"shape", "square"}}, "A"),
        Record({{"color", "blue"}, {"shape", "circle"}}, "B"),
        Record({{"color", "blue"}, {"shape", "square"}}, "B"),
    };
}

// Equality that counts how often it is evaluated
class CountingEqual : public Predicate {
public:
    const char* name() const override { return "=="; }
    bool test(const Value& candidate, const Value& reference) const override {
        ++calls;
        return candidate == reference;
    }
    mutable int calls = 0;
};

} // namespace

TEST(EntropyTest, SingleCategoryIsZero) {
    RecordSet records = {Record({{"x", 1}}, "A"), Record({{"x", 2}}, "A")};
    EXPECT_DOUBLE_EQ(entropy(make_refs(records)), 0.0);
}

TEST(EntropyTest, EmptyIsZero) {
    EXPECT_DOUBLE_EQ(entropy(RecordRefs()), 0.0);
}

TEST(EntropyTest, NaturalLog) {
    RecordSet records = colors();
    EXPECT_NEAR(entropy(make_refs(records)), std::log(2.0), 1e-12);

    CategoryCounts counts = {{Value("A"), 1}, {Value("B"), 1}, {Value("C"), 1}};
    EXPECT_NEAR(entropy(counts), std::log(3.0), 1e-12);
}

TEST(EntropyTest, NonNegative) {
    CategoryCounts counts = {{Value("A"), 9}, {Value("B"), 1}};
    EXPECT_GT(entropy(counts), 0.0);
    EXPECT_LT(entropy(counts), std::log(2.0));
}

TEST(MostFrequentTest, Majority) {
    CategoryCounts counts = {{Value("A"), 1}, {Value("B"), 3}};
    EXPECT_EQ(most_frequent_category(counts), Value("B"));
}

TEST(MostFrequentTest, TieTakesSmallestCategory) {
    RecordSet records = {Record({}, "zebra"), Record({}, "ant"), Record({}, "moose")};
    EXPECT_EQ(most_frequent_category(make_refs(records)), Value("ant"));

    CategoryCounts counts = {{Value(2), 4}, {Value(1), 4}};
    EXPECT_EQ(most_frequent_category(counts), Value(1));
}

TEST(MostFrequentTest, EmptyIsNull) {
    EXPECT_TRUE(most_frequent_category(RecordRefs()).is_null());
}

TEST(SplitFinderTest, PartitionIsCompleteAndOrdered) {
    RecordSet records = colors();
    RecordRefs items = make_refs(records);
    Rule rule("shape", predicates::equal(), "circle");

    SplitResult result = SplitFinder::split(rule, items);

    ASSERT_EQ(result.matched.size(), 2u);
    ASSERT_EQ(result.not_matched.size(), 2u);
    EXPECT_EQ(result.matched[0], &records[0]);
    EXPECT_EQ(result.matched[1], &records[2]);
    EXPECT_EQ(result.not_matched[0], &records[1]);
    EXPECT_EQ(result.not_matched[1], &records[3]);

    for (const Record* item : items) {
        bool in_matched = std::count(result.matched.begin(), result.matched.end(), item) == 1;
        bool in_not_matched = std::count(result.not_matched.begin(), result.not_matched.end(), item) == 1;
        EXPECT_NE(in_matched, in_not_matched);
    }
}

TEST(SplitFinderTest, GainComputation) {
    RecordSet records = colors();
    RecordRefs items = make_refs(records);
    double h0 = entropy(items);

    SplitResult by_color = SplitFinder::split(Rule("color", predicates::equal(), "red"), items);
    SplitResult by_shape = SplitFinder::split(Rule("shape", predicates::equal(), "circle"), items);

    EXPECT_NEAR(SplitFinder::information_gain(h0, by_color.matched, by_color.not_matched),
                std::log(2.0), 1e-12);
    EXPECT_NEAR(SplitFinder::information_gain(h0, by_shape.matched, by_shape.not_matched),
                0.0, 1e-12);
}

TEST(SplitFinderTest, FindsColorSplit) {
    RecordSet records = colors();
    TreeConfig config;
    config.attribute_predicates["color"] = {predicates::equal()};

    SplitFinder finder(config);
    auto best = finder.find_best_split(make_refs(records));

    ASSERT_TRUE(best.has_value());
    EXPECT_EQ(best->rule.attribute(), "color");
    EXPECT_EQ(best->rule.reference(), Value("red"));
    EXPECT_NEAR(best->gain, std::log(2.0), 1e-12);
    EXPECT_EQ(best->matched.size(), 2u);
    EXPECT_EQ(best->not_matched.size(), 2u);
}

TEST(SplitFinderTest, FirstCandidateWinsTies) {
    // "a" and "b" separate the categories equally well
    RecordSet records = {
        Record({{"a", 1}, {"b", 10}}, "X"),
        Record({{"a", 2}, {"b", 20}}, "Y"),
    };
    TreeConfig config;
    config.default_predicates = {predicates::equal()};

    auto best = SplitFinder(config).find_best_split(make_refs(records));

    ASSERT_TRUE(best.has_value());
    EXPECT_EQ(best->rule.attribute(), "a");
    EXPECT_EQ(best->rule.reference(), Value(1));
}

TEST(SplitFinderTest, PredicateOrderDecidesTies) {
    RecordSet records = {
        Record({{"x", 1}}, "low"),
        Record({{"x", 2}}, "high"),
    };
    TreeConfig config;
    config.default_predicates = {predicates::less_equal(), predicates::equal()};

    auto best = SplitFinder(config).find_best_split(make_refs(records));

    ASSERT_TRUE(best.has_value());
    EXPECT_EQ(best->rule.predicate(), predicates::less_equal());
}

TEST(SplitFinderTest, NoGainNoSplit) {
    RecordSet records = {
        Record({{"color", "red"}}, "A"),
        Record({{"color", "red"}}, "B"),
    };
    TreeConfig config;
    config.default_predicates = {predicates::equal()};

    EXPECT_FALSE(SplitFinder(config).find_best_split(make_refs(records)).has_value());
}

TEST(SplitFinderTest, IgnoredAttributesAreSkipped) {
    RecordSet records = {
        Record({{"id", 1}, {"noise", "x"}}, "A"),
        Record({{"id", 2}, {"noise", "x"}}, "B"),
    };
    TreeConfig config;
    config.default_predicates = {predicates::equal()};

    EXPECT_TRUE(SplitFinder(config).find_best_split(make_refs(records)).has_value());

    config.ignored_attributes.insert("id");
    EXPECT_FALSE(SplitFinder(config).find_best_split(make_refs(records)).has_value());
}

TEST(SplitFinderTest, NoPredicatesNoSplit) {
    RecordSet records = colors();
    TreeConfig config;

    EXPECT_FALSE(SplitFinder(config).find_best_split(make_refs(records)).has_value());
}

TEST(SplitFinderTest, DuplicateRulesEvaluatedOnce) {
    RecordSet records = {
        Record({{"color", "red"}}, "A"),
        Record({{"color", "red"}}, "B"),
        Record({{"color", "blue"}}, "A"),
        Record({{"color", "blue"}}, "B"),
    };
    auto counting = std::make_shared<CountingEqual>();
    TreeConfig config;
    config.attribute_predicates["color"] = {counting};

    auto best = SplitFinder(config).find_best_split(make_refs(records));

    EXPECT_FALSE(best.has_value());
    // Two distinct rules (== red, == blue), each tested against four records
    EXPECT_EQ(counting->calls, 8);
}

TEST(SplitFinderTest, MissingAttributePropagates) {
    RecordSet records = {
        Record({{"color", "red"}}, "A"),
        Record({{"shape", "circle"}}, "B"),
    };
    TreeConfig config;
    config.default_predicates = {predicates::equal()};

    EXPECT_THROW(SplitFinder(config).find_best_split(make_refs(records)), MissingAttributeError);
}
