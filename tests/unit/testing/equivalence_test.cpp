#include <gtest/gtest.h>

#include <compare>
#include <limits>
#include <regex>
#include <string>
#include <vector>

#include <tabula/data/value.h>
#include <tabula/testing/equivalence.h>
#include <tabula/testing/gtest_suite.h>

using namespace tabula;
using namespace tabula::testing;
using data::Value;

TEST(ToleranceEqualTest, WithinEpsilonPasses) {
    EXPECT_NO_THROW(assertToleranceEqual({Value{1.001}, Value{2.0}}, {1.0, 2.0}, 0.01));
    EXPECT_NO_THROW(assertToleranceEqual({Value{std::int32_t{3}}, Value{std::int64_t{4}},
                                          Value{0.5f}},
                                         {3.0, 4.004, 0.5}));
    EXPECT_NO_THROW(assertToleranceEqual({}, {}));
}

TEST(ToleranceEqualTest, FirstOutlierFails) {
    auto result = checkToleranceEqual({Value{1.02}, Value{2.0}}, {1.0, 2.0}, 0.01);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::ValueMismatch);
    EXPECT_NE(result.error().message.find("element 0"), std::string::npos);

    try {
        assertToleranceEqual({Value{1.0}, Value{5.0}}, {1.0, 2.0});
        FAIL() << "expected AssertionFailure";
    } catch (const AssertionFailure& e) {
        EXPECT_EQ(e.code(), ErrorCode::ValueMismatch);
        EXPECT_NE(std::string(e.what()).find("element 1"), std::string::npos);
    }
}

TEST(ToleranceEqualTest, BoundaryIsExclusive) {
    EXPECT_FALSE(checkToleranceEqual({Value{1.5}}, {1.0}, 0.5).has_value());
}

TEST(ToleranceEqualTest, LengthMismatchFails) {
    auto result = checkToleranceEqual({Value{1.0}}, {1.0, 2.0});
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::LengthMismatch);
}

TEST(ToleranceEqualTest, NonNumericCellsBecomeSentinel) {
    EXPECT_EQ(coerceToDouble(Value{}), std::numeric_limits<double>::lowest());
    EXPECT_EQ(coerceToDouble(Value{true}), std::numeric_limits<double>::lowest());
    EXPECT_EQ(coerceToDouble(Value{std::string("1.0")}), std::numeric_limits<double>::lowest());
    EXPECT_EQ(coerceToDouble(Value{std::int64_t{7}}), 7.0);

    auto result = checkToleranceEqual({Value{std::string("1.0")}}, {1.0});
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::ValueMismatch);
}

TEST(UnorderedEqualTest, IgnoresOrderKeepsMultiplicity) {
    EXPECT_NO_THROW(assertUnorderedEqual<int>({3, 1, 2, 1}, {1, 1, 2, 3}));
    EXPECT_NO_THROW(assertUnorderedEqual<std::string>({"b", "a"}, {"a", "b"}));

    auto multiplicity = checkUnorderedEqual<int>({1, 1, 2}, {1, 2, 2});
    ASSERT_FALSE(multiplicity.has_value());
    EXPECT_EQ(multiplicity.error().code, ErrorCode::ValueMismatch);
    EXPECT_NE(multiplicity.error().message.find("sorted element 1"), std::string::npos);

    auto length = checkUnorderedEqual<int>({1, 2}, {1, 2, 3});
    ASSERT_FALSE(length.has_value());
    EXPECT_EQ(length.error().code, ErrorCode::LengthMismatch);
}

namespace {

struct CompositeKey {
    int group;
    int rank;

    auto operator<=>(const CompositeKey&) const = default;
};

} // namespace

TEST(UnorderedEqualTest, AcceptsTypesWithoutFormatter) {
    EXPECT_NO_THROW(assertUnorderedEqual<CompositeKey>({{2, 1}, {1, 5}}, {{1, 5}, {2, 1}}));

    auto mismatch = checkUnorderedEqual<CompositeKey>({{1, 1}, {2, 2}}, {{1, 1}, {2, 3}});
    ASSERT_FALSE(mismatch.has_value());
    EXPECT_EQ(mismatch.error().code, ErrorCode::ValueMismatch);
    EXPECT_NE(mismatch.error().message.find("sorted element 1"), std::string::npos);
}

TEST(MatchesPatternTest, SearchesAnywhere) {
    EXPECT_NO_THROW(assertMatchesPattern("job 42 finished in 3s", "finished in \\d+s"));
    EXPECT_NO_THROW(assertMatchesPattern("ERROR: disk full", std::regex("^ERROR")));

    auto missing = checkMatchesPattern("all good", "fail(ed|ure)");
    ASSERT_FALSE(missing.has_value());
    EXPECT_EQ(missing.error().code, ErrorCode::PatternNotFound);

    auto invalid = checkMatchesPattern("anything", "([unclosed");
    ASSERT_FALSE(invalid.has_value());
    EXPECT_EQ(invalid.error().code, ErrorCode::InvalidArgument);
}

class DatasetEquivalenceTest : public ComputeContextSuite<DatasetEquivalenceTest> {
public:
    static bool disableLogging() { return true; }
};

TEST_F(DatasetEquivalenceTest, RowsCompareWithoutOrder) {
    auto ds = session().createDataset("n:Integer; s:String", "1,a;2,b").value();

    EXPECT_NO_THROW(assertDatasetEqual(ds, "2,b; 1,a"));
    EXPECT_NO_THROW(assertDatasetEqual(ds, "1,a;2,b;"));
    EXPECT_NO_THROW(assertDatasetEqual(ds, "1,a;2,b;;"));
    EXPECT_EQ(checkDatasetEqual(ds, "1,a;2,c").error().code, ErrorCode::ValueMismatch);
    EXPECT_EQ(checkDatasetEqual(ds, "1,a").error().code, ErrorCode::LengthMismatch);
}

TEST_F(DatasetEquivalenceTest, CanonicalRowsDropBrackets) {
    auto ds = session().createDataset("d:Double; b:Boolean; x:Long", "1.5,true,").value();
    EXPECT_EQ(canonicalRows(ds), (std::vector<std::string>{"1.5,true,null"}));
}

TEST_F(DatasetEquivalenceTest, SchemaOrderMatters) {
    auto ds = session().createDataset("b:Integer;a:String", "1,x").value();

    EXPECT_NO_THROW(assertSchemaEqual(ds, "b: Integer; a: String"));
    auto swapped = checkSchemaEqual(ds, "a:String;b:Integer");
    ASSERT_FALSE(swapped.has_value());
    EXPECT_EQ(swapped.error().code, ErrorCode::SchemaMismatch);
    EXPECT_THROW(assertSchemaEqual(ds, "a:String;b:Integer"), AssertionFailure);
}

TEST_F(DatasetEquivalenceTest, SameDatasetChecksSchemaThenRows) {
    auto expected = session().createDataset("k:String; v:Integer", "a,1;b,2").value();
    auto reordered = session().createDataset("k:String;v:Integer", "b,2;a,1").value();
    auto otherRows = session().createDataset("k:String;v:Integer", "a,1;b,3").value();
    auto otherSchema = session().createDataset("k:String;v:Long", "a,1;b,2").value();

    EXPECT_NO_THROW(assertSameDataset(expected, reordered));
    EXPECT_EQ(checkSameDataset(expected, otherRows).error().code, ErrorCode::ValueMismatch);
    EXPECT_EQ(checkSameDataset(expected, otherSchema).error().code, ErrorCode::SchemaMismatch);
}

TEST_F(DatasetEquivalenceTest, ContextIsSharedAcrossTests) {
    EXPECT_TRUE(sc().isActive());
    EXPECT_EQ(sc().parallelism(), kTestWorkers);
    EXPECT_EQ(sc().name(), identity());
    EXPECT_EQ(lifecycle().state(), LifecycleState::Active);
}
