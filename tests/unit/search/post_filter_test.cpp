#include <gtest/gtest.h>

#include <homematch/search/post_filter.h>

#include "common/fake_stores.h"

using namespace homematch;
using namespace homematch::search;
using homematch::test::idsOf;
using homematch::test::makeListing;
using nlohmann::json;

class PostFilterTest : public ::testing::Test {
protected:
    std::vector<ListingRecord> bedroomListings() {
        return {makeListing("one", 400000.0, 1), makeListing("two", 400000.0, 2),
                makeListing("three", 400000.0, 3), makeListing("four", 400000.0, 4),
                makeListing("none", 400000.0, std::nullopt)};
    }
};

TEST_F(PostFilterTest, BedroomRangeKeepsTwoAndThree) {
    FilterSpec spec;
    spec.minBedrooms = 2;
    spec.maxBedrooms = 3;

    auto kept = PostFilterEngine::apply(bedroomListings(), spec);
    EXPECT_EQ(idsOf(kept), (std::vector<EntityId>{"two", "three"}));
}

TEST_F(PostFilterTest, FilteringIsIdempotent) {
    FilterSpec spec;
    spec.minBedrooms = 2;
    spec.maxPrice = 450000.0;

    auto once = PostFilterEngine::apply(bedroomListings(), spec);
    auto twice = PostFilterEngine::apply(once, spec);
    EXPECT_EQ(idsOf(once), idsOf(twice));
}

TEST_F(PostFilterTest, PreservesInputOrder) {
    std::vector<ListingRecord> records{makeListing("c", 3.0), makeListing("a", 1.0),
                                       makeListing("b", 2.0)};
    FilterSpec spec;
    spec.maxPrice = 10.0;

    EXPECT_EQ(idsOf(PostFilterEngine::apply(records, spec)),
              (std::vector<EntityId>{"c", "a", "b"}));
}

TEST_F(PostFilterTest, SuppliedSpecRequiresCoreFields) {
    FilterSpec empty;

    EXPECT_EQ(PostFilterEngine::evaluate(makeListing("p", std::nullopt), empty).value(),
              FilterVerdict::MissingPrice);
    EXPECT_EQ(PostFilterEngine::evaluate(makeListing("b", 1.0, std::nullopt), empty).value(),
              FilterVerdict::MissingBedrooms);
    EXPECT_EQ(
        PostFilterEngine::evaluate(makeListing("t", 1.0, 2, std::nullopt), empty).value(),
        FilterVerdict::MissingBathrooms);
    EXPECT_EQ(PostFilterEngine::evaluate(makeListing("ok"), empty).value(),
              FilterVerdict::Accepted);
}

TEST_F(PostFilterTest, PriceBoundsUseOverlap) {
    ListingRecord ranged = makeListing("r");
    ranged.price = PriceInfo::rangeText("2000-2500");

    FilterSpec minOnly;
    minOnly.minPrice = 2400.0;
    EXPECT_EQ(PostFilterEngine::evaluate(ranged, minOnly).value(), FilterVerdict::Accepted);
    minOnly.minPrice = 2600.0;
    EXPECT_EQ(PostFilterEngine::evaluate(ranged, minOnly).value(),
              FilterVerdict::PriceOutOfRange);

    FilterSpec maxOnly;
    maxOnly.maxPrice = 2000.0;
    EXPECT_EQ(PostFilterEngine::evaluate(ranged, maxOnly).value(), FilterVerdict::Accepted);
    maxOnly.maxPrice = 1999.0;
    EXPECT_EQ(PostFilterEngine::evaluate(ranged, maxOnly).value(),
              FilterVerdict::PriceOutOfRange);

    FilterSpec single;
    single.minPrice = 500000.0;
    single.maxPrice = 500000.0;
    EXPECT_EQ(PostFilterEngine::evaluate(makeListing("s", 500000.0), single).value(),
              FilterVerdict::Accepted);
}

TEST_F(PostFilterTest, BathroomsAllowHalfBaths) {
    FilterSpec spec;
    spec.minBathrooms = 2.5;

    EXPECT_EQ(PostFilterEngine::evaluate(makeListing("a", 1.0, 3, 2.5), spec).value(),
              FilterVerdict::Accepted);
    EXPECT_EQ(PostFilterEngine::evaluate(makeListing("b", 1.0, 3, 2.0), spec).value(),
              FilterVerdict::BathroomsOutOfRange);
}

TEST_F(PostFilterTest, PropertyTypeIsExactMatch) {
    FilterSpec spec;
    spec.propertyType = "Condo";

    auto condo = makeListing("c");
    condo.propertyType = "Condo";
    auto house = makeListing("h");
    house.propertyType = "condo";
    auto untyped = makeListing("u");

    EXPECT_EQ(PostFilterEngine::evaluate(condo, spec).value(), FilterVerdict::Accepted);
    EXPECT_EQ(PostFilterEngine::evaluate(house, spec).value(),
              FilterVerdict::PropertyTypeMismatch);
    EXPECT_EQ(PostFilterEngine::evaluate(untyped, spec).value(),
              FilterVerdict::PropertyTypeMismatch);
}

TEST_F(PostFilterTest, RequiredAmenitiesMustAllBePresent) {
    FilterSpec spec;
    spec.requiredAmenities = {"pool", "parking"};

    auto both = makeListing("both");
    both.amenities = {"parking", "gym", "pool"};
    auto one = makeListing("one");
    one.amenities = {"pool"};

    EXPECT_EQ(PostFilterEngine::evaluate(both, spec).value(), FilterVerdict::Accepted);
    EXPECT_EQ(PostFilterEngine::evaluate(one, spec).value(), FilterVerdict::MissingAmenity);
}

TEST_F(PostFilterTest, PredicatesShortCircuitInOrder) {
    FilterSpec spec;
    spec.maxPrice = 10.0;
    spec.minBedrooms = 10;
    spec.propertyType = "Loft";

    // Fails price, bedrooms and type; price is checked first
    EXPECT_EQ(PostFilterEngine::evaluate(makeListing("x", 100.0, 1), spec).value(),
              FilterVerdict::PriceOutOfRange);
}

TEST_F(PostFilterTest, MalformedPriceIsExcludedWithoutFailing) {
    auto broken = makeListing("broken");
    broken.price = PriceInfo::rangeText("call for price");
    std::vector<ListingRecord> records{makeListing("a"), broken, makeListing("b")};

    FilterSpec spec;
    auto verdict = PostFilterEngine::evaluate(broken, spec);
    ASSERT_FALSE(verdict);
    EXPECT_EQ(verdict.error().code, ErrorCode::InvalidData);

    FilterStats stats;
    auto kept = PostFilterEngine::applyWithStats(records, spec, stats);
    EXPECT_EQ(idsOf(kept), (std::vector<EntityId>{"a", "b"}));
    EXPECT_EQ(stats.evaluated, 3u);
    EXPECT_EQ(stats.malformed, 1u);
    EXPECT_EQ(stats.accepted(), 2u);
}

TEST_F(PostFilterTest, StatsCountVerdicts) {
    FilterSpec spec;
    spec.minBedrooms = 2;
    spec.maxBedrooms = 3;

    FilterStats stats;
    PostFilterEngine::applyWithStats(bedroomListings(), spec, stats);
    EXPECT_EQ(stats.evaluated, 5u);
    EXPECT_EQ(stats.accepted(), 2u);
    EXPECT_EQ(stats.count(FilterVerdict::BedroomsOutOfRange), 2u);
    EXPECT_EQ(stats.count(FilterVerdict::MissingBedrooms), 1u);
    EXPECT_EQ(stats.malformed, 0u);
}

TEST_F(PostFilterTest, InputIsNotModified) {
    auto records = bedroomListings();
    FilterSpec spec;
    spec.minBedrooms = 3;

    PostFilterEngine::apply(records, spec);
    EXPECT_EQ(idsOf(records), idsOf(bedroomListings()));
}

TEST(FilterSpecTest, ValidateRejectsBadBounds) {
    FilterSpec inverted;
    inverted.minPrice = 500.0;
    inverted.maxPrice = 100.0;
    auto r = inverted.validate();
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, ErrorCode::InvalidArgument);

    FilterSpec negative;
    negative.minBedrooms = -1;
    EXPECT_EQ(negative.validate().error().code, ErrorCode::InvalidArgument);

    FilterSpec baths;
    baths.minBathrooms = 3.0;
    baths.maxBathrooms = 2.5;
    EXPECT_FALSE(baths.validate());

    FilterSpec fine;
    fine.minBedrooms = 2;
    fine.maxBedrooms = 2;
    EXPECT_TRUE(fine.validate());
}

TEST(FilterSpecTest, FromJsonUsesListingFieldNames) {
    json j = {{"min_price", 1500},
              {"max_price", 3000.5},
              {"min_bedrooms", 2},
              {"max_bedrooms", 3},
              {"min_bathrooms", 1.5},
              {"property_type", "Condo"},
              {"must_have_amenities", {"pool", "gym"}}};

    auto spec = FilterSpec::fromJson(j);
    ASSERT_TRUE(spec) << spec.error().message;
    EXPECT_EQ(spec.value().minPrice, 1500.0);
    EXPECT_EQ(spec.value().maxPrice, 3000.5);
    EXPECT_EQ(spec.value().minBedrooms, 2);
    EXPECT_EQ(spec.value().maxBedrooms, 3);
    EXPECT_EQ(spec.value().minBathrooms, 1.5);
    EXPECT_FALSE(spec.value().maxBathrooms.has_value());
    EXPECT_EQ(spec.value().propertyType, "Condo");
    EXPECT_EQ(spec.value().requiredAmenities, (std::vector<std::string>{"pool", "gym"}));
}

TEST(FilterSpecTest, FromJsonRejectsWrongTypes) {
    EXPECT_EQ(FilterSpec::fromJson(json{{"min_price", "cheap"}}).error().code,
              ErrorCode::InvalidArgument);
    EXPECT_EQ(FilterSpec::fromJson(json{{"min_bedrooms", 2.5}}).error().code,
              ErrorCode::InvalidArgument);
    EXPECT_EQ(FilterSpec::fromJson(json{{"property_type", 3}}).error().code,
              ErrorCode::InvalidArgument);
    EXPECT_EQ(FilterSpec::fromJson(json{{"must_have_amenities", "pool"}}).error().code,
              ErrorCode::InvalidArgument);
    EXPECT_EQ(FilterSpec::fromJson(json::array()).error().code, ErrorCode::InvalidArgument);

    auto nulls = FilterSpec::fromJson(json{{"min_price", nullptr}});
    ASSERT_TRUE(nulls);
    EXPECT_FALSE(nulls.value().minPrice.has_value());
}

TEST(FilterSpecTest, FromJsonRejectsBedroomBoundsOutsideInt) {
    auto huge = FilterSpec::fromJson(json{{"min_bedrooms", 5e9}});
    ASSERT_FALSE(huge);
    EXPECT_EQ(huge.error().code, ErrorCode::InvalidArgument);
    EXPECT_NE(huge.error().message.find("min_bedrooms"), std::string::npos);
    EXPECT_NE(huge.error().message.find("out of range"), std::string::npos);

    EXPECT_EQ(FilterSpec::fromJson(json{{"max_bedrooms", -1e12}}).error().code,
              ErrorCode::InvalidArgument);
}

TEST_F(PostFilterTest, AdmitTalliesEachRecord) {
    FilterSpec spec;
    spec.minBedrooms = 3;
    FilterStats stats;

    EXPECT_TRUE(PostFilterEngine::admit(makeListing("ok", 100.0, 3), spec, stats));
    EXPECT_FALSE(PostFilterEngine::admit(makeListing("small", 100.0, 1), spec, stats));
    EXPECT_FALSE(PostFilterEngine::admit(makeListing("noprice", std::nullopt), spec, stats));

    EXPECT_EQ(stats.evaluated, 3u);
    EXPECT_EQ(stats.accepted(), 1u);
    EXPECT_EQ(stats.count(FilterVerdict::BedroomsOutOfRange), 1u);
    EXPECT_EQ(stats.count(FilterVerdict::MissingPrice), 1u);
}
