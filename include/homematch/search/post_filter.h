#pragma once

#include <homematch/core/types.h>
#include <homematch/search/listing_record.h>

#include <nlohmann/json.hpp>

#include <array>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace homematch::search {

/**
 * @brief Closed numeric range with optional bounds
 */
template <typename T> struct BoundedRange {
    std::optional<T> min;
    std::optional<T> max;

    bool matches(T value) const {
        if (min && value < *min)
            return false;
        if (max && value > *max)
            return false;
        return true;
    }

    bool inverted() const { return min && max && *min > *max; }
};

/**
 * @brief Structured constraints applied after fusion and hydration
 *
 * A supplied spec always requires price, bedroom and bathroom data to be present, even when
 * no bound is set on them.
 */
struct FilterSpec {
    std::optional<double> minPrice;
    std::optional<double> maxPrice;
    std::optional<int> minBedrooms;
    std::optional<int> maxBedrooms;
    std::optional<double> minBathrooms;
    std::optional<double> maxBathrooms;
    std::optional<std::string> propertyType;
    std::vector<std::string> requiredAmenities;

    /// Rejects negative bounds and min > max with InvalidArgument.
    Result<void> validate() const;

    /// Decode from the listing-search JSON field names (min_price, must_have_amenities, ...).
    static Result<FilterSpec> fromJson(const nlohmann::json& j);
};

/**
 * @brief Why a record was kept or dropped
 */
enum class FilterVerdict {
    Accepted = 0,
    MissingPrice,
    PriceOutOfRange,
    MissingBedrooms,
    BedroomsOutOfRange,
    MissingBathrooms,
    BathroomsOutOfRange,
    PropertyTypeMismatch,
    MissingAmenity,
};

inline constexpr size_t kFilterVerdictCount = 9;

inline constexpr const char* filterVerdictToString(FilterVerdict verdict) noexcept {
    switch (verdict) {
        case FilterVerdict::Accepted:
            return "accepted";
        case FilterVerdict::MissingPrice:
            return "missing_price";
        case FilterVerdict::PriceOutOfRange:
            return "price_out_of_range";
        case FilterVerdict::MissingBedrooms:
            return "missing_bedrooms";
        case FilterVerdict::BedroomsOutOfRange:
            return "bedrooms_out_of_range";
        case FilterVerdict::MissingBathrooms:
            return "missing_bathrooms";
        case FilterVerdict::BathroomsOutOfRange:
            return "bathrooms_out_of_range";
        case FilterVerdict::PropertyTypeMismatch:
            return "property_type_mismatch";
        case FilterVerdict::MissingAmenity:
            return "missing_amenity";
    }
    return "unknown";
}

struct FilterStats {
    size_t evaluated = 0;
    size_t malformed = 0;
    std::array<size_t, kFilterVerdictCount> verdicts{};

    size_t count(FilterVerdict verdict) const { return verdicts[static_cast<size_t>(verdict)]; }
    size_t accepted() const { return count(FilterVerdict::Accepted); }
};

/**
 * @brief Order-preserving structured filter over hydrated listings
 *
 * Predicates run in a fixed order (price, bedrooms, bathrooms, property type, amenities) and
 * stop at the first failure. A record with malformed filter data is dropped with a warning;
 * it never fails the call. Input records are never modified.
 */
class PostFilterEngine {
public:
    /**
     * @brief Evaluate one record
     *
     * @return The verdict, or InvalidData when a filter-relevant field cannot be read
     */
    static Result<FilterVerdict> evaluate(const ListingRecord& record, const FilterSpec& spec);

    /**
     * @brief Evaluate one record and tally the outcome into @p stats
     *
     * @return true only for an accepted record; malformed records are logged and rejected
     */
    static bool admit(const ListingRecord& record, const FilterSpec& spec, FilterStats& stats);

    static std::vector<ListingRecord> apply(const std::vector<ListingRecord>& records,
                                            const FilterSpec& spec);

    static std::vector<ListingRecord> applyWithStats(const std::vector<ListingRecord>& records,
                                                     const FilterSpec& spec, FilterStats& stats);
};

} // namespace homematch::search
