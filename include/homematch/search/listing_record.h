#pragma once

#include <homematch/core/types.h>

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace homematch::search {

/**
 * @brief Inclusive price bounds of a listing
 */
struct PriceRange {
    double low = 0.0;
    double high = 0.0;
};

/**
 * @brief Price as a listing reports it
 *
 * Either a single list price, a numeric range, or range text such as "2000-2500" that is
 * parsed only when a filter needs the bounds. Malformed text surfaces as InvalidData from
 * effectiveRange() so one bad listing can be dropped without failing a whole batch.
 */
class PriceInfo {
public:
    static PriceInfo single(double price) { return PriceInfo(price); }
    static PriceInfo range(double low, double high) { return PriceInfo(PriceRange{low, high}); }
    static PriceInfo rangeText(std::string text) { return PriceInfo(std::move(text)); }

    bool isSingle() const { return std::holds_alternative<double>(value_); }
    bool isRangeText() const { return std::holds_alternative<std::string>(value_); }

    /// Effective [min, max]; a single price has min == max.
    Result<PriceRange> effectiveRange() const;

private:
    explicit PriceInfo(double price) : value_(price) {}
    explicit PriceInfo(PriceRange range) : value_(range) {}
    explicit PriceInfo(std::string text) : value_(std::move(text)) {}

    std::variant<double, PriceRange, std::string> value_;
};

/// Parse "low-high" range text. Fails with InvalidData when either bound is not a number.
Result<PriceRange> parsePriceRange(const std::string& text);

/**
 * @brief Hydrated listing attributes consumed by the post filter
 */
struct ListingRecord {
    EntityId id;

    // Filter-relevant fields
    std::optional<PriceInfo> price;
    std::optional<int> bedrooms;
    std::optional<double> bathrooms; // half baths allowed (2.5)
    std::optional<std::string> propertyType;
    std::vector<std::string> amenities;

    // Descriptive fields
    std::string locationDescription;
    std::string neighborhood;
    std::string city;
    std::string municipality;
    std::string county;
    std::string architecturalStyle;
    std::vector<std::string> interiorFeatures;
    std::vector<std::string> appliances;
    std::vector<std::string> exteriorFeatures;
    std::vector<std::string> lotFeatures;
    std::vector<std::string> photoUrls;

    // Payload this record was decoded from (null when built in code)
    nlohmann::json payload;

    bool hasAmenity(const std::string& amenity) const;

    /**
     * @brief Decode a listing payload
     *
     * Only a missing/invalid "id" or a non-object payload is an error. Optional fields with an
     * unexpected JSON type are treated as absent.
     */
    static Result<ListingRecord> fromJson(const nlohmann::json& payload);
};

} // namespace homematch::search
