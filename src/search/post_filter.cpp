#include <homematch/search/post_filter.h>

#include <spdlog/spdlog.h>

#include <cmath>
#include <limits>
#include <string>
#include <type_traits>

namespace homematch::search {

namespace {

template <typename T>
Result<void> checkRange(const std::optional<T>& min, const std::optional<T>& max,
                        const char* field) {
    if ((min && *min < T{}) || (max && *max < T{})) {
        return Error{ErrorCode::InvalidArgument, std::string(field) + " bounds must be >= 0"};
    }
    if (BoundedRange<T>{min, max}.inverted()) {
        return Error{ErrorCode::InvalidArgument, std::string("min_") + field + " exceeds max_" + field};
    }
    return {};
}

template <typename T>
Result<std::optional<T>> optionalNumber(const nlohmann::json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) {
        return std::optional<T>{};
    }
    if (!it->is_number()) {
        return Error{ErrorCode::InvalidArgument, std::string("Filter field '") + key +
                                                     "' must be a number"};
    }
    if constexpr (std::is_integral_v<T>) {
        const double raw = it->get<double>();
        if (std::floor(raw) != raw) {
            return Error{ErrorCode::InvalidArgument, std::string("Filter field '") + key +
                                                         "' must be an integer"};
        }
        if (raw < static_cast<double>(std::numeric_limits<T>::min()) ||
            raw > static_cast<double>(std::numeric_limits<T>::max())) {
            return Error{ErrorCode::InvalidArgument, std::string("Filter field '") + key +
                                                         "' is out of range"};
        }
        return std::optional<T>{static_cast<T>(raw)};
    } else {
        return std::optional<T>{it->get<T>()};
    }
}

} // namespace

Result<void> FilterSpec::validate() const {
    if (auto r = checkRange(minPrice, maxPrice, "price"); !r)
        return r;
    if (auto r = checkRange(minBedrooms, maxBedrooms, "bedrooms"); !r)
        return r;
    if (auto r = checkRange(minBathrooms, maxBathrooms, "bathrooms"); !r)
        return r;
    return {};
}

Result<FilterSpec> FilterSpec::fromJson(const nlohmann::json& j) {
    if (!j.is_object()) {
        return Error{ErrorCode::InvalidArgument, "Filter spec must be a JSON object"};
    }

    FilterSpec spec;

    auto minPrice = optionalNumber<double>(j, "min_price");
    if (!minPrice)
        return minPrice.error();
    auto maxPrice = optionalNumber<double>(j, "max_price");
    if (!maxPrice)
        return maxPrice.error();
    auto minBeds = optionalNumber<int>(j, "min_bedrooms");
    if (!minBeds)
        return minBeds.error();
    auto maxBeds = optionalNumber<int>(j, "max_bedrooms");
    if (!maxBeds)
        return maxBeds.error();
    auto minBaths = optionalNumber<double>(j, "min_bathrooms");
    if (!minBaths)
        return minBaths.error();
    auto maxBaths = optionalNumber<double>(j, "max_bathrooms");
    if (!maxBaths)
        return maxBaths.error();

    spec.minPrice = minPrice.value();
    spec.maxPrice = maxPrice.value();
    spec.minBedrooms = minBeds.value();
    spec.maxBedrooms = maxBeds.value();
    spec.minBathrooms = minBaths.value();
    spec.maxBathrooms = maxBaths.value();

    if (auto it = j.find("property_type"); it != j.end() && !it->is_null()) {
        if (!it->is_string()) {
            return Error{ErrorCode::InvalidArgument, "Filter field 'property_type' must be a string"};
        }
        spec.propertyType = it->get<std::string>();
    }

    if (auto it = j.find("must_have_amenities"); it != j.end() && !it->is_null()) {
        if (!it->is_array()) {
            return Error{ErrorCode::InvalidArgument,
                         "Filter field 'must_have_amenities' must be an array"};
        }
        for (const auto& amenity : *it) {
            if (!amenity.is_string()) {
                return Error{ErrorCode::InvalidArgument,
                             "Filter field 'must_have_amenities' must contain strings"};
            }
            spec.requiredAmenities.push_back(amenity.get<std::string>());
        }
    }

    return spec;
}

Result<FilterVerdict> PostFilterEngine::evaluate(const ListingRecord& record,
                                                 const FilterSpec& spec) {
    // Price presence & range
    if (!record.price) {
        return FilterVerdict::MissingPrice;
    }
    auto price = record.price->effectiveRange();
    if (!price) {
        return price.error();
    }
    if (spec.minPrice && price.value().high < *spec.minPrice) {
        return FilterVerdict::PriceOutOfRange;
    }
    if (spec.maxPrice && price.value().low > *spec.maxPrice) {
        return FilterVerdict::PriceOutOfRange;
    }

    if (!record.bedrooms) {
        return FilterVerdict::MissingBedrooms;
    }
    if (!BoundedRange<int>{spec.minBedrooms, spec.maxBedrooms}.matches(*record.bedrooms)) {
        return FilterVerdict::BedroomsOutOfRange;
    }

    if (!record.bathrooms) {
        return FilterVerdict::MissingBathrooms;
    }
    if (!BoundedRange<double>{spec.minBathrooms, spec.maxBathrooms}.matches(*record.bathrooms)) {
        return FilterVerdict::BathroomsOutOfRange;
    }

    if (spec.propertyType && record.propertyType != spec.propertyType) {
        return FilterVerdict::PropertyTypeMismatch;
    }

    for (const auto& amenity : spec.requiredAmenities) {
        if (!record.hasAmenity(amenity)) {
            return FilterVerdict::MissingAmenity;
        }
    }

    return FilterVerdict::Accepted;
}

bool PostFilterEngine::admit(const ListingRecord& record, const FilterSpec& spec,
                             FilterStats& stats) {
    ++stats.evaluated;
    auto verdict = evaluate(record, spec);
    if (!verdict) {
        ++stats.malformed;
        spdlog::warn("Skipping listing {} during filtering: {}", record.id,
                     verdict.error().message);
        return false;
    }
    ++stats.verdicts[static_cast<size_t>(verdict.value())];
    return verdict.value() == FilterVerdict::Accepted;
}

std::vector<ListingRecord> PostFilterEngine::apply(const std::vector<ListingRecord>& records,
                                                   const FilterSpec& spec) {
    FilterStats stats;
    return applyWithStats(records, spec, stats);
}

std::vector<ListingRecord> PostFilterEngine::applyWithStats(
    const std::vector<ListingRecord>& records, const FilterSpec& spec, FilterStats& stats) {
    std::vector<ListingRecord> kept;
    kept.reserve(records.size());

    for (const auto& record : records) {
        if (admit(record, spec, stats)) {
            kept.push_back(record);
        }
    }

    spdlog::debug("Post filter kept {}/{} listings ({} malformed)", kept.size(), stats.evaluated,
                  stats.malformed);
    return kept;
}

} // namespace homematch::search
