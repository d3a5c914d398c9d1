#include <homematch/search/listing_record.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <limits>

namespace homematch::search {

namespace {

std::string trimmed(const std::string& s) {
    auto begin = s.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) {
        return {};
    }
    auto end = s.find_last_not_of(" \t\r\n");
    return s.substr(begin, end - begin + 1);
}

std::optional<double> parseNumber(const std::string& raw) {
    const auto text = trimmed(raw);
    if (text.empty()) {
        return std::nullopt;
    }
    errno = 0;
    char* end = nullptr;
    const double value = std::strtod(text.c_str(), &end);
    if (errno != 0 || end != text.c_str() + text.size() || !std::isfinite(value)) {
        return std::nullopt;
    }
    return value;
}

std::optional<std::string> stringField(const nlohmann::json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) {
        return std::nullopt;
    }
    if (!it->is_string()) {
        spdlog::debug("Listing field '{}' is not a string; treating as absent", key);
        return std::nullopt;
    }
    return it->get<std::string>();
}

std::vector<std::string> stringListField(const nlohmann::json& j, const char* key) {
    std::vector<std::string> out;
    auto it = j.find(key);
    if (it == j.end() || !it->is_array()) {
        return out;
    }
    out.reserve(it->size());
    for (const auto& v : *it) {
        if (v.is_string()) {
            out.push_back(v.get<std::string>());
        }
    }
    return out;
}

std::optional<double> numberField(const nlohmann::json& j, std::initializer_list<const char*> keys) {
    for (const char* key : keys) {
        auto it = j.find(key);
        if (it == j.end() || it->is_null()) {
            continue;
        }
        if (it->is_number()) {
            return it->get<double>();
        }
        spdlog::debug("Listing field '{}' is not numeric; treating as absent", key);
    }
    return std::nullopt;
}

std::optional<PriceInfo> priceField(const nlohmann::json& j) {
    if (auto it = j.find("price_range"); it != j.end() && !it->is_null()) {
        if (it->is_string()) {
            auto text = it->get<std::string>();
            if (!text.empty()) {
                return PriceInfo::rangeText(std::move(text));
            }
        } else if (it->is_array() && it->size() == 2 && (*it)[0].is_number() &&
                   (*it)[1].is_number()) {
            return PriceInfo::range((*it)[0].get<double>(), (*it)[1].get<double>());
        } else {
            // Keep the malformed value so the filter reports it per record
            return PriceInfo::rangeText(it->dump());
        }
    }
    if (auto listPrice = numberField(j, {"list_price"}); listPrice && *listPrice != 0.0) {
        return PriceInfo::single(*listPrice);
    }
    return std::nullopt;
}

} // namespace

Result<PriceRange> parsePriceRange(const std::string& text) {
    // Skip a leading sign position so "-" is only taken as the separator
    const auto body = trimmed(text);
    const auto dash = body.find('-', 1);
    if (body.empty() || dash == std::string::npos || body.find('-', dash + 1) != std::string::npos) {
        return Error{ErrorCode::InvalidData, "Price range '" + text + "' is not 'low-high'"};
    }

    auto low = parseNumber(body.substr(0, dash));
    auto high = parseNumber(body.substr(dash + 1));
    if (!low || !high) {
        return Error{ErrorCode::InvalidData, "Price range '" + text + "' has non-numeric bounds"};
    }
    if (*low > *high) {
        return Error{ErrorCode::InvalidData, "Price range '" + text + "' is inverted"};
    }
    return PriceRange{*low, *high};
}

Result<PriceRange> PriceInfo::effectiveRange() const {
    if (const auto* price = std::get_if<double>(&value_)) {
        return PriceRange{*price, *price};
    }
    if (const auto* range = std::get_if<PriceRange>(&value_)) {
        if (range->low > range->high) {
            return Error{ErrorCode::InvalidData, "Price range is inverted"};
        }
        return *range;
    }
    return parsePriceRange(std::get<std::string>(value_));
}

bool ListingRecord::hasAmenity(const std::string& amenity) const {
    return std::find(amenities.begin(), amenities.end(), amenity) != amenities.end();
}

Result<ListingRecord> ListingRecord::fromJson(const nlohmann::json& payload) {
    if (!payload.is_object()) {
        return Error{ErrorCode::InvalidData, "Listing payload must be a JSON object"};
    }

    ListingRecord record;
    auto idIt = payload.find("id");
    if (idIt == payload.end() || idIt->is_null()) {
        return Error{ErrorCode::InvalidData, "Listing payload has no id"};
    }
    if (idIt->is_string()) {
        record.id = idIt->get<std::string>();
    } else if (idIt->is_number_integer()) {
        record.id = std::to_string(idIt->get<int64_t>());
    } else {
        return Error{ErrorCode::InvalidData, "Listing id must be a string or integer"};
    }
    if (record.id.empty()) {
        return Error{ErrorCode::InvalidData, "Listing id must not be empty"};
    }

    record.price = priceField(payload);

    if (auto beds = numberField(payload, {"bedrooms", "bedrooms_total"})) {
        if (std::floor(*beds) != *beds) {
            spdlog::debug("Listing {} has fractional bedroom count {}; treating as absent",
                          record.id, *beds);
        } else if (*beds < static_cast<double>(std::numeric_limits<int>::min()) ||
                   *beds > static_cast<double>(std::numeric_limits<int>::max())) {
            spdlog::warn("Listing {} has out-of-range bedroom count {}; treating as absent",
                         record.id, *beds);
        } else {
            record.bedrooms = static_cast<int>(*beds);
        }
    }
    record.bathrooms = numberField(payload, {"bathrooms", "lp_calculated_bath"});
    record.propertyType = stringField(payload, "property_type");
    record.amenities = stringListField(payload, "amenities");

    record.locationDescription = stringField(payload, "location_description").value_or("");
    record.neighborhood = stringField(payload, "neighborhood").value_or("");
    record.city = stringField(payload, "city").value_or("");
    record.municipality = stringField(payload, "municipality").value_or("");
    record.county = stringField(payload, "county").value_or("");
    record.architecturalStyle = stringField(payload, "architectural_style").value_or("");
    record.interiorFeatures = stringListField(payload, "interior_features");
    record.appliances = stringListField(payload, "appliances");
    record.exteriorFeatures = stringListField(payload, "exterior_features");
    record.lotFeatures = stringListField(payload, "lot_features");
    record.photoUrls = stringListField(payload, "photo_urls");

    record.payload = payload;
    return record;
}

} // namespace homematch::search
