#pragma once

#include <homematch/core/types.h>
#include <homematch/search/facet_profile.h>
#include <homematch/search/listing_record.h>
#include <homematch/search/rank_fusion.h>

#include <cstddef>
#include <unordered_map>
#include <vector>

namespace homematch::search {

/**
 * @brief Per-facet vector index owned by the embedding/storage layer
 *
 * Implementations must accept concurrent calls; the search fans out one call per facet.
 */
class IFacetVectorStore {
public:
    virtual ~IFacetVectorStore() = default;

    /**
     * @brief Stored vector of @p id in @p facet
     *
     * @return The L2-normalized vector, NotFound when the entity has none in that facet, or
     *         another error when the store itself failed
     */
    virtual Result<FacetVector> getFacetVector(const EntityId& id, Facet facet) = 0;

    /**
     * @brief Nearest neighbors of @p vector in @p facet, best first, at most @p limit
     */
    virtual Result<RankedList> queryNeighbors(Facet facet, const FacetVector& vector,
                                              std::size_t limit) = 0;
};

/**
 * @brief Listing attribute store
 */
class IRecordStore {
public:
    virtual ~IRecordStore() = default;

    /// Batch lookup; ids without a record are simply absent from the map.
    virtual Result<std::unordered_map<EntityId, ListingRecord>>
    getRecords(const std::vector<EntityId>& ids) = 0;
};

} // namespace homematch::search
