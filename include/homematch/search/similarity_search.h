#pragma once

#include <homematch/core/types.h>
#include <homematch/search/collaborators.h>
#include <homematch/search/facet_profile.h>
#include <homematch/search/listing_record.h>
#include <homematch/search/post_filter.h>
#include <homematch/search/rank_fusion.h>

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <stop_token>
#include <string>
#include <vector>

#include <boost/asio/any_io_executor.hpp>

namespace homematch::search {

/**
 * @brief Configuration for SimilaritySearchOrchestrator
 *
 * Process-wide and immutable once the orchestrator is built.
 */
struct SimilaritySearchConfig {
    // RRF smoothing constant
    double rrfK = 60.0;

    // Neighbors requested per facet = topK * overFetchFactor
    std::size_t overFetchFactor = 2;

    // Fused ids hydrated into records = topK * hydrationFactor
    std::size_t hydrationFactor = 5;

    bool enableParallelExecution = true; // Fan out facet calls on the executor
    // Per fan-out phase (0 = no timeout). Without parallel execution the deadline is only
    // checked between calls, so a single slow call is not interrupted.
    std::chrono::milliseconds collaboratorTimeout{0};
    std::size_t workerThreads = 4; // Size of the owned pool when no executor is supplied

    Result<void> validate() const;
};

/**
 * @brief One similar-listing query
 */
struct SimilarityRequest {
    EntityId queryId;
    std::string mode = "balanced";
    std::optional<FilterSpec> filters; // nullopt = no filtering at all
    std::size_t topK = 10;
    std::stop_token stopToken;
};

struct SimilarityHit {
    ListingRecord record;
    FusedEntry fused;
};

struct SimilarityResponse {
    std::vector<SimilarityHit> hits;
    std::string mode;
    std::map<Facet, std::size_t> candidatesPerFacet;
    std::size_t fusedCount = 0;
    std::size_t hydratedCount = 0;
    std::size_t droppedWithoutRecord = 0;
    std::optional<FilterStats> filterStats;
    int64_t executionTimeMs = 0;

    [[nodiscard]] bool hasResults() const { return !hits.empty(); }
    std::vector<ListingRecord> records() const;
};

/**
 * @brief Similar-listing search over per-facet vector indexes
 *
 * Pipeline per query:
 * 1. Resolve the weight profile for the requested mode
 * 2. Fetch the query listing's vector in every facet (fan-out)
 * 3. Query topK * overFetchFactor neighbors per facet (fan-out)
 * 4. Fuse the rankings with weighted RRF
 * 5. Hydrate the top topK * hydrationFactor ids (query id excluded) in one batch
 * 6. Apply the post filter, when one is supplied
 * 7. Truncate to topK, keeping fused order
 *
 * Fails closed: a facet that cannot be fetched aborts the whole query instead of silently
 * fusing fewer facets. search() may be called concurrently.
 */
class SimilaritySearchOrchestrator {
public:
    SimilaritySearchOrchestrator(std::shared_ptr<IFacetVectorStore> vectorStore,
                                 std::shared_ptr<IRecordStore> recordStore,
                                 const SimilaritySearchConfig& config = {},
                                 WeightProfileRegistry registry =
                                     WeightProfileRegistry::withBuiltins());

    ~SimilaritySearchOrchestrator();

    SimilaritySearchOrchestrator(const SimilaritySearchOrchestrator&) = delete;
    SimilaritySearchOrchestrator& operator=(const SimilaritySearchOrchestrator&) = delete;
    SimilaritySearchOrchestrator(SimilaritySearchOrchestrator&&) noexcept;
    SimilaritySearchOrchestrator& operator=(SimilaritySearchOrchestrator&&) noexcept;

    /**
     * @brief Find listings similar to request.queryId
     *
     * @return At most topK records in fused order, or UnknownSearchMode, QueryEntityNotFound,
     *         CollaboratorFailure, Timeout, OperationCancelled or InvalidArgument
     */
    Result<std::vector<ListingRecord>> search(const SimilarityRequest& request);

    /// Like search() but keeps fused scores and per-stage counts.
    Result<SimilarityResponse> searchWithResponse(const SimilarityRequest& request);

    const SimilaritySearchConfig& getConfig() const;
    const WeightProfileRegistry& getProfiles() const;

    struct Statistics {
        std::atomic<uint64_t> totalQueries{0};
        std::atomic<uint64_t> successfulQueries{0};
        std::atomic<uint64_t> failedQueries{0};
        std::atomic<uint64_t> timedOutQueries{0};
        std::atomic<uint64_t> cancelledQueries{0};
        std::atomic<uint64_t> totalQueryTimeMicros{0};
        std::atomic<uint64_t> avgQueryTimeMicros{0};
    };

    const Statistics& getStatistics() const;
    void resetStatistics();

    /**
     * @brief Use a host executor for facet fan-out instead of the owned thread pool
     *
     * Call before serving queries. An empty optional restores the owned pool.
     */
    void setExecutor(std::optional<boost::asio::any_io_executor> executor);

private:
    class Impl;
    std::unique_ptr<Impl> pImpl_;
};

/**
 * @brief Factory that validates config and collaborators before building the orchestrator
 */
Result<std::unique_ptr<SimilaritySearchOrchestrator>>
createSimilaritySearch(std::shared_ptr<IFacetVectorStore> vectorStore,
                       std::shared_ptr<IRecordStore> recordStore,
                       const SimilaritySearchConfig& config = {},
                       WeightProfileRegistry registry = WeightProfileRegistry::withBuiltins());

} // namespace homematch::search
