#include <homematch/search/fan_out.h>
#include <homematch/search/similarity_search.h>

#include <spdlog/spdlog.h>

#include <boost/asio/thread_pool.hpp>

#include <algorithm>
#include <chrono>
#include <cmath>
#include <unordered_map>

namespace homematch::search {

namespace {

// Vector-store NotFound means the query listing was never fully indexed
Error vectorFetchError(const Error& error, const EntityId& id, Facet facet) {
    if (error.code == ErrorCode::NotFound) {
        return Error{ErrorCode::QueryEntityNotFound, "Listing " + id + " has no '" +
                                                         facetToString(facet) + "' vector"};
    }
    return Error{ErrorCode::CollaboratorFailure, std::string("Fetching '") + facetToString(facet) +
                                                     "' vector failed: " + error.message};
}

Error collaboratorError(const Error& error, const std::string& what) {
    if (error.code == ErrorCode::Timeout || error.code == ErrorCode::OperationCancelled ||
        error.code == ErrorCode::CollaboratorFailure) {
        return Error{error.code, what + ": " + error.message};
    }
    return Error{ErrorCode::CollaboratorFailure, what + ": " + error.message};
}

} // namespace

Result<void> SimilaritySearchConfig::validate() const {
    if (!std::isfinite(rrfK) || rrfK < 0.0) {
        return Error{ErrorCode::InvalidArgument, "rrf_k must be >= 0"};
    }
    if (overFetchFactor == 0) {
        return Error{ErrorCode::InvalidArgument, "over_fetch_factor must be >= 1"};
    }
    if (hydrationFactor == 0) {
        return Error{ErrorCode::InvalidArgument, "hydration_factor must be >= 1"};
    }
    if (collaboratorTimeout.count() < 0) {
        return Error{ErrorCode::InvalidArgument, "collaborator_timeout_ms must be >= 0"};
    }
    if (enableParallelExecution && workerThreads == 0) {
        return Error{ErrorCode::InvalidArgument, "worker_threads must be >= 1"};
    }
    return {};
}

std::vector<ListingRecord> SimilarityResponse::records() const {
    std::vector<ListingRecord> out;
    out.reserve(hits.size());
    for (const auto& hit : hits) {
        out.push_back(hit.record);
    }
    return out;
}

// ============================================================================
// SimilaritySearchOrchestrator::Impl
// ============================================================================

class SimilaritySearchOrchestrator::Impl {
public:
    Impl(std::shared_ptr<IFacetVectorStore> vectorStore, std::shared_ptr<IRecordStore> recordStore,
         const SimilaritySearchConfig& config, WeightProfileRegistry registry)
        : vectorStore_(std::move(vectorStore)), recordStore_(std::move(recordStore)),
          config_(config), registry_(std::move(registry)),
          fusion_(RankFusionConfig{config.rrfK, 0}) {
        if (auto valid = config_.validate(); !valid) {
            configError_ = valid.error();
            spdlog::error("Similarity search config rejected: {}", configError_->message);
        } else if (!vectorStore_ || !recordStore_) {
            configError_ = Error{ErrorCode::NotInitialized, "Collaborator stores are not set"};
        } else if (config_.enableParallelExecution) {
            ownedPool_ = std::make_unique<boost::asio::thread_pool>(config_.workerThreads);
        }
    }

    ~Impl() {
        if (ownedPool_) {
            ownedPool_->join();
        }
    }

    Result<SimilarityResponse> searchInternal(const SimilarityRequest& request);

    std::optional<boost::asio::any_io_executor> fanOutExecutor() const {
        if (!config_.enableParallelExecution) {
            return std::nullopt;
        }
        if (executor_) {
            return executor_;
        }
        if (ownedPool_) {
            return boost::asio::any_io_executor(ownedPool_->get_executor());
        }
        return std::nullopt;
    }

    Result<void> validateRequest(const SimilarityRequest& request) const;
    Error recordFailure(Error error, const SimilarityRequest& request);

    std::shared_ptr<IFacetVectorStore> vectorStore_;
    std::shared_ptr<IRecordStore> recordStore_;
    SimilaritySearchConfig config_;
    WeightProfileRegistry registry_;
    RankFusionEngine fusion_;
    std::optional<Error> configError_;
    std::unique_ptr<boost::asio::thread_pool> ownedPool_;
    std::optional<boost::asio::any_io_executor> executor_;
    mutable SimilaritySearchOrchestrator::Statistics stats_;
};

Result<void> SimilaritySearchOrchestrator::Impl::validateRequest(
    const SimilarityRequest& request) const {
    if (configError_) {
        return *configError_;
    }
    if (request.queryId.empty()) {
        return Error{ErrorCode::InvalidArgument, "Query listing id must not be empty"};
    }
    if (request.topK == 0) {
        return Error{ErrorCode::InvalidArgument, "top_k must be >= 1"};
    }
    if (request.filters) {
        if (auto valid = request.filters->validate(); !valid) {
            return valid.error();
        }
    }
    return {};
}

Error SimilaritySearchOrchestrator::Impl::recordFailure(Error error,
                                                        const SimilarityRequest& request) {
    stats_.failedQueries.fetch_add(1, std::memory_order_relaxed);
    if (error.code == ErrorCode::Timeout) {
        stats_.timedOutQueries.fetch_add(1, std::memory_order_relaxed);
    } else if (error.code == ErrorCode::OperationCancelled) {
        stats_.cancelledQueries.fetch_add(1, std::memory_order_relaxed);
    }
    spdlog::info("Similarity search for listing {} (mode {}) failed: [{}] {}", request.queryId,
                 request.mode, errorToString(error.code), error.message);
    return error;
}

Result<SimilarityResponse>
SimilaritySearchOrchestrator::Impl::searchInternal(const SimilarityRequest& request) {
    const auto startTime = std::chrono::steady_clock::now();
    stats_.totalQueries.fetch_add(1, std::memory_order_relaxed);

    if (auto valid = validateRequest(request); !valid) {
        return recordFailure(valid.error(), request);
    }

    auto profile = registry_.find(request.mode);
    if (!profile) {
        return recordFailure(profile.error(), request);
    }
    const auto& weights = profile.value();

    const size_t neighborLimit = request.topK * config_.overFetchFactor;
    const size_t hydrationLimit = request.topK * config_.hydrationFactor;

    // Phase 1: the query listing's vector in every facet. All facets are required.
    FanOutOptions vectorOpts;
    vectorOpts.executor = fanOutExecutor();
    vectorOpts.timeout = config_.collaboratorTimeout;
    vectorOpts.cancel = request.stopToken;
    vectorOpts.label = "query vector fetch";

    std::vector<FanOut<FacetVector>::Task> vectorTasks;
    vectorTasks.reserve(kAllFacets.size());
    for (auto facet : kAllFacets) {
        vectorTasks.emplace_back([store = vectorStore_, id = request.queryId,
                                  facet](std::stop_token) -> Result<FacetVector> {
            auto vec = store->getFacetVector(id, facet);
            if (!vec) {
                return vectorFetchError(vec.error(), id, facet);
            }
            if (vec.value().empty()) {
                return Error{ErrorCode::QueryEntityNotFound, "Listing " + id + " has an empty '" +
                                                                 facetToString(facet) + "' vector"};
            }
            return vec;
        });
    }

    auto queryVectors = FanOut<FacetVector>::run(std::move(vectorTasks), vectorOpts);
    if (!queryVectors) {
        return recordFailure(queryVectors.error(), request);
    }

    // Phase 2: neighbors per facet. Zero-weight facets cannot move the fused order.
    std::vector<Facet> queriedFacets;
    std::vector<FanOut<RankedList>::Task> neighborTasks;
    for (size_t i = 0; i < kAllFacets.size(); ++i) {
        const auto facet = kAllFacets[i];
        if (weights.weightFor(facet) <= 0.0) {
            spdlog::debug("Skipping neighbor query for zero-weight facet {}", facetToString(facet));
            continue;
        }
        queriedFacets.push_back(facet);
        neighborTasks.emplace_back([store = vectorStore_, facet,
                                    vec = std::move(queryVectors.value()[i]),
                                    neighborLimit](std::stop_token) -> Result<RankedList> {
            auto neighbors = store->queryNeighbors(facet, vec, neighborLimit);
            if (!neighbors) {
                return collaboratorError(neighbors.error(), std::string("Querying '") +
                                                                facetToString(facet) +
                                                                "' neighbors failed");
            }
            return neighbors;
        });
    }

    auto neighborOpts = vectorOpts;
    neighborOpts.label = "facet neighbor query";
    auto neighborLists = FanOut<RankedList>::run(std::move(neighborTasks), neighborOpts);
    if (!neighborLists) {
        return recordFailure(neighborLists.error(), request);
    }

    SimilarityResponse response;
    response.mode = weights.name;

    FacetRankings rankings;
    for (size_t i = 0; i < queriedFacets.size(); ++i) {
        auto& list = neighborLists.value()[i];
        if (list.size() > neighborLimit) {
            list.resize(neighborLimit);
        }
        response.candidatesPerFacet[queriedFacets[i]] = list.size();
        spdlog::debug("Facet {} returned {} neighbors for listing {}",
                      facetToString(queriedFacets[i]), list.size(), request.queryId);
        rankings.emplace(queriedFacets[i], std::move(list));
    }

    if (request.stopToken.stop_requested()) {
        return recordFailure(Error{ErrorCode::OperationCancelled, "Search cancelled by caller"},
                             request);
    }

    auto fused = fusion_.fuse(rankings, weights);
    if (!fused) {
        return recordFailure(fused.error(), request);
    }
    response.fusedCount = fused.value().size();

    // Hydrate the best fused ids, never the query listing itself
    std::vector<EntityId> candidateIds;
    std::unordered_map<EntityId, const FusedEntry*> fusedById;
    candidateIds.reserve(std::min(hydrationLimit, fused.value().size()));
    for (const auto& entry : fused.value()) {
        if (candidateIds.size() >= hydrationLimit) {
            break;
        }
        if (entry.id == request.queryId) {
            continue;
        }
        candidateIds.push_back(entry.id);
        fusedById.emplace(entry.id, &entry);
    }

    std::vector<SimilarityHit> hits;
    if (!candidateIds.empty()) {
        using RecordMap = std::unordered_map<EntityId, ListingRecord>;
        auto recordOpts = vectorOpts;
        recordOpts.label = "record hydration";

        std::vector<FanOut<RecordMap>::Task> recordTasks;
        recordTasks.emplace_back(
            [store = recordStore_, ids = candidateIds](std::stop_token) -> Result<RecordMap> {
                auto records = store->getRecords(ids);
                if (!records) {
                    return collaboratorError(records.error(), "Fetching listing records failed");
                }
                return records;
            });

        auto hydrated = FanOut<RecordMap>::run(std::move(recordTasks), recordOpts);
        if (!hydrated) {
            return recordFailure(hydrated.error(), request);
        }

        auto& recordMap = hydrated.value().front();
        hits.reserve(candidateIds.size());
        for (const auto& id : candidateIds) {
            auto it = recordMap.find(id);
            if (it == recordMap.end()) {
                ++response.droppedWithoutRecord;
                continue;
            }
            hits.push_back(SimilarityHit{std::move(it->second), *fusedById.at(id)});
        }
    }
    response.hydratedCount = hits.size();
    spdlog::debug("Hydrated {}/{} candidates for listing {} ({} without record)", hits.size(),
                  candidateIds.size(), request.queryId, response.droppedWithoutRecord);

    if (request.filters) {
        FilterStats filterStats;
        std::vector<SimilarityHit> filtered;
        filtered.reserve(hits.size());
        for (auto& hit : hits) {
            if (PostFilterEngine::admit(hit.record, *request.filters, filterStats)) {
                filtered.push_back(std::move(hit));
            }
        }
        spdlog::debug("Post filter kept {}/{} listings ({} malformed)", filtered.size(),
                      filterStats.evaluated, filterStats.malformed);
        hits = std::move(filtered);
        response.filterStats = filterStats;
    }

    if (hits.size() > request.topK) {
        hits.resize(request.topK);
    }
    response.hits = std::move(hits);

    const auto endTime = std::chrono::steady_clock::now();
    response.executionTimeMs =
        std::chrono::duration_cast<std::chrono::milliseconds>(endTime - startTime).count();

    stats_.successfulQueries.fetch_add(1, std::memory_order_relaxed);
    const auto durationMicros = static_cast<uint64_t>(
        std::chrono::duration_cast<std::chrono::microseconds>(endTime - startTime).count());
    stats_.totalQueryTimeMicros.fetch_add(durationMicros, std::memory_order_relaxed);
    const uint64_t successful = stats_.successfulQueries.load(std::memory_order_relaxed);
    if (successful > 0) {
        stats_.avgQueryTimeMicros.store(
            stats_.totalQueryTimeMicros.load(std::memory_order_relaxed) / successful,
            std::memory_order_relaxed);
    }

    spdlog::debug("Similarity search for listing {} (mode {}) returned {} of {} fused in {} ms",
                  request.queryId, response.mode, response.hits.size(), response.fusedCount,
                  response.executionTimeMs);
    return response;
}

// ============================================================================
// SimilaritySearchOrchestrator
// ============================================================================

SimilaritySearchOrchestrator::SimilaritySearchOrchestrator(
    std::shared_ptr<IFacetVectorStore> vectorStore, std::shared_ptr<IRecordStore> recordStore,
    const SimilaritySearchConfig& config, WeightProfileRegistry registry)
    : pImpl_(std::make_unique<Impl>(std::move(vectorStore), std::move(recordStore), config,
                                    std::move(registry))) {}

SimilaritySearchOrchestrator::~SimilaritySearchOrchestrator() = default;
SimilaritySearchOrchestrator::SimilaritySearchOrchestrator(
    SimilaritySearchOrchestrator&&) noexcept = default;
SimilaritySearchOrchestrator&
SimilaritySearchOrchestrator::operator=(SimilaritySearchOrchestrator&&) noexcept = default;

Result<std::vector<ListingRecord>>
SimilaritySearchOrchestrator::search(const SimilarityRequest& request) {
    auto response = pImpl_->searchInternal(request);
    if (!response) {
        return response.error();
    }
    return response.value().records();
}

Result<SimilarityResponse>
SimilaritySearchOrchestrator::searchWithResponse(const SimilarityRequest& request) {
    return pImpl_->searchInternal(request);
}

const SimilaritySearchConfig& SimilaritySearchOrchestrator::getConfig() const {
    return pImpl_->config_;
}

const WeightProfileRegistry& SimilaritySearchOrchestrator::getProfiles() const {
    return pImpl_->registry_;
}

const SimilaritySearchOrchestrator::Statistics&
SimilaritySearchOrchestrator::getStatistics() const {
    return pImpl_->stats_;
}

void SimilaritySearchOrchestrator::resetStatistics() {
    auto& s = pImpl_->stats_;
    s.totalQueries.store(0);
    s.successfulQueries.store(0);
    s.failedQueries.store(0);
    s.timedOutQueries.store(0);
    s.cancelledQueries.store(0);
    s.totalQueryTimeMicros.store(0);
    s.avgQueryTimeMicros.store(0);
}

void SimilaritySearchOrchestrator::setExecutor(
    std::optional<boost::asio::any_io_executor> executor) {
    pImpl_->executor_ = std::move(executor);
}

Result<std::unique_ptr<SimilaritySearchOrchestrator>>
createSimilaritySearch(std::shared_ptr<IFacetVectorStore> vectorStore,
                       std::shared_ptr<IRecordStore> recordStore,
                       const SimilaritySearchConfig& config, WeightProfileRegistry registry) {
    if (!vectorStore) {
        return Error{ErrorCode::InvalidArgument, "Vector store is required"};
    }
    if (!recordStore) {
        return Error{ErrorCode::InvalidArgument, "Record store is required"};
    }
    if (auto valid = config.validate(); !valid) {
        return valid.error();
    }
    return std::make_unique<SimilaritySearchOrchestrator>(
        std::move(vectorStore), std::move(recordStore), config, std::move(registry));
}

} // namespace homematch::search
