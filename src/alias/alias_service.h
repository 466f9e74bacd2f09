#pragma once
#include "resolver_chain.h"
#include "resolution_cache.h"
#include <atomic>
#include <memory>

struct AliasCacheSettings {
    int ttlSeconds = 300;
    int maxSize = 1000;
    int maxChainLength = 8;
};

// Entry point for model resolution. Holds the current alias table as an
// atomically swapped snapshot and fronts the resolver chain with the cache.
class AliasService {
public:
    explicit AliasService(const AliasCacheSettings& settings = {});

    void configure(const AliasCacheSettings& settings);

    // Makes a new table visible to all subsequent lookups and drops every
    // cached result computed against the previous one.
    void publish(AliasTablePtr table);
    AliasTablePtr snapshot() const;

    Result<ResolutionResult> resolve(const QString& rawModel,
                                     const QString& explicitProvider = {});

    ResolutionCache& cache() { return m_cache; }
    const ResolverChain& chain() const { return m_chain; }

private:
    std::atomic<AliasTablePtr> m_table;
    std::atomic<int> m_maxChainLength{8};
    ResolverChain m_chain;
    ResolutionCache m_cache;
};
