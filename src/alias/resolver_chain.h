#pragma once
#include "alias_resolver.h"
#include <memory>
#include <vector>

// Runs the resolution strategies in a fixed order:
// literal bypass, exact chained alias, substring match + ranking.
// A "profile:alias" prefix is recognized before the provider prefix.
class ResolverChain {
public:
    ResolverChain();

    ResolutionContext makeContext(const QString& rawModel,
                                  const QString& explicitProvider,
                                  const AliasTablePtr& aliases,
                                  int maxChainLength) const;

    Result<ResolutionResult> resolve(const ResolutionContext& ctx) const;

    QStringList strategyNames() const;

private:
    Result<ResolutionResult> runStrategies(const ResolutionContext& ctx) const;

    LiteralPrefixResolver m_literal;
    ChainedAliasResolver m_chained;
    SubstringMatcher m_matcher;
    MatchRanker m_ranker;
};
