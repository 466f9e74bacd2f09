#pragma once
#include "resolution.h"
#include "semantic/ports.h"
#include <optional>

inline constexpr QChar kLiteralMarker = QLatin1Char('!');
inline constexpr QChar kProviderSeparator = QLatin1Char(':');

struct ProviderModel {
    QString provider;   // lowercased, empty when the input had no prefix
    QString model;
};

// Splits "provider:model" on the first separator.
ProviderModel splitProviderPrefix(const QString& raw);

// One resolution strategy. resolve() yields nullopt when the strategy does
// not produce a final answer for the context.
class IAliasResolver {
public:
    virtual ~IAliasResolver() = default;
    virtual QString name() const = 0;
    virtual bool canResolve(const ResolutionContext& ctx) const = 0;
    virtual Result<std::optional<ResolutionResult>> resolve(const ResolutionContext& ctx) const = 0;
};

// "!provider:model" or "!model": skips alias lookup entirely.
class LiteralPrefixResolver : public IAliasResolver {
public:
    QString name() const override { return QStringLiteral("literal"); }
    bool canResolve(const ResolutionContext& ctx) const override;
    Result<std::optional<ResolutionResult>> resolve(const ResolutionContext& ctx) const override;
};

// Exact alias hit in the scoped provider, followed through alias-to-alias
// hops until a concrete model is reached.
class ChainedAliasResolver : public IAliasResolver {
public:
    QString name() const override { return QStringLiteral("chained"); }
    bool canResolve(const ResolutionContext& ctx) const override;
    Result<std::optional<ResolutionResult>> resolve(const ResolutionContext& ctx) const override;

    static Result<ResolutionResult> follow(const ResolutionContext& ctx,
                                           const QString& provider,
                                           const QString& alias);
};

// Collects every alias of the scoped provider (or of all providers when no
// scope exists) that occurs inside the requested model name.
class SubstringMatcher {
public:
    QList<AliasMatch> findMatches(const ResolutionContext& ctx) const;
};

// Picks a single winner from the collected matches and follows its chain.
class MatchRanker : public IAliasResolver {
public:
    QString name() const override { return QStringLiteral("ranker"); }
    bool canResolve(const ResolutionContext& ctx) const override;
    Result<std::optional<ResolutionResult>> resolve(const ResolutionContext& ctx) const override;

    static QList<AliasMatch> rank(const QList<AliasMatch>& matches, const AliasTable& table);
};
