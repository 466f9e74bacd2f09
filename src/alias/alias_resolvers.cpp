#include "alias_resolver.h"
#include "core/log_manager.h"
#include <QSet>
#include <algorithm>

ProviderModel splitProviderPrefix(const QString& raw)
{
    const QString trimmed = raw.trimmed();
    const qsizetype sep = trimmed.indexOf(kProviderSeparator);
    if (sep <= 0)
        return {QString(), trimmed};
    return {trimmed.left(sep).trimmed().toLower(), trimmed.mid(sep + 1).trimmed()};
}

// ---------------------------------------------------------------------------
// LiteralPrefixResolver
// ---------------------------------------------------------------------------

bool LiteralPrefixResolver::canResolve(const ResolutionContext& ctx) const
{
    return ctx.rawModel.trimmed().startsWith(kLiteralMarker);
}

Result<std::optional<ResolutionResult>> LiteralPrefixResolver::resolve(const ResolutionContext& ctx) const
{
    const QString body = ctx.rawModel.trimmed().mid(1);
    const ProviderModel parts = splitProviderPrefix(body);

    ResolutionResult result;
    result.resolvedModel = parts.model;
    result.provider = parts.provider.isEmpty() ? ctx.scope() : parts.provider;
    result.wasResolved = false;
    result.resolutionPath << ctx.rawModel;
    return result;
}

// ---------------------------------------------------------------------------
// ChainedAliasResolver
// ---------------------------------------------------------------------------

bool ChainedAliasResolver::canResolve(const ResolutionContext& ctx) const
{
    const QString scope = ctx.scope();
    return ctx.aliases && !scope.isEmpty() && ctx.aliases->lookup(scope, ctx.model).has_value();
}

Result<std::optional<ResolutionResult>> ChainedAliasResolver::resolve(const ResolutionContext& ctx) const
{
    auto followed = follow(ctx, ctx.scope(), ctx.model);
    if (!followed)
        return std::unexpected(followed.error());
    return std::optional<ResolutionResult>(std::move(*followed));
}

Result<ResolutionResult> ChainedAliasResolver::follow(const ResolutionContext& ctx,
                                                      const QString& provider,
                                                      const QString& alias)
{
    const AliasTable& table = *ctx.aliases;
    QString currentProvider = provider.toLower();
    QString currentName = alias;

    QStringList path;
    path << alias;
    QSet<QString> seen;
    seen.insert(currentProvider + kProviderSeparator + AliasTable::normalize(alias));

    std::optional<QString> target = table.lookup(currentProvider, currentName);
    for (int hop = 1; target.has_value(); ++hop) {
        if (hop > ctx.maxChainLength) {
            return std::unexpected(DomainFailure::circularAlias(
                QStringLiteral("Alias chain for '%1' exceeds %2 hops: %3")
                    .arg(ctx.rawModel).arg(ctx.maxChainLength).arg(path.join(QStringLiteral(" -> ")))));
        }

        path << *target;

        // "other:model" only switches provider when "other" is declared.
        ProviderModel next = splitProviderPrefix(*target);
        if (next.provider.isEmpty() || !table.hasProvider(next.provider))
            next = {currentProvider, target->trimmed()};

        const QString key = next.provider + kProviderSeparator + AliasTable::normalize(next.model);
        if (seen.contains(key)) {
            return std::unexpected(DomainFailure::circularAlias(
                QStringLiteral("Circular alias detected while resolving '%1': %2")
                    .arg(ctx.rawModel, path.join(QStringLiteral(" -> ")))));
        }
        seen.insert(key);

        currentProvider = next.provider;
        currentName = next.model;
        target = table.lookup(currentProvider, currentName);
    }

    ResolutionResult result;
    result.resolvedModel = currentName;
    result.provider = currentProvider;
    result.wasResolved = true;
    result.resolutionPath = path;
    return result;
}

// ---------------------------------------------------------------------------
// SubstringMatcher
// ---------------------------------------------------------------------------

QList<AliasMatch> SubstringMatcher::findMatches(const ResolutionContext& ctx) const
{
    QList<AliasMatch> found;
    if (!ctx.aliases)
        return found;

    const QString input = AliasTable::normalize(ctx.model);
    if (input.isEmpty())
        return found;

    const QString scope = ctx.scope();
    const QStringList providers = scope.isEmpty() ? ctx.aliases->providers() : QStringList{scope};

    for (const QString& provider : providers) {
        const QList<AliasEntry> entries = ctx.aliases->entries(provider);
        for (const AliasEntry& e : entries) {
            const QString key = AliasTable::normalize(e.alias);
            if (key.isEmpty() || !input.contains(key))
                continue;
            found.append(AliasMatch{provider, e.alias, e.target,
                                    static_cast<int>(key.size()), key == input});
        }
    }
    return found;
}

// ---------------------------------------------------------------------------
// MatchRanker
// ---------------------------------------------------------------------------

bool MatchRanker::canResolve(const ResolutionContext& ctx) const
{
    return ctx.aliases && !ctx.matches.isEmpty();
}

QList<AliasMatch> MatchRanker::rank(const QList<AliasMatch>& matches, const AliasTable& table)
{
    QList<AliasMatch> ranked = matches;
    std::stable_sort(ranked.begin(), ranked.end(),
                     [&table](const AliasMatch& a, const AliasMatch& b) {
        if (a.isExact != b.isExact)
            return a.isExact;
        if (a.length != b.length)
            return a.length > b.length;
        const int ra = table.providerRank(a.provider);
        const int rb = table.providerRank(b.provider);
        if (ra != rb)
            return ra < rb;
        return a.alias < b.alias;
    });
    return ranked;
}

Result<std::optional<ResolutionResult>> MatchRanker::resolve(const ResolutionContext& ctx) const
{
    const QList<AliasMatch> ranked = rank(ctx.matches, *ctx.aliases);
    const AliasMatch& winner = ranked.first();

    if (ranked.size() > 1) {
        LOG_CAT_DEBUG(QStringLiteral("alias"),
                      QStringLiteral("'%1' matched %2 aliases, picked %3:%4")
                          .arg(ctx.model).arg(ranked.size()).arg(winner.provider, winner.alias));
    }

    auto followed = ChainedAliasResolver::follow(ctx, winner.provider, winner.alias);
    if (!followed)
        return std::unexpected(followed.error());

    ResolutionResult result = std::move(*followed);
    result.resolutionPath.prepend(ctx.model);
    result.matches = ranked;
    return std::optional<ResolutionResult>(std::move(result));
}
