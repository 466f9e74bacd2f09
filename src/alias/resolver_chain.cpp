#include "resolver_chain.h"
#include "core/log_manager.h"

ResolverChain::ResolverChain() = default;

QStringList ResolverChain::strategyNames() const
{
    return {m_literal.name(), m_chained.name(), QStringLiteral("substring"), m_ranker.name()};
}

ResolutionContext ResolverChain::makeContext(const QString& rawModel,
                                             const QString& explicitProvider,
                                             const AliasTablePtr& aliases,
                                             int maxChainLength) const
{
    ResolutionContext ctx;
    ctx.rawModel = rawModel.trimmed();
    ctx.aliases = aliases ? aliases : AliasTable::empty();
    ctx.defaultProvider = ctx.aliases->defaultProvider();
    ctx.maxChainLength = maxChainLength;

    // Profiles win over a provider of the same name. An alias the profile
    // does not define resolves like the bare remainder.
    QString requested = ctx.rawModel;
    const ProviderModel head = splitProviderPrefix(requested);
    if (!head.provider.isEmpty() && !requested.startsWith(kLiteralMarker)
        && ctx.aliases->isProfile(head.provider)) {
        ctx.profile = head.provider;
        const auto target = ctx.aliases->profileTarget(head.provider, head.model);
        ctx.profileHit = target.has_value();
        requested = target.value_or(head.model);
    }

    const ProviderModel parts = splitProviderPrefix(requested);
    if (!parts.provider.isEmpty() && !requested.startsWith(kLiteralMarker)) {
        ctx.explicitProvider = parts.provider;
        ctx.model = parts.model;
    } else {
        ctx.explicitProvider = explicitProvider.trimmed().toLower();
        ctx.model = requested;
    }
    return ctx;
}

Result<ResolutionResult> ResolverChain::resolve(const ResolutionContext& ctx) const
{
    if (ctx.profileHit) {
        ResolutionResult direct;
        direct.resolvedModel = ctx.model;
        direct.provider = ctx.explicitProvider;
        direct.wasResolved = true;
        direct.profile = ctx.profile;
        direct.resolutionPath << ctx.rawModel << ctx.explicitProvider + kProviderSeparator + ctx.model;
        return direct;
    }

    auto result = runStrategies(ctx);
    if (result)
        result->profile = ctx.profile;
    return result;
}

Result<ResolutionResult> ResolverChain::runStrategies(const ResolutionContext& ctx) const
{
    if (m_literal.canResolve(ctx)) {
        auto literal = m_literal.resolve(ctx);
        if (!literal)
            return std::unexpected(literal.error());
        return **literal;
    }

    if (m_chained.canResolve(ctx)) {
        auto chained = m_chained.resolve(ctx);
        if (!chained)
            return std::unexpected(chained.error());
        if (chained->has_value())
            return **chained;
    }

    const ResolutionContext matched = ctx.withMatches(m_matcher.findMatches(ctx));
    if (m_ranker.canResolve(matched)) {
        auto ranked = m_ranker.resolve(matched);
        if (!ranked)
            return std::unexpected(ranked.error());
        if (ranked->has_value())
            return **ranked;
    }

    // nothing applied: pass the model through for the scoped provider
    ResolutionResult passthrough;
    passthrough.resolvedModel = ctx.model;
    passthrough.provider = ctx.scope();
    passthrough.wasResolved = false;
    passthrough.resolutionPath << ctx.model;
    return passthrough;
}
