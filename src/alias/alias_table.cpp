#include "alias_table.h"
#include "core/log_manager.h"
#include <limits>

namespace {

bool acceptAlias(const QString& provider, const QString& alias, const QString& target)
{
    if (alias.isEmpty() || target.trimmed().isEmpty()) {
        LOG_CAT_WARNING(QStringLiteral("alias"),
                        QStringLiteral("Skipping empty alias definition for provider '%1'").arg(provider));
        return false;
    }
    if (AliasTable::normalize(alias) == AliasTable::normalize(target)) {
        LOG_CAT_WARNING(QStringLiteral("alias"),
                        QStringLiteral("Skipping self-referencing alias '%1' for provider '%2'")
                            .arg(alias, provider));
        return false;
    }
    if (target.contains(QLatin1Char('@'))) {
        LOG_CAT_WARNING(QStringLiteral("alias"),
                        QStringLiteral("Skipping alias '%1' for provider '%2': target '%3' is not a model name")
                            .arg(alias, provider, target));
        return false;
    }
    return true;
}

}

QString AliasTable::normalize(const QString& name)
{
    QString n = name.trimmed().toLower();
    n.replace(QLatin1Char('_'), QLatin1Char('-'));
    return n;
}

std::shared_ptr<const AliasTable> AliasTable::empty()
{
    static const std::shared_ptr<const AliasTable> s_empty(new AliasTable());
    return s_empty;
}

std::shared_ptr<const AliasTable> AliasTable::build(const QStringList& providerOrder,
                                                    const QString& defaultProvider,
                                                    const ProviderAliases& aliases,
                                                    const ProviderAliases& fallbackAliases,
                                                    quint64 generation,
                                                    const QList<AliasProfile>& profiles)
{
    std::shared_ptr<AliasTable> table(new AliasTable());
    table->m_generation = generation;

    for (const QString& p : providerOrder) {
        const QString name = p.trimmed().toLower();
        if (name.isEmpty() || table->m_rank.contains(name))
            continue;
        table->m_rank.insert(name, table->m_providerOrder.size());
        table->m_providerOrder.append(name);
    }

    const QString def = defaultProvider.trimmed().toLower();
    if (!def.isEmpty() && !table->m_rank.contains(def)) {
        LOG_CAT_WARNING(QStringLiteral("alias"),
                        QStringLiteral("Default provider '%1' is not declared; ignoring").arg(def));
    } else {
        table->m_defaultProvider = def;
    }

    auto addAll = [&table](const ProviderAliases& source, bool fallback) {
        for (auto pit = source.constBegin(); pit != source.constEnd(); ++pit) {
            const QString provider = pit.key().trimmed().toLower();
            if (!table->m_rank.contains(provider)) {
                LOG_CAT_WARNING(QStringLiteral("alias"),
                                QStringLiteral("Skipping aliases for undeclared provider '%1'").arg(provider));
                continue;
            }
            auto& bucket = table->m_entries[provider];
            for (auto it = pit.value().constBegin(); it != pit.value().constEnd(); ++it) {
                const QString alias = it.key().trimmed().toLower();
                const QString target = it.value().trimmed();
                if (!acceptAlias(provider, alias, target))
                    continue;
                const QString key = normalize(alias);
                // explicit definitions always shadow fallbacks
                if (fallback && bucket.contains(key))
                    continue;
                bucket.insert(key, AliasEntry{alias, target, fallback});
            }
        }
    };
    addAll(aliases, false);
    addAll(fallbackAliases, true);

    for (const AliasProfile& source : profiles) {
        AliasProfile profile = source;
        profile.name = source.name.trimmed().toLower();
        if (profile.name.startsWith(QLatin1Char('#')))
            profile.name.remove(0, 1);
        if (profile.name.isEmpty())
            continue;
        profile.aliases.clear();
        for (auto it = source.aliases.constBegin(); it != source.aliases.constEnd(); ++it) {
            const QString target = it.value().trimmed();
            const QString owner = target.section(QLatin1Char(':'), 0, 0).toLower();
            if (!target.contains(QLatin1Char(':')) || !table->m_rank.contains(owner)) {
                LOG_CAT_WARNING(QStringLiteral("alias"),
                                QStringLiteral("Skipping alias '%1' of profile '%2': target '%3' names no declared provider")
                                    .arg(it.key(), profile.name, target));
                continue;
            }
            profile.aliases.insert(normalize(it.key()), target);
        }
        table->m_profiles.insert(profile.name, profile);
    }

    return table;
}

bool AliasTable::hasProvider(const QString& provider) const
{
    return m_rank.contains(provider.toLower());
}

int AliasTable::providerRank(const QString& provider) const
{
    return m_rank.value(provider.toLower(), std::numeric_limits<int>::max());
}

std::optional<AliasEntry> AliasTable::entry(const QString& provider, const QString& alias) const
{
    const auto pit = m_entries.constFind(provider.toLower());
    if (pit == m_entries.constEnd())
        return std::nullopt;
    const auto it = pit->constFind(normalize(alias));
    if (it == pit->constEnd())
        return std::nullopt;
    return *it;
}

std::optional<QString> AliasTable::lookup(const QString& provider, const QString& alias) const
{
    const auto e = entry(provider, alias);
    if (!e)
        return std::nullopt;
    return e->target;
}

QList<AliasEntry> AliasTable::entries(const QString& provider) const
{
    const auto pit = m_entries.constFind(provider.toLower());
    if (pit == m_entries.constEnd())
        return {};
    return pit->values();
}

int AliasTable::aliasCount() const
{
    int count = 0;
    for (const auto& bucket : m_entries)
        count += bucket.size();
    return count;
}

bool AliasTable::isProfile(const QString& name) const
{
    return m_profiles.contains(name.trimmed().toLower());
}

std::optional<AliasProfile> AliasTable::profile(const QString& name) const
{
    const auto it = m_profiles.constFind(name.trimmed().toLower());
    if (it == m_profiles.constEnd())
        return std::nullopt;
    return *it;
}

std::optional<QString> AliasTable::profileTarget(const QString& profile, const QString& alias) const
{
    const auto it = m_profiles.constFind(profile.trimmed().toLower());
    if (it == m_profiles.constEnd())
        return std::nullopt;
    const auto target = it->aliases.constFind(normalize(alias));
    if (target == it->aliases.constEnd())
        return std::nullopt;
    return *target;
}

QStringList AliasTable::profileNames() const
{
    return m_profiles.keys();
}
