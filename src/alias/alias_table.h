#pragma once
#include <QHash>
#include <QList>
#include <QMap>
#include <QString>
#include <QStringList>
#include <memory>
#include <optional>

struct AliasEntry {
    QString alias;      // lowercased as configured
    QString target;
    bool fallback = false;
};

// A named bundle of aliases addressed as "profile:alias". Every target
// carries its provider ("provider:model"); the overrides replace the
// provider's own settings for requests routed through the profile.
struct AliasProfile {
    QString name;                       // lowercased, without the '#' marker
    QMap<QString, QString> aliases;     // alias -> provider:model
    std::optional<int> timeoutMs;
    std::optional<int> maxRetries;
};

// Alias definitions per provider. Built once per configuration load and
// never modified afterwards; reloads publish a whole new table.
class AliasTable {
public:
    using ProviderAliases = QMap<QString, QMap<QString, QString>>;

    static std::shared_ptr<const AliasTable> build(const QStringList& providerOrder,
                                                   const QString& defaultProvider,
                                                   const ProviderAliases& aliases,
                                                   const ProviderAliases& fallbackAliases = {},
                                                   quint64 generation = 0,
                                                   const QList<AliasProfile>& profiles = {});

    static std::shared_ptr<const AliasTable> empty();

    // Lowercase, with '_' folded into '-'.
    static QString normalize(const QString& name);

    QStringList providers() const { return m_providerOrder; }
    QString defaultProvider() const { return m_defaultProvider; }
    quint64 generation() const { return m_generation; }

    bool hasProvider(const QString& provider) const;
    int providerRank(const QString& provider) const;

    std::optional<QString> lookup(const QString& provider, const QString& alias) const;
    std::optional<AliasEntry> entry(const QString& provider, const QString& alias) const;

    // Entries of one provider sorted by alias name.
    QList<AliasEntry> entries(const QString& provider) const;
    int aliasCount() const;

    bool isProfile(const QString& name) const;
    std::optional<AliasProfile> profile(const QString& name) const;
    // "provider:model" target of an alias inside a profile.
    std::optional<QString> profileTarget(const QString& profile, const QString& alias) const;
    QStringList profileNames() const;   // sorted

private:
    AliasTable() = default;

    QStringList m_providerOrder;
    QHash<QString, int> m_rank;
    QString m_defaultProvider;
    quint64 m_generation = 0;
    // provider -> normalized alias -> entry
    QHash<QString, QMap<QString, AliasEntry>> m_entries;
    // profile name -> profile, aliases keyed by normalized name
    QMap<QString, AliasProfile> m_profiles;
};

using AliasTablePtr = std::shared_ptr<const AliasTable>;
