#include "config_store.h"
#include "core/log_manager.h"
#include "provider/provider_registry.h"
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonArray>
#include <QJsonDocument>
#include <QRegularExpression>
#include <QStandardPaths>
#include <limits>
#include <optional>

namespace {

QJsonValue jsonValueEither(const QJsonObject& obj, const char* snakeKey, const char* camelKey)
{
    const QString snake = QString::fromUtf8(snakeKey);
    if (obj.contains(snake))
        return obj.value(snake);
    return obj.value(QString::fromUtf8(camelKey));
}

QString jsonStringEither(const QJsonObject& obj, const char* snakeKey, const char* camelKey)
{
    return jsonValueEither(obj, snakeKey, camelKey).toString();
}

QJsonObject jsonObjectEither(const QJsonObject& obj, const char* snakeKey, const char* camelKey)
{
    return jsonValueEither(obj, snakeKey, camelKey).toObject();
}

int jsonIntEither(const QJsonObject& obj, const char* snakeKey, const char* camelKey, int fallback)
{
    const QJsonValue value = jsonValueEither(obj, snakeKey, camelKey);
    return value.isUndefined() ? fallback : value.toInt(fallback);
}

bool jsonBoolEither(const QJsonObject& obj, const char* snakeKey, const char* camelKey, bool fallback)
{
    const QJsonValue value = jsonValueEither(obj, snakeKey, camelKey);
    return value.isUndefined() ? fallback : value.toBool(fallback);
}

QStringList splitKeys(const QString& raw)
{
    // A blank value stays a single empty key so validation can reject it.
    if (raw.trimmed().isEmpty())
        return {QString()};
    static const QRegularExpression whitespace(QStringLiteral("\\s+"));
    return raw.split(whitespace, Qt::SkipEmptyParts);
}

// "k1 k2" or ["k1", "k2"]; absent means no keys at all.
QStringList splitKeys(const QJsonValue& value)
{
    if (value.isUndefined() || value.isNull())
        return {};
    if (value.isArray()) {
        QStringList keys;
        for (const QJsonValue& v : value.toArray())
            keys.append(v.toString());
        return keys;
    }
    return splitKeys(value.toString());
}

WireFormat formatOrDefault(const QString& value, const QString& provider)
{
    if (value.isEmpty())
        return WireFormat::OpenAI;
    if (auto format = parseWireFormat(value))
        return *format;
    LOG_CAT_WARNING(QStringLiteral("config"),
                    QStringLiteral("Provider '%1': unknown api_format '%2', using openai")
                        .arg(provider, value));
    return WireFormat::OpenAI;
}

GatewayConfig::ProviderAliases parseAliasMap(const QJsonObject& obj)
{
    GatewayConfig::ProviderAliases result;
    for (auto it = obj.constBegin(); it != obj.constEnd(); ++it) {
        const QString provider = it.key().trimmed().toLower();
        const QJsonObject entries = it.value().toObject();
        for (auto e = entries.constBegin(); e != entries.constEnd(); ++e)
            result[provider].insert(e.key().trimmed().toLower(), e.value().toString().trimmed());
    }
    return result;
}

constexpr int kMaxTimeoutSeconds = std::numeric_limits<int>::max() / 1000;

// Seconds in the file, milliseconds in memory. Absent leaves the value alone.
VoidResult parseTimeout(const QJsonObject& obj, const QString& owner, std::optional<int>& timeoutMs)
{
    const QJsonValue timeout = obj.value(QStringLiteral("timeout"));
    if (timeout.isUndefined())
        return {};
    const qint64 seconds = timeout.toInteger(-1);
    if (seconds <= 0 || seconds > kMaxTimeoutSeconds) {
        return std::unexpected(DomainFailure::configurationInvalid(
            QStringLiteral("%1: timeout must be between 1 and %2 seconds").arg(owner).arg(kMaxTimeoutSeconds)));
    }
    timeoutMs = static_cast<int>(seconds * 1000);
    return {};
}

Result<ProviderConfig> parseProvider(const QJsonObject& obj)
{
    ProviderConfig config;
    config.name = obj.value(QStringLiteral("name")).toString().trimmed().toLower();
    ProviderConfig::assignKeys(config, splitKeys(jsonValueEither(obj, "api_key", "apiKey")));
    config.baseUrl = jsonStringEither(obj, "base_url", "baseUrl").trimmed();
    config.apiFormat = formatOrDefault(jsonStringEither(obj, "api_format", "apiFormat"), config.name);
    std::optional<int> timeoutMs;
    auto timeout = parseTimeout(obj, QStringLiteral("Provider '%1'").arg(config.name), timeoutMs);
    if (!timeout)
        return std::unexpected(timeout.error());
    config.timeoutMs = timeoutMs.value_or(config.timeoutMs);
    config.maxRetries = jsonIntEither(obj, "max_retries", "maxRetries", config.maxRetries);
    config.apiVersion = jsonStringEither(obj, "api_version", "apiVersion");

    const QJsonObject headers = jsonObjectEither(obj, "custom_headers", "customHeaders");
    for (auto it = headers.constBegin(); it != headers.constEnd(); ++it)
        config.customHeaders.insert(it.key(), it.value().toString());
    return config;
}

// {"name": {"timeout": 30, "max_retries": 1, "aliases": {"fast": "openai:gpt-4o-mini"}}}
// A leading '#' on the name is accepted and dropped.
Result<QList<AliasProfile>> parseProfiles(const QJsonObject& obj, const QStringList& providers)
{
    QList<AliasProfile> profiles;
    for (auto it = obj.constBegin(); it != obj.constEnd(); ++it) {
        const QJsonObject entry = it.value().toObject();
        AliasProfile profile;
        profile.name = it.key().trimmed().toLower();
        if (profile.name.startsWith(QLatin1Char('#')))
            profile.name.remove(0, 1);
        const QString owner = QStringLiteral("Profile '%1'").arg(profile.name);
        if (profile.name.isEmpty() || profile.name.contains(QLatin1Char(':'))) {
            return std::unexpected(DomainFailure::configurationInvalid(
                QStringLiteral("Invalid profile name '%1'").arg(it.key())));
        }

        auto timeout = parseTimeout(entry, owner, profile.timeoutMs);
        if (!timeout)
            return std::unexpected(timeout.error());
        const QJsonValue retries = jsonValueEither(entry, "max_retries", "maxRetries");
        if (!retries.isUndefined()) {
            const qint64 value = retries.toInteger(-1);
            if (value < 0 || value > std::numeric_limits<int>::max()) {
                return std::unexpected(DomainFailure::configurationInvalid(
                    QStringLiteral("%1: max_retries must be a non-negative integer").arg(owner)));
            }
            profile.maxRetries = static_cast<int>(value);
        }

        const QJsonObject aliases = entry.value(QStringLiteral("aliases")).toObject();
        for (auto a = aliases.constBegin(); a != aliases.constEnd(); ++a) {
            const QString target = a.value().toString().trimmed();
            const qsizetype sep = target.indexOf(QLatin1Char(':'));
            if (sep <= 0 || sep == target.size() - 1) {
                return std::unexpected(DomainFailure::configurationInvalid(
                    QStringLiteral("%1: alias '%2' must target provider:model, got '%3'")
                        .arg(owner, a.key(), target)));
            }
            const QString provider = target.left(sep).trimmed().toLower();
            if (!providers.contains(provider)) {
                return std::unexpected(DomainFailure::configurationInvalid(
                    QStringLiteral("%1: alias '%2' references unknown provider '%3' (available: %4)")
                        .arg(owner, a.key(), provider, providers.join(QStringLiteral(", ")))));
            }
            profile.aliases.insert(a.key().trimmed().toLower(), target);
        }

        if (providers.contains(profile.name)) {
            LOG_CAT_WARNING(QStringLiteral("config"),
                            QStringLiteral("Profile '%1' has the same name as a provider; "
                                           "the profile takes precedence for '%1:model'")
                                .arg(profile.name));
        }
        profiles.append(profile);
    }
    return profiles;
}

void applyProviderEnv(ProviderConfig& config, const QProcessEnvironment& env)
{
    const QString prefix = ConfigStore::envPrefix(config.name);

    if (env.contains(prefix + QStringLiteral("_API_KEY")))
        ProviderConfig::assignKeys(config, splitKeys(env.value(prefix + QStringLiteral("_API_KEY"))));
    if (env.contains(prefix + QStringLiteral("_BASE_URL")))
        config.baseUrl = env.value(prefix + QStringLiteral("_BASE_URL")).trimmed();
    if (env.contains(prefix + QStringLiteral("_API_FORMAT")))
        config.apiFormat = formatOrDefault(env.value(prefix + QStringLiteral("_API_FORMAT")), config.name);
    if (env.contains(prefix + QStringLiteral("_API_VERSION")))
        config.apiVersion = env.value(prefix + QStringLiteral("_API_VERSION"));

    // <P>_CUSTOM_HEADER_X_ORG=acme -> X-Org: acme
    const QString headerPrefix = prefix + QStringLiteral("_CUSTOM_HEADER_");
    for (const QString& key : env.keys()) {
        if (!key.startsWith(headerPrefix) || key.size() == headerPrefix.size())
            continue;
        QStringList parts = key.mid(headerPrefix.size()).toLower().split(QLatin1Char('_'), Qt::SkipEmptyParts);
        for (QString& part : parts)
            part[0] = part[0].toUpper();
        config.customHeaders.insert(parts.join(QLatin1Char('-')), env.value(key));
    }
}

} // namespace

ConfigStore::ConfigStore(QObject* parent)
    : QObject(parent)
{
}

QString ConfigStore::envPrefix(const QString& provider)
{
    QString prefix = provider.toUpper();
    for (QChar& c : prefix) {
        if (!((c >= QLatin1Char('A') && c <= QLatin1Char('Z')) || (c >= QLatin1Char('0') && c <= QLatin1Char('9'))))
            c = QLatin1Char('_');
    }
    return prefix;
}

Result<GatewayConfig> ConfigStore::parse(const QJsonObject& root, const QProcessEnvironment& env)
{
    GatewayConfig config;

    const QJsonValue providersValue = root.value(QStringLiteral("providers"));
    if (!providersValue.isUndefined() && !providersValue.isArray()) {
        return std::unexpected(DomainFailure::configurationInvalid(
            QStringLiteral("'providers' must be an array so declaration order is kept")));
    }
    for (const QJsonValue& pv : providersValue.toArray()) {
        auto provider = parseProvider(pv.toObject());
        if (!provider)
            return std::unexpected(provider.error());
        config.providers.append(*provider);
    }

    // Providers that only exist in the environment: <P>_API_KEY plus <P>_BASE_URL
    const QStringList declared = config.providerNames();
    QStringList envKeys = env.keys();
    envKeys.sort();
    for (const QString& key : envKeys) {
        if (!key.endsWith(QStringLiteral("_API_KEY")) || key.startsWith(QStringLiteral("CUSTOM_")))
            continue;
        const QString name = key.chopped(8).toLower();
        if (name.isEmpty() || declared.contains(name))
            continue;
        bool known = false;
        for (const QString& d : declared)
            known = known || envPrefix(d) == key.chopped(8);
        if (known)
            continue;
        if (!env.contains(key.chopped(8) + QStringLiteral("_BASE_URL"))) {
            LOG_CAT_DEBUG(QStringLiteral("config"),
                          QStringLiteral("Ignoring %1: no matching _BASE_URL").arg(key));
            continue;
        }
        ProviderConfig discovered;
        discovered.name = name;
        config.providers.append(discovered);
    }

    for (ProviderConfig& provider : config.providers)
        applyProviderEnv(provider, env);

    config.defaultProvider = jsonStringEither(root, "default_provider", "defaultProvider").trimmed().toLower();
    if (env.contains(QStringLiteral("MODELGATE_DEFAULT_PROVIDER")))
        config.defaultProvider = env.value(QStringLiteral("MODELGATE_DEFAULT_PROVIDER")).trimmed().toLower();

    config.aliases = parseAliasMap(root.value(QStringLiteral("aliases")).toObject());
    config.fallbackAliases = parseAliasMap(jsonObjectEither(root, "fallback_aliases", "fallbackAliases"));

    // <P>_ALIAS_<NAME>=target
    for (const ProviderConfig& provider : std::as_const(config.providers)) {
        const QString aliasPrefix = envPrefix(provider.name) + QStringLiteral("_ALIAS_");
        for (const QString& key : envKeys) {
            if (!key.startsWith(aliasPrefix) || key.size() == aliasPrefix.size())
                continue;
            config.aliases[provider.name].insert(key.mid(aliasPrefix.size()).toLower(),
                                                 env.value(key).trimmed());
        }
    }

    auto profiles = parseProfiles(root.value(QStringLiteral("profiles")).toObject(), config.providerNames());
    if (!profiles)
        return std::unexpected(profiles.error());
    config.profiles = *profiles;

    const QJsonObject cache = root.value(QStringLiteral("cache")).toObject();
    config.cache.aliasTtlSeconds = jsonIntEither(cache, "alias_ttl_seconds", "aliasTtlSeconds", config.cache.aliasTtlSeconds);
    config.cache.aliasMaxSize = jsonIntEither(cache, "alias_max_size", "aliasMaxSize", config.cache.aliasMaxSize);
    config.cache.aliasMaxChainLength = jsonIntEither(cache, "alias_max_chain_length", "aliasMaxChainLength",
                                                     config.cache.aliasMaxChainLength);

    const QJsonObject mw = root.value(QStringLiteral("middleware")).toObject();
    config.middleware.debug = jsonBoolEither(mw, "debug", "debug", config.middleware.debug);
    config.middleware.thoughtSignatures = jsonBoolEither(mw, "thought_signatures", "thoughtSignatures",
                                                         config.middleware.thoughtSignatures);
    config.middleware.thoughtSignatureCacheSize = jsonIntEither(mw, "thought_signature_cache_size",
                                                                "thoughtSignatureCacheSize",
                                                                config.middleware.thoughtSignatureCacheSize);
    config.middleware.thoughtSignatureTtlSeconds = jsonIntEither(mw, "thought_signature_ttl_seconds",
                                                                 "thoughtSignatureTtlSeconds",
                                                                 config.middleware.thoughtSignatureTtlSeconds);

    const QJsonObject log = root.value(QStringLiteral("log")).toObject();
    config.log.dir = log.value(QStringLiteral("dir")).toString();
    config.log.level = log.value(QStringLiteral("level")).toString(config.log.level);

    // Validation
    auto valid = ProviderRegistry::validate(config.providers);
    if (!valid)
        return std::unexpected(valid.error());
    if (!config.defaultProvider.isEmpty() && !config.providerNames().contains(config.defaultProvider)) {
        return std::unexpected(DomainFailure::configurationInvalid(
            QStringLiteral("default_provider '%1' is not a declared provider").arg(config.defaultProvider)));
    }
    if (config.cache.aliasMaxChainLength <= 0) {
        return std::unexpected(DomainFailure::configurationInvalid(
            QStringLiteral("cache.alias_max_chain_length must be positive")));
    }
    if (config.cache.aliasMaxSize < 0) {
        return std::unexpected(DomainFailure::configurationInvalid(
            QStringLiteral("cache.alias_max_size must not be negative")));
    }

    return config;
}

VoidResult ConfigStore::apply(const QByteArray& json, const QString& origin)
{
    QJsonParseError err;
    const QJsonDocument doc = QJsonDocument::fromJson(json, &err);
    if (err.error != QJsonParseError::NoError || !doc.isObject()) {
        const DomainFailure failure = DomainFailure::configurationInvalid(
            QStringLiteral("%1: not a JSON object (%2)").arg(origin, err.errorString()));
        LOG_CAT_ERROR(QStringLiteral("config"), failure.message);
        return std::unexpected(failure);
    }

    auto parsed = parse(doc.object(), m_env);
    if (!parsed) {
        LOG_CAT_ERROR(QStringLiteral("config"),
                      QStringLiteral("%1 rejected: %2").arg(origin, parsed.error().message));
        return std::unexpected(parsed.error());
    }

    m_config = *parsed;
    LOG_CAT_INFO(QStringLiteral("config"),
                 QStringLiteral("Loaded %1: %2 provider(s), default '%3'")
                     .arg(origin)
                     .arg(m_config.providers.size())
                     .arg(m_config.effectiveDefaultProvider()));
    emit configChanged();
    return {};
}

VoidResult ConfigStore::load(const QString& path)
{
    m_filePath = path;
    if (m_filePath.isEmpty()) {
        const QString appData = QStandardPaths::writableLocation(QStandardPaths::AppDataLocation);
        QDir().mkpath(appData);
        m_filePath = appData + QStringLiteral("/config.json");
    }

    QFile file(m_filePath);
    if (!file.open(QIODevice::ReadOnly)) {
        const DomainFailure failure = DomainFailure::configurationInvalid(
            QStringLiteral("Cannot read %1: %2").arg(m_filePath, file.errorString()));
        LOG_CAT_ERROR(QStringLiteral("config"), failure.message);
        return std::unexpected(failure);
    }

    auto result = apply(file.readAll(), m_filePath);
    if (m_watcher && !m_watcher->files().contains(m_filePath))
        m_watcher->addPath(m_filePath);
    return result;
}

VoidResult ConfigStore::loadFromJson(const QByteArray& json)
{
    return apply(json, QStringLiteral("inline configuration"));
}

VoidResult ConfigStore::reload()
{
    if (m_filePath.isEmpty()) {
        return std::unexpected(DomainFailure::configurationInvalid(
            QStringLiteral("No configuration file to reload")));
    }

    QFile file(m_filePath);
    if (!file.open(QIODevice::ReadOnly)) {
        const DomainFailure failure = DomainFailure::configurationInvalid(
            QStringLiteral("Cannot read %1: %2").arg(m_filePath, file.errorString()));
        LOG_CAT_ERROR(QStringLiteral("config"), QStringLiteral("Reload rejected: ") + failure.message);
        emit reloadRejected(failure);
        return std::unexpected(failure);
    }

    auto result = apply(file.readAll(), m_filePath);
    if (!result) {
        LOG_CAT_WARNING(QStringLiteral("config"), QStringLiteral("Keeping the previous configuration"));
        emit reloadRejected(result.error());
    }
    return result;
}

void ConfigStore::setWatchEnabled(bool enabled)
{
    if (enabled == isWatching())
        return;

    if (!enabled) {
        delete m_watcher;
        m_watcher = nullptr;
        return;
    }

    m_watcher = new QFileSystemWatcher(this);
    connect(m_watcher, &QFileSystemWatcher::fileChanged, this, &ConfigStore::onFileChanged);
    if (!m_filePath.isEmpty() && QFileInfo::exists(m_filePath))
        m_watcher->addPath(m_filePath);
}

void ConfigStore::onFileChanged(const QString& path)
{
    LOG_CAT_INFO(QStringLiteral("config"), QStringLiteral("%1 changed, reloading").arg(path));
    // Editors that replace the file drop it from the watch list
    if (m_watcher && !m_watcher->files().contains(path) && QFileInfo::exists(path))
        m_watcher->addPath(path);
    (void)reload();   // failures are logged and signalled by reload()
}
