#include "bootstrap.h"
#include "log_manager.h"
#include "config/config_store.h"
#include "adapters/executor/qt_executor.h"
#include "pipeline/middlewares/debug_middleware.h"
#include "pipeline/middlewares/thought_signature_middleware.h"

Bootstrap::Bootstrap(QObject* parent)
    : QObject(parent)
{
}

Bootstrap::~Bootstrap()
{
    stopAll();
}

AliasTablePtr Bootstrap::buildAliasTable(const GatewayConfig& config, quint64 generation)
{
    return AliasTable::build(config.providerNames(),
                             config.effectiveDefaultProvider(),
                             config.aliases,
                             config.fallbackAliases,
                             generation,
                             config.profiles);
}

AliasCacheSettings Bootstrap::cacheSettings(const CacheOptions& options)
{
    AliasCacheSettings settings;
    settings.ttlSeconds = options.aliasTtlSeconds;
    settings.maxSize = options.aliasMaxSize;
    settings.maxChainLength = options.aliasMaxChainLength;
    return settings;
}

VoidResult Bootstrap::addMiddleware(std::unique_ptr<IMiddleware> mw)
{
    if (m_running)
        return std::unexpected(DomainFailure::configurationInvalid(
            QStringLiteral("middlewares cannot be added while the gateway is running")));
    if (!mw)
        return std::unexpected(DomainFailure::invalidInput(
            QStringLiteral("null_middleware"), QStringLiteral("middleware is null")));
    m_extraMiddlewares.push_back(std::move(mw));
    return {};
}

VoidResult Bootstrap::registerBuiltinMiddlewares(const MiddlewareOptions& options)
{
    if (options.thoughtSignatures) {
        ThoughtSignatureSettings settings;
        settings.maxConversations = options.thoughtSignatureCacheSize;
        settings.ttlSeconds = options.thoughtSignatureTtlSeconds;
        auto added = m_chain.addMiddleware(std::make_unique<ThoughtSignatureMiddleware>(settings));
        if (!added)
            return added;
    }
    if (options.debug) {
        auto added = m_chain.addMiddleware(std::make_unique<DebugMiddleware>(true));
        if (!added)
            return added;
    }
    return registerExtraMiddlewares();
}

VoidResult Bootstrap::registerExtraMiddlewares()
{
    for (auto& mw : m_extraMiddlewares) {
        auto added = m_chain.addMiddleware(std::move(mw));
        if (!added)
            return added;
    }
    m_extraMiddlewares.clear();
    return {};
}

// Providers first: an alias table is only published once the provider
// set it refers to has been accepted.
VoidResult Bootstrap::applyConfig(const GatewayConfig& config)
{
    auto loaded = m_providers.load(config.providers);
    if (!loaded)
        return loaded;

    m_aliases.configure(cacheSettings(config.cache));
    m_aliases.publish(buildAliasTable(config, ++m_generation));
    return {};
}

VoidResult Bootstrap::startAll()
{
    if (m_running)
        return {};

    LOG_CAT_INFO(QStringLiteral("gateway"), QStringLiteral("Starting gateway"));

    if (!m_config) {
        auto failure = DomainFailure::configurationInvalid(QStringLiteral("no configuration store set"));
        emit stepProgress(QStringLiteral("init"), false, failure.message);
        return std::unexpected(failure);
    }

    const GatewayConfig& config = m_config->config();
    auto applied = applyConfig(config);
    if (!applied) {
        emit stepProgress(QStringLiteral("config"), false, applied.error().message);
        return applied;
    }
    emit stepProgress(QStringLiteral("config"), true,
                      QStringLiteral("%1 providers, default '%2'")
                          .arg(config.providers.size())
                          .arg(config.effectiveDefaultProvider()));

    if (!m_chain.isInitialized()) {
        // A restarted gateway keeps the middlewares it registered the first time.
        auto registered = m_chain.size() == 0 ? registerBuiltinMiddlewares(config.middleware)
                                              : registerExtraMiddlewares();
        if (!registered) {
            emit stepProgress(QStringLiteral("middleware"), false, registered.error().message);
            return registered;
        }
        auto initialized = m_chain.initialize();
        if (!initialized) {
            emit stepProgress(QStringLiteral("middleware"), false, initialized.error().message);
            return initialized;
        }
    }
    emit stepProgress(QStringLiteral("middleware"), true, m_chain.middlewareNames().join(QStringLiteral(", ")));

    if (!m_executor) {
        auto executor = std::make_unique<QtExecutor>();
        m_executor = executor.get();
        m_ownedExecutor = std::move(executor);
    }

    m_dispatcher = std::make_unique<RequestDispatcher>(
        m_aliases, m_providers, m_chain, m_converter, *m_executor, &m_tracker);

    connect(m_config, &ConfigStore::configChanged, this, &Bootstrap::onConfigChanged,
            Qt::UniqueConnection);

    m_running = true;
    emit stepProgress(QStringLiteral("ready"), true, QString());
    LOG_CAT_INFO(QStringLiteral("gateway"),
                 QStringLiteral("Gateway ready: %1 providers, %2 middlewares, resolvers [%3]")
                     .arg(config.providers.size()).arg(m_chain.size())
                     .arg(m_aliases.chain().strategyNames().join(QStringLiteral(", "))));
    return {};
}

void Bootstrap::stopAll()
{
    if (!m_running)
        return;
    m_running = false;
    if (m_config)
        disconnect(m_config, &ConfigStore::configChanged, this, &Bootstrap::onConfigChanged);
    m_dispatcher.reset();
    m_chain.cleanup();
    LOG_CAT_INFO(QStringLiteral("gateway"), QStringLiteral("Gateway stopped"));
}

void Bootstrap::onConfigChanged()
{
    if (!m_running || !m_config)
        return;

    auto applied = applyConfig(m_config->config());
    if (!applied) {
        LOG_CAT_ERROR(QStringLiteral("config"),
                      QStringLiteral("Reloaded configuration rejected, keeping the previous one: %1")
                          .arg(applied.error().message));
        emit stepProgress(QStringLiteral("reload"), false, applied.error().message);
        return;
    }
    LOG_CAT_INFO(QStringLiteral("config"),
                 QStringLiteral("Configuration reloaded (generation %1)").arg(m_generation));
    emit reloaded(m_generation);
}
