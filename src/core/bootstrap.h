#pragma once
#include "alias/alias_service.h"
#include "config/config_types.h"
#include "conversion/protocol_converter.h"
#include "gateway/request_dispatcher.h"
#include "gateway/request_tracker.h"
#include "pipeline/middleware_chain.h"
#include "provider/provider_registry.h"
#include <QObject>
#include <memory>

class ConfigStore;

// Wires configuration, resolution, provider state and the middleware chain
// into a RequestDispatcher, and keeps them in step across config reloads.
class Bootstrap : public QObject {
    Q_OBJECT

public:
    explicit Bootstrap(QObject* parent = nullptr);
    ~Bootstrap() override;

    void setConfig(ConfigStore* config) { m_config = config; }
    // Not owned. Without one, startAll() creates a QtExecutor.
    void setExecutor(IExecutor* executor) { m_executor = executor; }
    // Registered after the built-in middlewares; only before startAll().
    VoidResult addMiddleware(std::unique_ptr<IMiddleware> mw);

    VoidResult startAll();
    void stopAll();
    bool isRunning() const { return m_running; }

    AliasService& aliases() { return m_aliases; }
    ProviderRegistry& providers() { return m_providers; }
    MiddlewareChain& chain() { return m_chain; }
    ProtocolConverter& converter() { return m_converter; }
    RequestTracker& tracker() { return m_tracker; }
    RequestDispatcher* dispatcher() { return m_dispatcher.get(); }

    static AliasTablePtr buildAliasTable(const GatewayConfig& config, quint64 generation = 0);
    static AliasCacheSettings cacheSettings(const CacheOptions& options);

signals:
    void stepProgress(const QString& step, bool success, const QString& message);
    void reloaded(quint64 generation);

private slots:
    void onConfigChanged();

private:
    VoidResult applyConfig(const GatewayConfig& config);
    VoidResult registerBuiltinMiddlewares(const MiddlewareOptions& options);
    VoidResult registerExtraMiddlewares();

    ConfigStore* m_config = nullptr;
    IExecutor* m_executor = nullptr;
    std::unique_ptr<IExecutor> m_ownedExecutor;

    AliasService m_aliases;
    ProviderRegistry m_providers;
    MiddlewareChain m_chain;
    ProtocolConverter m_converter;
    RequestTracker m_tracker;
    std::unique_ptr<RequestDispatcher> m_dispatcher;

    std::vector<std::unique_ptr<IMiddleware>> m_extraMiddlewares;
    quint64 m_generation = 0;
    bool m_running = false;
};
