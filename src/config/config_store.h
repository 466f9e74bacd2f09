#pragma once
#include "config_types.h"
#include <QFileSystemWatcher>
#include <QJsonObject>
#include <QObject>
#include <QProcessEnvironment>

// Loads the gateway configuration from a JSON file plus environment
// overrides. A configuration that fails validation is never applied: the
// previous one stays in effect.
class ConfigStore : public QObject {
    Q_OBJECT

public:
    explicit ConfigStore(QObject* parent = nullptr);

    // Defaults to the process environment.
    void setEnvironment(const QProcessEnvironment& env) { m_env = env; }

    // An empty path selects <AppDataLocation>/config.json.
    VoidResult load(const QString& path);
    VoidResult loadFromJson(const QByteArray& json);
    VoidResult reload();

    void setWatchEnabled(bool enabled);
    bool isWatching() const { return m_watcher != nullptr; }

    const GatewayConfig& config() const { return m_config; }
    QString filePath() const { return m_filePath; }

    static Result<GatewayConfig> parse(const QJsonObject& root, const QProcessEnvironment& env);

    // Environment variable prefix for a provider: upper case, with
    // anything outside [A-Z0-9] replaced by '_'.
    static QString envPrefix(const QString& provider);

signals:
    void configChanged();
    void reloadRejected(const DomainFailure& failure);

private slots:
    void onFileChanged(const QString& path);

private:
    VoidResult apply(const QByteArray& json, const QString& origin);

    GatewayConfig m_config;
    QString m_filePath;
    QProcessEnvironment m_env = QProcessEnvironment::systemEnvironment();
    QFileSystemWatcher* m_watcher = nullptr;
};
