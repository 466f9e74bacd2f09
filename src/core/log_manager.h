#pragma once
#include <QObject>
#include <QFile>
#include <QMutex>
#include <QVariantMap>
#include <QList>

class LogManager : public QObject {
    Q_OBJECT

public:
    static LogManager& instance();

    enum Level { Debug, Info, Warning, Error };
    Q_ENUM(Level)

    void initialize(const QString& logDir);
    void setMinimumLevel(Level level);
    Level minimumLevel() const;
    void setEchoToStderr(bool enabled);

    static Level parseLevel(const QString& name, Level fallback = Info);

    void log(Level level, const QString& category, const QString& message);
    void debug(const QString& msg)   { log(Debug, "app", msg); }
    void info(const QString& msg)    { log(Info, "app", msg); }
    void warning(const QString& msg) { log(Warning, "app", msg); }
    void error(const QString& msg)   { log(Error, "app", msg); }

    QVariantList recentLogs(int count = 200) const;
    void clearLogs();


signals:
    void logEntry(int level, const QString& timestamp,
                  const QString& category, const QString& message);

private:
    ~LogManager() override;
    LogManager() = default;

    mutable QMutex m_mutex;
    QFile m_logFile;
    QList<QVariantMap> m_buffer;
    int m_maxBuffer = 2000;
    Level m_minimumLevel = Debug;
    bool m_echoToStderr = false;
};

#define LOG_DEBUG(msg) LogManager::instance().debug(msg)
#define LOG_INFO(msg) LogManager::instance().info(msg)
#define LOG_WARNING(msg) LogManager::instance().warning(msg)
#define LOG_ERROR(msg) LogManager::instance().error(msg)

#define LOG_CAT_DEBUG(cat, msg) LogManager::instance().log(LogManager::Debug, cat, msg)
#define LOG_CAT_INFO(cat, msg) LogManager::instance().log(LogManager::Info, cat, msg)
#define LOG_CAT_WARNING(cat, msg) LogManager::instance().log(LogManager::Warning, cat, msg)
#define LOG_CAT_ERROR(cat, msg) LogManager::instance().log(LogManager::Error, cat, msg)
