#include "log_manager.h"
#include <QDateTime>
#include <QDir>
#include <QMutexLocker>
#include <QTextStream>
#include <QDebug>
#include <cstdio>

namespace {

const char* const kLevelNames[] = {"DEBUG", "INFO", "WARN", "ERROR"};

}

LogManager& LogManager::instance() {
    static LogManager s_instance;
    return s_instance;
}

LogManager::~LogManager()
{
    if (m_logFile.isOpen()) {
        m_logFile.flush();
        m_logFile.close();
    }
}

void LogManager::initialize(const QString& logDir) {
    QMutexLocker locker(&m_mutex);
    if (m_logFile.isOpen())
        m_logFile.close();
    QDir().mkpath(logDir);
    QString logPath = logDir + "/modelgate.log";
    m_logFile.setFileName(logPath);
    if (!m_logFile.open(QIODevice::WriteOnly | QIODevice::Append | QIODevice::Text)) {
        qWarning() << "LogManager: failed to open log file:" << logPath;
        m_logFile.close();
    }
}

void LogManager::setMinimumLevel(Level level) {
    QMutexLocker locker(&m_mutex);
    m_minimumLevel = level;
}

LogManager::Level LogManager::minimumLevel() const {
    QMutexLocker locker(&m_mutex);
    return m_minimumLevel;
}

void LogManager::setEchoToStderr(bool enabled) {
    QMutexLocker locker(&m_mutex);
    m_echoToStderr = enabled;
}

LogManager::Level LogManager::parseLevel(const QString& name, Level fallback) {
    const QString n = name.trimmed().toLower();
    if (n == "debug") return Debug;
    if (n == "info") return Info;
    if (n == "warn" || n == "warning") return Warning;
    if (n == "error") return Error;
    return fallback;
}

void LogManager::log(Level level, const QString& category, const QString& message) {
    if (level < Debug || level > Error) {
        level = Error;
    }

    QString timestamp = QDateTime::currentDateTime().toString("yyyy-MM-dd hh:mm:ss.zzz");
    {
        QMutexLocker locker(&m_mutex);
        if (level < m_minimumLevel)
            return;

        QString formatted = QString("[%1] [%2] [%3] %4")
            .arg(timestamp, kLevelNames[level], category, message);

        // file output
        if (m_logFile.isOpen()) {
            QTextStream stream(&m_logFile);
            stream << formatted << "\n";
            stream.flush();
        }
        if (m_echoToStderr) {
            std::fprintf(stderr, "%s\n", formatted.toLocal8Bit().constData());
        }

        // in-memory ring buffer
        QVariantMap entry;
        entry["level"] = static_cast<int>(level);
        entry["timestamp"] = timestamp;
        entry["category"] = category;
        entry["message"] = message;
        m_buffer.append(entry);
        while (m_buffer.size() > m_maxBuffer)
            m_buffer.removeFirst();
    }

    emit logEntry(static_cast<int>(level), timestamp, category, message);
}

QVariantList LogManager::recentLogs(int count) const {
    QMutexLocker locker(&m_mutex);
    QVariantList result;
    int start = qMax(0, static_cast<int>(m_buffer.size()) - count);
    for (int i = start; i < m_buffer.size(); ++i)
        result.append(m_buffer[i]);
    return result;
}

void LogManager::clearLogs() {
    QMutexLocker locker(&m_mutex);
    m_buffer.clear();
}
