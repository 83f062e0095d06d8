#include "SessionLogger.h"

#include <QDateTime>
#include <QDebug>
#include <QDir>
#include <QtGlobal>

#include <utility>

namespace {
QString isoTimestamp() {
    return QDateTime::currentDateTime().toString(QStringLiteral("yyyy-MM-dd HH:mm:ss.zzz"));
}
}

SessionLogger& SessionLogger::instance() {
    static SessionLogger g_logger {QString()};
    return g_logger;
}

SessionLogger::SessionLogger(const QString& directory) {
    const QString dir = directory.isEmpty() ? resolveLogDirectory() : directory;
    if (!QDir().mkpath(dir)) {
        qWarning() << "SessionLogger" << "mkdir-failed" << dir;
        return;
    }

    const QString name = QStringLiteral("session-%1.log")
                             .arg(QDateTime::currentDateTime().toString(QStringLiteral("yyyyMMdd-HHmmss")));
    m_logPath = QDir(dir).filePath(name);
    m_file.setFileName(m_logPath);
    if (!m_file.open(QIODevice::WriteOnly | QIODevice::Append | QIODevice::Text)) {
        qWarning() << "SessionLogger" << "open-failed" << m_logPath << m_file.errorString();
        return;
    }

    m_stream.setDevice(&m_file);
    m_stream << "# PedalScribe session journal\n";
    m_stream << "# Started at " << isoTimestamp() << "\n";
    m_stream.flush();
    m_running = true;
    m_worker = std::thread(&SessionLogger::workerLoop, this);
    m_ready = true;
}

SessionLogger::~SessionLogger() {
    if (m_ready) {
        {
            std::lock_guard<std::mutex> guard(m_queueMutex);
            m_running = false;
        }
        m_cv.notify_all();
        if (m_worker.joinable())
            m_worker.join();
    }
    if (m_file.isOpen()) {
        m_stream << "# Session closed at " << isoTimestamp() << "\n";
        m_stream.flush();
        m_file.close();
    }
}

void SessionLogger::log(const QString& action, const QString& detail) {
    if (!m_ready)
        return;
    QString line = isoTimestamp() + QStringLiteral(" [") + action + QLatin1Char(']');
    if (!detail.isEmpty())
        line += QLatin1Char(' ') + detail;
    {
        std::lock_guard<std::mutex> guard(m_queueMutex);
        m_pending.emplace_back(std::move(line));
    }
    m_cv.notify_one();
}

void SessionLogger::flush() {
    if (!m_ready)
        return;
    std::unique_lock<std::mutex> lock(m_queueMutex);
    m_drainedCv.wait(lock, [this]() { return m_pending.empty() && !m_writing; });
}

void SessionLogger::workerLoop() {
    std::unique_lock<std::mutex> lock(m_queueMutex);
    while (m_running || !m_pending.empty()) {
        if (m_pending.empty()) {
            m_cv.wait(lock, [this]() { return !m_running || !m_pending.empty(); });
            continue;
        }
        QString line = std::move(m_pending.front());
        m_pending.pop_front();
        m_writing = true;
        lock.unlock();
        m_stream << line << '\n';
        m_stream.flush();
        lock.lock();
        m_writing = false;
        if (m_pending.empty())
            m_drainedCv.notify_all();
    }
    m_drainedCv.notify_all();
}

QString SessionLogger::resolveLogDirectory() {
    const QString env = qEnvironmentVariable("PEDALSCRIBE_LOG_DIR");
    if (!env.isEmpty())
        return env;
    const QString xdgState = qEnvironmentVariable("XDG_STATE_HOME");
    if (!xdgState.isEmpty())
        return QDir(xdgState).filePath(QStringLiteral("PedalScribe/logs"));
    return QDir::current().filePath(QStringLiteral("logs"));
}
