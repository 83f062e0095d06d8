#pragma once

#include <QFile>
#include <QString>
#include <QTextStream>

#include <condition_variable>
#include <deque>
#include <mutex>
#include <thread>

// Operator journal: one timestamped line per user-visible action, written
// by a background thread so the UI tick never blocks on disk.
class SessionLogger {
public:
    static SessionLogger& instance();

    // Journal in |directory|; empty resolves PEDALSCRIBE_LOG_DIR,
    // XDG_STATE_HOME/PedalScribe/logs, then ./logs.
    explicit SessionLogger(const QString& directory);
    ~SessionLogger();

    SessionLogger(const SessionLogger&) = delete;
    SessionLogger& operator=(const SessionLogger&) = delete;

    void log(const QString& action, const QString& detail = {});

    // Blocks until every queued line is on disk.
    void flush();

    [[nodiscard]] bool enabled() const { return m_ready; }
    [[nodiscard]] const QString& logFilePath() const { return m_logPath; }

    static QString resolveLogDirectory();

private:
    void workerLoop();

    QString m_logPath;
    bool m_ready {false};
    QFile m_file;
    QTextStream m_stream;
    std::mutex m_queueMutex;
    std::condition_variable m_cv;
    std::condition_variable m_drainedCv;
    std::deque<QString> m_pending;
    bool m_writing {false};
    bool m_running {false};
    std::thread m_worker;
};
