#include "SessionLogger.h"

#include <gtest/gtest.h>

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QTemporaryDir>
#include <QtGlobal>

TEST(SessionLoggerTest, JournalLinesReachTheFile) {
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());

    QString path;
    {
        SessionLogger logger(dir.path());
        ASSERT_TRUE(logger.enabled());
        path = logger.logFilePath();
        EXPECT_EQ(QFileInfo(path).absolutePath(), QFileInfo(dir.path()).absoluteFilePath());
        EXPECT_TRUE(QFileInfo(path).fileName().startsWith(QStringLiteral("session-")));

        logger.log(QStringLiteral("open"), QStringLiteral("/recordings/letter.wav"));
        logger.log(QStringLiteral("pause"));
        logger.flush();

        QFile file(path);
        ASSERT_TRUE(file.open(QIODevice::ReadOnly | QIODevice::Text));
        const QString text = QString::fromUtf8(file.readAll());
        EXPECT_TRUE(text.contains(QStringLiteral("# PedalScribe session journal")));
        EXPECT_TRUE(text.contains(QStringLiteral("[open] /recordings/letter.wav")));
        EXPECT_TRUE(text.contains(QStringLiteral("[pause]\n")));
    }

    QFile file(path);
    ASSERT_TRUE(file.open(QIODevice::ReadOnly | QIODevice::Text));
    EXPECT_TRUE(QString::fromUtf8(file.readAll()).contains(QStringLiteral("# Session closed at")));
}

TEST(SessionLoggerTest, LogDirectoryHonoursEnvironment) {
    const QByteArray previous = qgetenv("PEDALSCRIBE_LOG_DIR");
    qputenv("PEDALSCRIBE_LOG_DIR", "/var/tmp/pedalscribe-logs");
    EXPECT_EQ(SessionLogger::resolveLogDirectory(), QStringLiteral("/var/tmp/pedalscribe-logs"));

    qunsetenv("PEDALSCRIBE_LOG_DIR");
    const QByteArray previousState = qgetenv("XDG_STATE_HOME");
    qputenv("XDG_STATE_HOME", "/home/op/.local/state");
    EXPECT_EQ(SessionLogger::resolveLogDirectory(), QStringLiteral("/home/op/.local/state/PedalScribe/logs"));

    if (previousState.isEmpty())
        qunsetenv("XDG_STATE_HOME");
    else
        qputenv("XDG_STATE_HOME", previousState);
    if (!previous.isEmpty())
        qputenv("PEDALSCRIBE_LOG_DIR", previous);
}

TEST(SessionLoggerTest, UnwritableDirectoryDisablesJournal) {
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());
    const QString blocker = QDir(dir.path()).filePath(QStringLiteral("file"));
    {
        QFile file(blocker);
        ASSERT_TRUE(file.open(QIODevice::WriteOnly));
    }

    SessionLogger logger(QDir(blocker).filePath(QStringLiteral("logs")));
    EXPECT_FALSE(logger.enabled());
    logger.log(QStringLiteral("ignored"));
    logger.flush();
}
