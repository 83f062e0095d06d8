#include <QByteArray>
#include <QCommandLineParser>
#include <QDir>
#include <QGuiApplication>
#include <QQmlApplicationEngine>
#include <QQmlContext>
#include <QQmlEngine>
#include <QQmlError>
#include <QDebug>
#include <QStandardPaths>
#include <QStringList>
#include <atomic>
#include <chrono>
#include <csignal>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>
#include <string>

#include "AppConfig.h"
#include "AppController.h"
#include "SessionLogger.h"
#include "audio/AudioOutput.h"
#include "pedal/EvdevInputBackend.h"

using namespace Qt::StringLiterals;

namespace {

std::string formatTimestamp() {
    using clock = std::chrono::system_clock;
    const auto now = clock::now();
    const std::time_t nowTime = clock::to_time_t(now);
    std::tm tm {};
    localtime_r(&nowTime, &tm);
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%d %H:%M:%S");
    return oss.str();
}

struct LogFileState {
    std::mutex mutex;
    std::ofstream stream;
};

LogFileState& logFileState() {
    static LogFileState state;
    return state;
}

class ScopedSigintHandler {
public:
    explicit ScopedSigintHandler(QGuiApplication& app) {
        if (g_handlerInstalled.exchange(true))
            return;
        s_app = &app;
        s_previous = std::signal(SIGINT, &ScopedSigintHandler::handleSignal);
    }

    ~ScopedSigintHandler() {
        s_app = nullptr;
        if (g_handlerInstalled.exchange(false))
            std::signal(SIGINT, s_previous);
    }

private:
    static void handleSignal(int sig) {
        if (sig != SIGINT)
            return;
        if (s_app)
            QMetaObject::invokeMethod(s_app, &QCoreApplication::quit, Qt::QueuedConnection);
    }

    static inline std::atomic<bool> g_handlerInstalled {false};
    static inline QGuiApplication* s_app {nullptr};
    static inline __sighandler_t s_previous {SIG_DFL};
};

void appendLogEntry(const char* level,
                    const QMessageLogContext& ctx,
                    const QByteArray& message) {
    LogFileState& state = logFileState();
    std::lock_guard<std::mutex> lock(state.mutex);
    if (!state.stream.is_open())
        return;
    state.stream << formatTimestamp() << " [" << level << "] "
                 << '(' << (ctx.file ? ctx.file : "?")
                 << ':' << ctx.line << ','
                 << (ctx.function ? ctx.function : "?")
                 << ") " << message.constData() << '\n';
    state.stream.flush();
}

std::filesystem::path resolveLogFilePath() {
    const QString env = qEnvironmentVariable("PEDALSCRIBE_LOG_FILE");
    if (!env.isEmpty())
        return std::filesystem::path(env.toStdString());
    const QString dataDir = QStandardPaths::writableLocation(QStandardPaths::AppDataLocation);
    if (dataDir.isEmpty())
        return {};
    return std::filesystem::path(QDir(dataDir).filePath(u"pedalscribe.log"_s).toStdString());
}

void ensureDefaultMediaBackend() {
    constexpr const char* kBackendEnv = "QT_MEDIA_BACKEND";
    if (qEnvironmentVariableIsSet(kBackendEnv)) {
        qInfo() << "startup" << "qt-media-backend" << qgetenv(kBackendEnv);
        return;
    }
    const QByteArray backend("ffmpeg");
    qputenv(kBackendEnv, backend);
    qInfo() << "startup" << "qt-media-backend" << backend << "(forced default)";
}

void installMessageHandler(const std::filesystem::path& logFile) {
    if (!logFile.empty()) {
        auto& state = logFileState();
        std::error_code ec;
        const auto parent = logFile.parent_path();
        if (!parent.empty())
            std::filesystem::create_directories(parent, ec);
        state.stream.open(logFile, std::ios::out | std::ios::app);
        if (!state.stream)
            std::cerr << "Failed to open log file '" << logFile.string() << "' for writing.\n";
    }

    static const auto handler = [](QtMsgType type, const QMessageLogContext& ctx, const QString& msg) {
        QByteArray localMsg = msg.toLocal8Bit();
        const char* level = "info";
        switch (type) {
        case QtDebugMsg: level = "debug"; break;
        case QtInfoMsg: level = "info"; break;
        case QtWarningMsg: level = "warning"; break;
        case QtCriticalMsg: level = "critical"; break;
        case QtFatalMsg: level = "fatal"; break;
        }
        fprintf(stderr, "qtmsg [%s] (%s:%u,%s): %s\n",
                level,
                ctx.file ? ctx.file : "?",
                ctx.line,
                ctx.function ? ctx.function : "?",
                localMsg.constData());
        appendLogEntry(level, ctx, localMsg);
        if (type == QtFatalMsg)
            abort();
    };
    qInstallMessageHandler(handler);
}

AppConfig loadConfig() {
    const ConfigStore store;
    const ConfigLoadResult loaded = store.loadOrDefault();
    if (loaded.missing) {
        QString error;
        if (!store.save(loaded.config, &error))
            qWarning() << "startup" << "config-write-failed" << loaded.path << error;
    }
    return loaded.config;
}

}

int main(int argc, char *argv[]) {
    QCoreApplication::setOrganizationName(u"PedalScribe"_s);
    QCoreApplication::setApplicationName(u"PedalScribe"_s);
    installMessageHandler(resolveLogFilePath());
    ensureDefaultMediaBackend();

    qInfo() << "startup" << "creating-qguiapplication";
    QGuiApplication app(argc, argv);
    qInfo() << "startup" << "qguiapplication-ready";

    QCommandLineParser parser;
    parser.setApplicationDescription(u"Foot-pedal controlled dictation playback"_s);
    parser.addHelpOption();
    parser.addPositionalArgument(u"file"_s, u"Recording to open at startup."_s, u"[file]"_s);
    parser.process(app);

    SessionLogger::instance().log(u"startup"_s, SessionLogger::instance().logFilePath());

    AppController controller(loadConfig(), createAudioOutput(), std::make_unique<EvdevInputBackend>());
    QObject::connect(&controller, &AppController::exitRequested, &app, &QCoreApplication::quit,
                     Qt::QueuedConnection);
    qInfo() << "startup" << "appcontroller-ready";

    ScopedSigintHandler sigintGuard(app);

    QQmlApplicationEngine engine;
    QObject::connect(&engine, &QQmlEngine::warnings, &engine, [](const QList<QQmlError>& warnings) {
        for (const QQmlError& warning : warnings)
            qWarning().noquote() << "qml-warning" << warning.toString();
    });
    engine.rootContext()->setContextProperty("AppController", &controller);
    const QUrl url(u"qrc:/qt/qml/PedalScribe/qml/Main.qml"_s);
    QObject::connect(&engine, &QQmlApplicationEngine::objectCreated, &app,
                     [url](QObject *obj, const QUrl &objUrl) {
                         if (!obj && url == objUrl) {
                             qCritical() << "startup" << "qml-object-create-failed" << objUrl;
                             QCoreApplication::exit(-1);
                             return;
                         }
                         qInfo() << "startup" << "qml-root-object-created" << objUrl;
                     }, Qt::QueuedConnection);
    qInfo() << "startup" << "qml-engine-load" << url;
    engine.load(url);

    const QStringList positional = parser.positionalArguments();
    if (!positional.isEmpty() && !controller.openFile(positional.constFirst()))
        qWarning() << "startup" << "initial-open-failed" << positional.constFirst();

    controller.start();
    return app.exec();
}
