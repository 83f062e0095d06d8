#include "AppController.h"
#include "SessionLogger.h"
#include "TimeFormat.h"
#include "audio/AudioFileDecoder.h"
#include "audio/AudioOutput.h"
#include "pedal/InputDevice.h"

#include <QDebug>
#include <QFileInfo>
#include <QtGlobal>
#include <array>
#include <utility>

namespace {
constexpr std::array<double, 4> kSpeeds {0.75, 1.0, 1.25, 1.5};
}

AppController::AppController(AppConfig config,
                             std::unique_ptr<AudioOutput> output,
                             std::unique_ptr<InputDeviceBackend> inputBackend,
                             ArchiveService archive,
                             Transport::ClockFn clock,
                             QObject* parent)
    : QObject(parent)
    , m_config(std::move(config))
    , m_output(std::move(output))
    , m_archive(std::move(archive))
    , m_clock(clock ? std::move(clock) : Transport::ClockFn([]() { return Transport::Clock::now(); }))
    , m_transport(*m_output, m_clock)
    , m_dispatcher(m_transport, m_config.keyMap(), m_config.timing())
    , m_pedalSource(std::move(inputBackend), m_config.candidates()) {
    m_positionText = formatClock(0, 0);
    m_tickTimer.setInterval(kTickIntervalMs);
    connect(&m_tickTimer, &QTimer::timeout, this, &AppController::tick);
    connect(&m_dispatcher, &PedalDispatcher::archiveRequested, this, &AppController::requestArchive);
    connect(&m_dispatcher, &PedalDispatcher::playbackFailed, this, &AppController::reportPlaybackError);
    qInfo() << "AppController" << "ctor" << "output" << m_output->backendName()
            << "candidates" << static_cast<int>(m_config.candidates().size());
}

AppController::~AppController() {
    m_tickTimer.stop();
    m_pedalSource.stop();
    m_transport.stop();
}

void AppController::start() {
    m_pedalSource.start();
    m_tickTimer.start();
}

QString AppController::fileName() const {
    return m_filePath.isEmpty() ? QString() : QFileInfo(m_filePath).fileName();
}

QStringList AppController::speedLabels() const {
    QStringList labels;
    for (double speed : kSpeeds)
        labels << QStringLiteral("%1x").arg(speed);
    return labels;
}

QUrl AppController::openFolder() const {
    return QUrl::fromLocalFile(m_config.resolveDefaultOpenDir());
}

QStringList AppController::nameFilters() const {
    QStringList patterns;
    for (const QString& suffix : AudioFileDecoder::supportedSuffixes())
        patterns << QStringLiteral("*.%1").arg(suffix);
    return {QStringLiteral("Audio (%1)").arg(patterns.join(QLatin1Char(' '))), QStringLiteral("All files (*)")};
}

QString AppController::outputBackend() const {
    return m_output->backendName();
}

bool AppController::openFile(const QString& pathOrUrl) {
    const QUrl url(pathOrUrl);
    const QString path = url.isLocalFile() ? url.toLocalFile() : pathOrUrl;
    if (path.isEmpty())
        return false;

    QString error;
    PcmBufferPtr buffer = AudioFileDecoder::decode(path, &error);
    if (!buffer) {
        pushError(QStringLiteral("Open failed: %1").arg(error));
        return false;
    }

    m_dispatcher.reset();
    m_transport.load(std::move(buffer));
    m_transport.setSpeed(kSpeeds[static_cast<std::size_t>(m_speedIndex)]);
    m_filePath = QFileInfo(path).absoluteFilePath();
    setArchiveDialogVisible(false);
    journal(QStringLiteral("open"), m_filePath);
    emit fileChanged();
    refreshPosition();
    return true;
}

void AppController::togglePlayPause() {
    if (!m_transport.isLoaded())
        return;
    if (m_transport.isPlaying()) {
        m_transport.pause();
        journal(QStringLiteral("pause"));
    } else {
        const PlaybackError result = m_transport.resume();
        if (result != PlaybackError::None)
            reportPlaybackError(result);
        else
            journal(QStringLiteral("play"));
    }
    refreshPosition();
}

void AppController::rewind() {
    seekBy(-static_cast<double>(m_config.rewindSeconds));
}

void AppController::forward() {
    seekBy(static_cast<double>(m_config.forwardSeconds));
}

void AppController::seekBy(double seconds) {
    if (!m_transport.isLoaded())
        return;
    const PlaybackError result = m_transport.seekSeconds(seconds);
    if (result != PlaybackError::None)
        reportPlaybackError(result);
    journal(QStringLiteral("seek"), QString::number(seconds));
    refreshPosition();
}

void AppController::setSpeedIndex(int index) {
    if (index < 0 || index >= static_cast<int>(kSpeeds.size()) || index == m_speedIndex)
        return;
    m_speedIndex = index;
    const double speed = kSpeeds[static_cast<std::size_t>(index)];
    const PlaybackError result = m_transport.setSpeed(speed);
    if (result != PlaybackError::None)
        reportPlaybackError(result);
    journal(QStringLiteral("speed"), QString::number(speed));
    emit speedIndexChanged();
    refreshPosition();
}

void AppController::requestArchive() {
    m_transport.pause();
    refreshPosition();
    setArchiveDialogVisible(true);
}

bool AppController::archiveCurrent() {
    if (m_filePath.isEmpty()) {
        pushError(QStringLiteral("No file to archive"));
        return false;
    }

    QString destination;
    QString error;
    if (!m_archive.archive(m_filePath, &destination, &error)) {
        pushError(QStringLiteral("Archive failed: %1").arg(error));
        return false;
    }

    journal(QStringLiteral("archive"), m_filePath + QStringLiteral(" -> ") + destination);
    m_dispatcher.reset();
    m_transport.unload();
    m_filePath.clear();
    setArchiveDialogVisible(false);
    emit fileChanged();
    refreshPosition();
    return true;
}

void AppController::exitAfterArchive() {
    if (!m_filePath.isEmpty() && !archiveCurrent())
        return;
    journal(QStringLiteral("exit"));
    emit exitRequested();
}

void AppController::dismissArchive() {
    setArchiveDialogVisible(false);
}

void AppController::dismissError(int index) {
    if (index < 0 || index >= m_errors.size())
        return;
    m_errors.removeAt(index);
    emit errorsChanged();
}

void AppController::pushError(const QString& text) {
    qWarning() << "AppController" << "error" << text;
    journal(QStringLiteral("error"), text);
    m_errors.append(text);
    while (m_errors.size() > kMaxErrors)
        m_errors.removeFirst();
    emit errorsChanged();
}

void AppController::reportPlaybackError(PlaybackError error) {
    switch (error) {
    case PlaybackError::None:
    case PlaybackError::NotLoaded:
        return;
    case PlaybackError::SinkUnavailable:
        pushError(QStringLiteral("Audio output unavailable: %1").arg(m_transport.lastErrorText()));
        refreshPosition();
        return;
    }
}

void AppController::applyPedalStatus(const PedalStatus& status) {
    if (status == m_pedalStatus)
        return;
    m_pedalStatus = status;
    qInfo() << "AppController" << "pedal-status" << status.describe();
    emit pedalStatusChanged();

    switch (status.state) {
    case PedalStatus::State::Connected:
        m_pedalErrorShown = false;
        journal(QStringLiteral("pedal-connected"), status.describe());
        break;
    case PedalStatus::State::Error:
        if (status.disconnected) {
            // Events read before the device went away are queued ahead of
            // this status; they must not act on the paused transport.
            const std::size_t stale = m_pedalSource.drainEvents().size();
            m_transport.pause();
            m_dispatcher.reset();
            if (stale > 0)
                qInfo() << "AppController" << "discarded-pedal-events" << static_cast<qulonglong>(stale);
            journal(QStringLiteral("pedal-disconnected"), status.message);
            refreshPosition();
        }
        // Scan failures repeat every backoff; one notice per episode.
        if (m_pedalErrorShown)
            break;
        m_pedalErrorShown = true;
        pushError(status.disconnected ? QStringLiteral("Pedal disconnected")
                                      : QStringLiteral("Pedal scan failed: %1").arg(status.message));
        break;
    case PedalStatus::State::NotStarted:
    case PedalStatus::State::Scanning:
        break;
    }
}

void AppController::tick() {
    for (const PedalStatus& status : m_pedalSource.drainStatus())
        applyPedalStatus(status);
    for (const RawKeyEvent& event : m_pedalSource.drainEvents())
        m_dispatcher.handleEvent(event);
    m_dispatcher.tick(m_clock());
    if (m_transport.clampAtEnd())
        journal(QStringLiteral("end-of-media"));
    refreshPosition();
}

void AppController::refreshPosition() {
    const PositionSnapshot snapshot = m_transport.positionSnapshot();
    const int rate = m_transport.sampleRate();
    const QString text = formatClock(secondsFromFrames(snapshot.currentFrames, rate),
                                     secondsFromFrames(snapshot.totalFrames, rate));
    const qreal progress = snapshot.totalFrames > 0
        ? static_cast<qreal>(snapshot.currentFrames) / static_cast<qreal>(snapshot.totalFrames)
        : 0.0;

    if (text != m_positionText || !qFuzzyCompare(1.0 + progress, 1.0 + m_progress)) {
        m_positionText = text;
        m_progress = progress;
        emit positionChanged();
    }

    const bool isPlaying = m_transport.isPlaying();
    if (isPlaying != m_lastPlaying) {
        m_lastPlaying = isPlaying;
        emit playingChanged();
    }
}

void AppController::setArchiveDialogVisible(bool visible) {
    if (visible == m_archiveDialogVisible)
        return;
    m_archiveDialogVisible = visible;
    emit archiveDialogVisibleChanged();
}

void AppController::journal(const QString& action, const QString& detail) const {
    SessionLogger::instance().log(action, detail);
}
