#pragma once
#include <QObject>
#include <QString>
#include <QStringList>
#include <QTimer>
#include <QUrl>
#include <memory>

#include "AppConfig.h"
#include "ArchiveService.h"
#include "PedalDispatcher.h"
#include "Transport.h"
#include "pedal/PedalEventSource.h"

class AudioOutput;
class InputDeviceBackend;

class AppController : public QObject {
    Q_OBJECT
    Q_PROPERTY(QString fileName READ fileName NOTIFY fileChanged)
    Q_PROPERTY(bool fileLoaded READ fileLoaded NOTIFY fileChanged)
    Q_PROPERTY(bool playing READ playing NOTIFY playingChanged)
    Q_PROPERTY(QString positionText READ positionText NOTIFY positionChanged)
    Q_PROPERTY(qreal progress READ progress NOTIFY positionChanged)
    Q_PROPERTY(int speedIndex READ speedIndex WRITE setSpeedIndex NOTIFY speedIndexChanged)
    Q_PROPERTY(QStringList speedLabels READ speedLabels CONSTANT)
    Q_PROPERTY(QString pedalStatusText READ pedalStatusText NOTIFY pedalStatusChanged)
    Q_PROPERTY(QStringList errors READ errors NOTIFY errorsChanged)
    Q_PROPERTY(bool archiveDialogVisible READ archiveDialogVisible NOTIFY archiveDialogVisibleChanged)
    Q_PROPERTY(QUrl openFolder READ openFolder CONSTANT)
    Q_PROPERTY(QStringList nameFilters READ nameFilters CONSTANT)
    Q_PROPERTY(QString outputBackend READ outputBackend CONSTANT)
public:
    static constexpr int kMaxErrors = 3;
    static constexpr int kTickIntervalMs = 16;

    AppController(AppConfig config,
                  std::unique_ptr<AudioOutput> output,
                  std::unique_ptr<InputDeviceBackend> inputBackend,
                  ArchiveService archive = ArchiveService{},
                  Transport::ClockFn clock = {},
                  QObject* parent = nullptr);
    ~AppController() override;

    // Starts the pedal thread and the UI tick.
    void start();

    QString fileName() const;
    const QString& filePath() const { return m_filePath; }
    bool fileLoaded() const { return m_transport.isLoaded(); }
    bool playing() const { return m_transport.isPlaying(); }
    QString positionText() const { return m_positionText; }
    qreal progress() const { return m_progress; }
    int speedIndex() const { return m_speedIndex; }
    QStringList speedLabels() const;
    QString pedalStatusText() const { return m_pedalStatus.describe(); }
    QStringList errors() const { return m_errors; }
    bool archiveDialogVisible() const { return m_archiveDialogVisible; }
    QUrl openFolder() const;
    QStringList nameFilters() const;
    QString outputBackend() const;

    Transport& transport() { return m_transport; }
    PedalDispatcher& dispatcher() { return m_dispatcher; }
    const AppConfig& config() const { return m_config; }

    Q_INVOKABLE bool openFile(const QString& pathOrUrl);
    Q_INVOKABLE void togglePlayPause();
    Q_INVOKABLE void rewind();
    Q_INVOKABLE void forward();
    Q_INVOKABLE void setSpeedIndex(int index);
    Q_INVOKABLE void requestArchive();
    Q_INVOKABLE bool archiveCurrent();
    Q_INVOKABLE void exitAfterArchive();
    Q_INVOKABLE void dismissArchive();
    Q_INVOKABLE void dismissError(int index);

    // One cooperative step: pedal status, pedal events, hold repeat,
    // end-of-media clamp, position refresh.
    void tick();
    void applyPedalStatus(const PedalStatus& status);
    void pushError(const QString& text);

signals:
    void fileChanged();
    void playingChanged();
    void positionChanged();
    void speedIndexChanged();
    void pedalStatusChanged();
    void errorsChanged();
    void archiveDialogVisibleChanged();
    void exitRequested();

private:
    void seekBy(double seconds);
    void reportPlaybackError(PlaybackError error);
    void refreshPosition();
    void setArchiveDialogVisible(bool visible);
    void journal(const QString& action, const QString& detail = {}) const;

    AppConfig m_config;
    std::unique_ptr<AudioOutput> m_output;
    ArchiveService m_archive;
    Transport::ClockFn m_clock;
    Transport m_transport;
    PedalDispatcher m_dispatcher;
    PedalEventSource m_pedalSource;
    QTimer m_tickTimer;

    QString m_filePath;
    QString m_positionText;
    qreal m_progress {0.0};
    int m_speedIndex {1};
    PedalStatus m_pedalStatus;
    QStringList m_errors;
    bool m_archiveDialogVisible {false};
    bool m_lastPlaying {false};
    bool m_pedalErrorShown {false};
};
