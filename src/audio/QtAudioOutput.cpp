#include "QtAudioOutput.h"

#include <QAudioFormat>
#include <QAudioSink>
#include <QDebug>
#include <QIODevice>
#include <QMediaDevices>
#include <QMutex>
#include <QMutexLocker>
#include <QtGlobal>

#include <algorithm>
#include <cmath>
#include <cstring>
#include <utility>
#include <vector>

// Adapts a SampleSource to the pull-mode QIODevice QAudioSink reads from.
class QtAudioOutput::SourceDevice : public QIODevice {
public:
    explicit SourceDevice(QAudioFormat format)
        : m_format(std::move(format)) {
        open(QIODevice::ReadOnly);
    }

    void setSource(std::unique_ptr<SampleSource> source) {
        QMutexLocker locker(&m_mutex);
        m_source = std::move(source);
    }

    bool drained() const {
        QMutexLocker locker(&m_mutex);
        return !m_source || m_source->exhausted();
    }

    bool isSequential() const override { return true; }

    qint64 readData(char* data, qint64 maxlen) override {
        if (!data || maxlen <= 0)
            return 0;

        QMutexLocker locker(&m_mutex);
        if (!m_source)
            return 0;

        const int channels = m_format.channelCount();
        const int bytesPerFrame = m_format.bytesPerFrame();
        if (channels <= 0 || bytesPerFrame <= 0)
            return 0;

        const int frames = static_cast<int>(maxlen / bytesPerFrame);
        if (frames <= 0)
            return 0;

        m_mix.resize(static_cast<std::size_t>(frames) * static_cast<std::size_t>(channels));
        const int produced = m_source->read(m_mix.data(), frames, channels);
        const int samples = produced * channels;

        if (m_format.sampleFormat() == QAudioFormat::Float) {
            std::memcpy(data, m_mix.data(), static_cast<std::size_t>(samples) * sizeof(float));
        } else {
            auto* dst = reinterpret_cast<qint16*>(data);
            for (int i = 0; i < samples; ++i) {
                const float clamped = std::clamp(m_mix[static_cast<std::size_t>(i)], -1.f, 1.f);
                dst[i] = static_cast<qint16>(std::lrint(clamped * 32767.f));
            }
        }
        return static_cast<qint64>(produced) * bytesPerFrame;
    }

    qint64 writeData(const char*, qint64) override { return 0; }

private:
    QAudioFormat m_format;
    std::unique_ptr<SampleSource> m_source;
    std::vector<float> m_mix;
    mutable QMutex m_mutex;
};

class QtAudioOutput::Sink : public PlaybackSink {
public:
    Sink(const QAudioDevice& device, const QAudioFormat& format)
        : m_device(std::make_unique<SourceDevice>(format))
        , m_audio(std::make_unique<QAudioSink>(device, format))
        , m_sampleRate(format.sampleRate()) {}

    ~Sink() override { stop(); }

    void append(std::unique_ptr<SampleSource> source) override {
        m_device->setSource(std::move(source));
    }

    void play() override {
        if (m_stopped)
            return;
        if (!m_started) {
            m_audio->start(m_device.get());
            m_started = true;
            if (m_audio->error() != QAudio::NoError)
                qWarning() << "AudioOut" << "qt-sink-start-error" << static_cast<int>(m_audio->error());
            return;
        }
        m_audio->resume();
    }

    void pause() override {
        if (m_started && !m_stopped)
            m_audio->suspend();
    }

    void stop() override {
        if (m_stopped)
            return;
        m_stopped = true;
        m_audio->stop();
    }

    bool isPlaying() const override {
        return m_started && !m_stopped
            && m_audio->state() == QAudio::ActiveState
            && !m_device->drained();
    }

    int outputSampleRate() const override { return m_sampleRate; }

private:
    std::unique_ptr<SourceDevice> m_device;
    std::unique_ptr<QAudioSink> m_audio;
    int m_sampleRate {0};
    bool m_started {false};
    bool m_stopped {false};
};

QtAudioOutput::QtAudioOutput() = default;

QAudioDevice QtAudioOutput::selectOutputDevice() const {
    const QList<QAudioDevice> outputs = QMediaDevices::audioOutputs();
    if (outputs.isEmpty())
        return QAudioDevice{};

    const QByteArray filterRaw = qgetenv("PEDALSCRIBE_OUTPUT_DEVICE");
    if (!filterRaw.isEmpty()) {
        const QString filter = QString::fromUtf8(filterRaw).trimmed();
        for (const QAudioDevice& dev : outputs) {
            if (dev.description().contains(filter, Qt::CaseInsensitive) ||
                QString::fromUtf8(dev.id()).contains(filter, Qt::CaseInsensitive)) {
                return dev;
            }
        }
        qWarning() << "AudioOut" << "device-filter-not-found" << filter;
    }

    const QAudioDevice defaultDevice = QMediaDevices::defaultAudioOutput();
    if (!defaultDevice.isNull())
        return defaultDevice;
    return outputs.first();
}

std::unique_ptr<PlaybackSink> QtAudioOutput::createSink(int channels, int sampleRate, QString* error) {
    const QAudioDevice outputDevice = selectOutputDevice();
    if (outputDevice.isNull()) {
        if (error)
            *error = QStringLiteral("No audio output device available");
        qWarning() << "AudioOut" << "no-output-device";
        return nullptr;
    }

    const QList<QAudioFormat::SampleFormat> preferredFormats {
        QAudioFormat::Float,
        QAudioFormat::Int16
    };

    // The source resamples, so the device's own rate is an acceptable fallback.
    QList<int> rates {sampleRate};
    const int preferredRate = outputDevice.preferredFormat().sampleRate();
    if (preferredRate > 0 && preferredRate != sampleRate)
        rates << preferredRate;

    for (int rate : rates) {
        for (QAudioFormat::SampleFormat fmt : preferredFormats) {
            QAudioFormat candidate;
            candidate.setSampleRate(rate);
            candidate.setChannelCount(channels);
            candidate.setSampleFormat(fmt);
            if (!outputDevice.isFormatSupported(candidate))
                continue;

            qInfo() << "AudioOut" << "qt-sink" << outputDevice.description()
                    << "format" << rate << "Hz" << channels << "ch"
                    << (fmt == QAudioFormat::Float ? "float32" : "int16");
            return std::make_unique<Sink>(outputDevice, candidate);
        }
    }

    if (error)
        *error = QStringLiteral("Output device '%1' does not support %2 Hz / %3 channel(s)")
                     .arg(outputDevice.description())
                     .arg(sampleRate)
                     .arg(channels);
    qWarning() << "AudioOut" << "unsupported-format" << sampleRate << channels;
    return nullptr;
}
