#pragma once

#include "audio/AudioOutput.h"
#include "audio/PcmBuffer.h"
#include "pedal/InputDevice.h"
#include "Transport.h"

#include <QFile>
#include <QMap>
#include <QString>
#include <QStringList>

#include <algorithm>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

#include <sndfile.h>

namespace testing_support {

inline PcmBufferPtr makeBuffer(std::vector<float> samples, int sampleRate, int channels) {
    auto buffer = std::make_shared<PcmBuffer>();
    buffer->samples = std::move(samples);
    buffer->sampleRate = sampleRate;
    buffer->channels = channels;
    return buffer;
}

// Ramp 0, 1, 2 ... per frame, identical on every channel.
inline PcmBufferPtr makeRamp(std::size_t frames, int sampleRate, int channels) {
    std::vector<float> samples;
    samples.reserve(frames * static_cast<std::size_t>(channels));
    for (std::size_t f = 0; f < frames; ++f) {
        for (int c = 0; c < channels; ++c)
            samples.push_back(static_cast<float>(f));
    }
    return makeBuffer(std::move(samples), sampleRate, channels);
}

inline bool writeWav(const QString& path, int channels, int sampleRate, const std::vector<float>& samples) {
    SF_INFO info {};
    info.channels = channels;
    info.samplerate = sampleRate;
    info.format = SF_FORMAT_WAV | SF_FORMAT_FLOAT;
    const QByteArray encoded = QFile::encodeName(path);
    SNDFILE* handle = sf_open(encoded.constData(), SFM_WRITE, &info);
    if (!handle)
        return false;
    const sf_count_t frames = static_cast<sf_count_t>(samples.size()) / channels;
    const sf_count_t written = sf_writef_float(handle, samples.data(), frames);
    sf_close(handle);
    return written == frames;
}

struct ManualClock {
    Transport::Clock::time_point now {Transport::Clock::time_point{} + std::chrono::hours(1)};

    Transport::ClockFn fn() {
        return [this]() { return now; };
    }

    void advance(std::chrono::milliseconds ms) { now += ms; }
};

class FakeAudioOutput;

class FakeSink : public PlaybackSink {
public:
    FakeSink(FakeAudioOutput& owner, int channels, int rate);
    ~FakeSink() override;

    void append(std::unique_ptr<SampleSource> source) override { m_source = std::move(source); }
    void play() override { m_playing = true; }
    void pause() override { m_playing = false; }
    void stop() override { m_playing = false; }
    bool isPlaying() const override { return m_playing; }
    int outputSampleRate() const override { return m_rate; }

    SampleSource* source() const { return m_source.get(); }
    int channels() const { return m_channels; }

private:
    FakeAudioOutput& m_owner;
    std::unique_ptr<SampleSource> m_source;
    int m_channels {0};
    int m_rate {0};
    bool m_playing {false};
};

// Records binds and can refuse to hand out sinks.
class FakeAudioOutput : public AudioOutput {
public:
    std::unique_ptr<PlaybackSink> createSink(int channels, int sampleRate, QString* error) override {
        ++createCalls;
        if (failAll || failuresRemaining > 0) {
            if (failuresRemaining > 0)
                --failuresRemaining;
            if (error)
                *error = QStringLiteral("device busy");
            return nullptr;
        }
        if (liveSinks > 0)
            ++overlappingBinds;
        ++sinksCreated;
        lastRequestedRate = sampleRate;
        return std::make_unique<FakeSink>(*this, channels, outputRate > 0 ? outputRate : sampleRate);
    }

    QString backendName() const override { return QStringLiteral("fake"); }

    int outputRate {0};
    bool failAll {false};
    int failuresRemaining {0};

    int createCalls {0};
    int sinksCreated {0};
    int liveSinks {0};
    int overlappingBinds {0};
    int lastRequestedRate {0};
    FakeSink* current {nullptr};
};

inline FakeSink::FakeSink(FakeAudioOutput& owner, int channels, int rate)
    : m_owner(owner)
    , m_channels(channels)
    , m_rate(rate) {
    ++m_owner.liveSinks;
    m_owner.current = this;
}

inline FakeSink::~FakeSink() {
    --m_owner.liveSinks;
    if (m_owner.current == this)
        m_owner.current = nullptr;
}

// Shared script for one opened device: batches are delivered in order; once
// drained, reads time out, or fail when failWhenEmpty is set.
struct DeviceScript {
    std::mutex mutex;
    std::deque<std::vector<RawKeyEvent>> batches;
    bool failWhenEmpty {false};
    QString failReason {QStringLiteral("No such device")};
};

class FakeInputDevice : public InputDevice {
public:
    FakeInputDevice(InputDeviceInfo info, std::shared_ptr<DeviceScript> script)
        : m_info(std::move(info))
        , m_script(std::move(script)) {}

    QString name() const override { return m_info.name; }
    QString path() const override { return m_info.path; }
    quint16 vendorId() const override { return m_info.vendorId; }
    quint16 productId() const override { return m_info.productId; }

    ReadResult waitForKeyEvents(std::vector<RawKeyEvent>& out, int timeoutMs, QString* error) override {
        {
            std::lock_guard<std::mutex> guard(m_script->mutex);
            if (!m_script->batches.empty()) {
                const std::vector<RawKeyEvent> batch = std::move(m_script->batches.front());
                m_script->batches.pop_front();
                out.insert(out.end(), batch.begin(), batch.end());
                return ReadResult::Events;
            }
            if (m_script->failWhenEmpty) {
                if (error)
                    *error = m_script->failReason;
                return ReadResult::Error;
            }
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(std::min(timeoutMs, 2)));
        return ReadResult::Timeout;
    }

private:
    InputDeviceInfo m_info;
    std::shared_ptr<DeviceScript> m_script;
};

// Thread-safe: the pedal worker thread calls into it.
class FakeInputBackend : public InputDeviceBackend {
public:
    struct Shared {
        std::mutex mutex;
        std::vector<InputDeviceInfo> devices;
        bool enumerateFails {false};
        QMap<QString, bool> explicitPaths;
        // Scripts handed out per open() of a path, oldest first.
        QMap<QString, std::deque<std::shared_ptr<DeviceScript>>> scripts;
        QStringList openedPaths;
        int enumerateCalls {0};
    };

    explicit FakeInputBackend(std::shared_ptr<Shared> shared)
        : m_shared(std::move(shared)) {}

    bool enumerate(std::vector<InputDeviceInfo>& out, QString* error) override {
        std::lock_guard<std::mutex> guard(m_shared->mutex);
        ++m_shared->enumerateCalls;
        if (m_shared->enumerateFails) {
            if (error)
                *error = QStringLiteral("Permission denied");
            return false;
        }
        out = m_shared->devices;
        return true;
    }

    std::unique_ptr<InputDevice> open(const QString& path, QString* error) override {
        std::lock_guard<std::mutex> guard(m_shared->mutex);
        auto it = m_shared->scripts.find(path);
        if (it == m_shared->scripts.end() || it->empty()) {
            if (error)
                *error = QStringLiteral("cannot open %1").arg(path);
            return nullptr;
        }
        std::shared_ptr<DeviceScript> script = it->front();
        if (it->size() > 1)
            it->pop_front();
        m_shared->openedPaths << path;

        InputDeviceInfo info;
        info.path = path;
        info.name = QStringLiteral("Fake pedal");
        for (const InputDeviceInfo& device : m_shared->devices) {
            if (device.path == path)
                info = device;
        }
        return std::make_unique<FakeInputDevice>(info, std::move(script));
    }

    bool pathExists(const QString& path) const override {
        std::lock_guard<std::mutex> guard(m_shared->mutex);
        return m_shared->explicitPaths.value(path, false);
    }

private:
    std::shared_ptr<Shared> m_shared;
};

inline bool waitUntil(const std::function<bool()>& predicate,
                      std::chrono::milliseconds timeout = std::chrono::milliseconds(3000)) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (predicate())
            return true;
        std::this_thread::sleep_for(std::chrono::milliseconds(2));
    }
    return predicate();
}

}
