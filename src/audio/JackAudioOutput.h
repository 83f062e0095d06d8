#pragma once

#include "AudioOutput.h"
#include "DeferredRelease.h"

#include <QString>
#include <QtGlobal>
#include <jack/types.h>
#include <atomic>
#include <memory>
#include <mutex>
#include <vector>

struct _jack_client;
struct _jack_port;

// Single JACK client shared by every sink of the process. Only one sink is
// rendered at a time: creating a sink replaces whatever was active.
class JackAudioOutput : public AudioOutput {
public:
    explicit JackAudioOutput(QString logTag = QStringLiteral("AudioOut"));
    ~JackAudioOutput() override;

    bool start();
    void stop();
    bool isActive() const noexcept { return m_client != nullptr && !m_serverGone.load(std::memory_order_acquire); }
    int sampleRate() const noexcept { return m_sampleRate; }

    std::unique_ptr<PlaybackSink> createSink(int channels, int sampleRate, QString* error) override;
    QString backendName() const override { return QStringLiteral("jack"); }

private:
    class Sink;

    struct Stream {
        std::mutex sourceMutex;
        std::unique_ptr<SampleSource> source;
        std::vector<float> scratch;
        std::atomic<bool> playing {false};
        std::atomic<bool> finished {false};
    };

    static int processCallback(jack_nframes_t nframes, void* arg);
    static void shutdownCallback(void* arg);
    int process(jack_nframes_t nframes);
    void renderActive(float* left, float* right, jack_nframes_t nframes);
    void release(const std::shared_ptr<Stream>& stream);
    void retire(std::shared_ptr<Stream> stream);
    void collectRetired();
    void connectPlaybackPorts();
    void logJackStatus(jack_status_t status) const;

    QString m_logTag;
    _jack_client* m_client {nullptr};
    _jack_port* m_outputs[2] {nullptr, nullptr};
    int m_sampleRate {0};
    std::atomic<bool> m_serverGone {false};
    std::atomic<std::shared_ptr<Stream>> m_active;
    std::atomic<quint64> m_completedCycles {0};
    DeferredRelease<Stream> m_retired;
};
