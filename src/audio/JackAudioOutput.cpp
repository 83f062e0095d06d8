#include "JackAudioOutput.h"

#include <QDebug>
#include <algorithm>
#include <cerrno>
#include <string>
#include <utility>

#include <jack/jack.h>

namespace {
constexpr const char* kClientName = "pedalscribe";
constexpr int kOutputChannels = 2;
// Upper bound on a JACK period; scratch is never resized on the process thread.
constexpr jack_nframes_t kMaxCycleFrames = 8192;
}

class JackAudioOutput::Sink : public PlaybackSink {
public:
    Sink(JackAudioOutput* owner, std::shared_ptr<Stream> stream, int sampleRate)
        : m_owner(owner)
        , m_stream(std::move(stream))
        , m_sampleRate(sampleRate) {}

    ~Sink() override { stop(); }

    void append(std::unique_ptr<SampleSource> source) override {
        std::lock_guard<std::mutex> guard(m_stream->sourceMutex);
        m_stream->source = std::move(source);
        m_stream->finished.store(false, std::memory_order_release);
    }

    void play() override {
        if (!m_stopped)
            m_stream->playing.store(true, std::memory_order_release);
    }

    void pause() override {
        m_stream->playing.store(false, std::memory_order_release);
    }

    void stop() override {
        if (m_stopped)
            return;
        m_stopped = true;
        m_stream->playing.store(false, std::memory_order_release);
        m_owner->release(m_stream);
    }

    bool isPlaying() const override {
        return m_stream->playing.load(std::memory_order_acquire)
            && !m_stream->finished.load(std::memory_order_acquire);
    }

    int outputSampleRate() const override { return m_sampleRate; }

private:
    JackAudioOutput* m_owner;
    std::shared_ptr<Stream> m_stream;
    int m_sampleRate;
    bool m_stopped {false};
};

JackAudioOutput::JackAudioOutput(QString logTag)
    : m_logTag(std::move(logTag)) {}

JackAudioOutput::~JackAudioOutput() {
    stop();
}

bool JackAudioOutput::start() {
    if (m_client)
        return true;

    jack_status_t status = static_cast<jack_status_t>(0);
    m_client = jack_client_open(kClientName, JackNoStartServer, &status);
    if (!m_client) {
        logJackStatus(status);
        qWarning() << m_logTag << "jack-open-failed" << static_cast<int>(status);
        return false;
    }

    jack_set_process_callback(m_client, &JackAudioOutput::processCallback, this);
    jack_on_shutdown(m_client, &JackAudioOutput::shutdownCallback, this);

    for (int i = 0; i < kOutputChannels; ++i) {
        const std::string portName = (i == 0) ? "out_L" : "out_R";
        m_outputs[i] = jack_port_register(m_client,
                                          portName.c_str(),
                                          JACK_DEFAULT_AUDIO_TYPE,
                                          JackPortIsOutput,
                                          0);
        if (!m_outputs[i]) {
            qWarning() << m_logTag << "jack-port-failed" << QString::fromStdString(portName);
            stop();
            return false;
        }
    }

    m_sampleRate = static_cast<int>(jack_get_sample_rate(m_client));
    m_serverGone.store(false, std::memory_order_release);

    if (jack_activate(m_client) != 0) {
        qWarning() << m_logTag << "jack-activate-failed";
        stop();
        return false;
    }

    connectPlaybackPorts();
    qInfo() << m_logTag << "jack" << "active"
            << "sr" << m_sampleRate << "buffer" << jack_get_buffer_size(m_client);
    return true;
}

void JackAudioOutput::stop() {
    if (m_client) {
        jack_client_t* client = m_client;
        m_client = nullptr;
        jack_deactivate(client);
        jack_client_close(client);
    }

    m_active.store(nullptr, std::memory_order_release);
    // The process thread is gone, nothing can still hold a retired stream.
    m_retired.clear();
    m_outputs[0] = nullptr;
    m_outputs[1] = nullptr;
    m_sampleRate = 0;
}

std::unique_ptr<PlaybackSink> JackAudioOutput::createSink(int channels, int sampleRate, QString* error) {
    if (!isActive()) {
        if (error)
            *error = QStringLiteral("JACK output is not running");
        qWarning() << m_logTag << "create-sink" << "jack-inactive";
        return nullptr;
    }

    if (channels < 1 || channels > kOutputChannels) {
        if (error)
            *error = QStringLiteral("Unsupported channel count %1").arg(channels);
        return nullptr;
    }

    if (sampleRate > 0 && sampleRate != m_sampleRate) {
        qInfo() << m_logTag << "resampling" << "file" << sampleRate << "jack" << m_sampleRate;
    }

    auto stream = std::make_shared<Stream>();
    const jack_nframes_t bufferFrames = jack_get_buffer_size(m_client);
    stream->scratch.resize(static_cast<std::size_t>(std::max(bufferFrames, kMaxCycleFrames)) * kOutputChannels);

    // The previous stream (if any) stops rendering at the next cycle.
    retire(m_active.exchange(stream, std::memory_order_acq_rel));
    collectRetired();
    return std::make_unique<Sink>(this, std::move(stream), m_sampleRate);
}

void JackAudioOutput::release(const std::shared_ptr<Stream>& stream) {
    std::shared_ptr<Stream> expected = stream;
    if (m_active.compare_exchange_strong(expected, nullptr, std::memory_order_acq_rel))
        retire(stream);
    collectRetired();
}

void JackAudioOutput::retire(std::shared_ptr<Stream> stream) {
    if (m_client)
        m_retired.retire(std::move(stream), m_completedCycles.load(std::memory_order_acquire));
}

void JackAudioOutput::collectRetired() {
    if (m_client)
        m_retired.collect(m_completedCycles.load(std::memory_order_acquire));
    else
        m_retired.clear();
}

int JackAudioOutput::processCallback(jack_nframes_t nframes, void* arg) {
    auto* self = static_cast<JackAudioOutput*>(arg);
    return self ? self->process(nframes) : 0;
}

void JackAudioOutput::shutdownCallback(void* arg) {
    auto* self = static_cast<JackAudioOutput*>(arg);
    if (self)
        self->m_serverGone.store(true, std::memory_order_release);
}

int JackAudioOutput::process(jack_nframes_t nframes) {
    auto* left = static_cast<float*>(jack_port_get_buffer(m_outputs[0], nframes));
    auto* right = static_cast<float*>(jack_port_get_buffer(m_outputs[1], nframes));
    if (left && right) {
        std::fill(left, left + nframes, 0.f);
        std::fill(right, right + nframes, 0.f);
        renderActive(left, right, nframes);
    }
    // Counted only after renderActive dropped its stream reference.
    m_completedCycles.fetch_add(1, std::memory_order_acq_rel);
    return 0;
}

void JackAudioOutput::renderActive(float* left, float* right, jack_nframes_t nframes) {
    const std::shared_ptr<Stream> stream = m_active.load(std::memory_order_acquire);
    if (!stream || !stream->playing.load(std::memory_order_acquire))
        return;

    std::unique_lock<std::mutex> lock(stream->sourceMutex, std::try_to_lock);
    if (!lock.owns_lock() || !stream->source)
        return;

    const std::size_t needed = static_cast<std::size_t>(nframes) * kOutputChannels;
    if (stream->scratch.size() < needed)
        return;

    const int produced = stream->source->read(stream->scratch.data(), static_cast<int>(nframes), kOutputChannels);
    for (int i = 0; i < produced; ++i) {
        const std::size_t index = static_cast<std::size_t>(i) * kOutputChannels;
        left[i] = stream->scratch[index];
        right[i] = stream->scratch[index + 1];
    }

    if (produced < static_cast<int>(nframes))
        stream->finished.store(true, std::memory_order_release);
}

void JackAudioOutput::connectPlaybackPorts() {
    if (!m_client)
        return;

    constexpr unsigned long flags = JackPortIsPhysical | JackPortIsInput;
    const char** ports = jack_get_ports(m_client, nullptr, JACK_DEFAULT_AUDIO_TYPE, flags);
    if (!ports) {
        qWarning() << m_logTag << "jack-no-playback-ports";
        return;
    }

    int assigned = 0;
    for (int i = 0; ports[i] && assigned < kOutputChannels; ++i) {
        const char* dest = ports[i];
        const char* src = jack_port_name(m_outputs[assigned]);
        if (!src)
            continue;
        const int rc = jack_connect(m_client, src, dest);
        if (rc == 0 || rc == EEXIST) {
            qInfo() << m_logTag << "jack-connect" << src << "->" << dest;
            ++assigned;
        } else {
            qWarning() << m_logTag << "jack-connect-failed" << src << dest << rc;
        }
    }

    jack_free(ports);
}

void JackAudioOutput::logJackStatus(jack_status_t status) const {
    if (status == 0)
        return;
    if (status & JackServerFailed)
        qWarning() << m_logTag << "jack-server-failed";
    if (status & JackNameNotUnique)
        qWarning() << m_logTag << "jack-name-not-unique";
    if (status & JackShmFailure)
        qWarning() << m_logTag << "jack-shm-failure";
    if (status & JackVersionError)
        qWarning() << m_logTag << "jack-version-error";
    if (status & JackInitFailure)
        qWarning() << m_logTag << "jack-init-failure";
    if (status & JackFailure)
        qWarning() << m_logTag << "jack-generic-failure";
}
