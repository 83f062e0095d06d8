#pragma once

#include "InputDevice.h"
#include "MessageChannel.h"
#include "PedalTypes.h"

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

struct PedalSourceOptions {
    int scanBackoffMs {2000};
    int disconnectBackoffMs {500};
    int readTimeoutMs {200};
    std::size_t statusCapacity {64};
    std::size_t eventCapacity {512};
};

// Background scanner and reader for the foot pedal. The worker thread only
// produces messages; the UI thread drains them from the two channels.
class PedalEventSource {
public:
    PedalEventSource(std::unique_ptr<InputDeviceBackend> backend,
                     PedalCandidateList candidates,
                     PedalSourceOptions options = PedalSourceOptions{});
    ~PedalEventSource();

    PedalEventSource(const PedalEventSource&) = delete;
    PedalEventSource& operator=(const PedalEventSource&) = delete;

    void start();
    void stop();
    bool isRunning() const noexcept { return m_running.load(std::memory_order_acquire); }

    std::vector<PedalStatus> drainStatus() { return m_status.drain(); }
    std::vector<RawKeyEvent> drainEvents() { return m_events.drain(); }

    const PedalCandidateList& candidates() const noexcept { return m_candidates; }

private:
    void scanLoop();
    std::unique_ptr<InputDevice> findDevice(QString* error);
    QString readUntilDisconnect(InputDevice& device);
    void publishStatus(const PedalStatus& status);
    void sleepFor(int ms);

    std::unique_ptr<InputDeviceBackend> m_backend;
    const PedalCandidateList m_candidates;
    const PedalSourceOptions m_options;

    MessageChannel<PedalStatus> m_status;
    MessageChannel<RawKeyEvent> m_events;
    PedalStatus m_lastPublished;

    std::thread m_thread;
    std::atomic<bool> m_abort {false};
    std::atomic<bool> m_running {false};
    std::mutex m_sleepMutex;
    std::condition_variable m_sleepCond;
};
