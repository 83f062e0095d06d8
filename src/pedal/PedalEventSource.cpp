#include "PedalEventSource.h"
#include "PedalDiscovery.h"

#include <QDebug>
#include <chrono>
#include <utility>

PedalEventSource::PedalEventSource(std::unique_ptr<InputDeviceBackend> backend,
                                   PedalCandidateList candidates,
                                   PedalSourceOptions options)
    : m_backend(std::move(backend))
    , m_candidates(std::move(candidates))
    , m_options(options)
    , m_status(options.statusCapacity)
    , m_events(options.eventCapacity) {}

PedalEventSource::~PedalEventSource() {
    stop();
}

void PedalEventSource::start() {
    if (m_running.load(std::memory_order_acquire) || !m_backend)
        return;
    if (m_thread.joinable())
        m_thread.join();

    m_abort.store(false, std::memory_order_release);
    m_running.store(true, std::memory_order_release);
    m_thread = std::thread(&PedalEventSource::scanLoop, this);
    qInfo() << "Pedal" << "scanner-started" << "candidates" << static_cast<int>(m_candidates.size());
}

void PedalEventSource::stop() {
    {
        std::lock_guard<std::mutex> guard(m_sleepMutex);
        m_abort.store(true, std::memory_order_release);
    }
    m_sleepCond.notify_all();
    if (m_thread.joinable())
        m_thread.join();
    m_running.store(false, std::memory_order_release);
}

void PedalEventSource::sleepFor(int ms) {
    std::unique_lock<std::mutex> lock(m_sleepMutex);
    m_sleepCond.wait_for(lock, std::chrono::milliseconds(ms), [this]() {
        return m_abort.load(std::memory_order_acquire);
    });
}

void PedalEventSource::publishStatus(const PedalStatus& status) {
    if (status == m_lastPublished)
        return;
    m_lastPublished = status;
    if (!m_status.tryPush(status))
        qWarning() << "Pedal" << "status-dropped" << status.describe();
}

std::unique_ptr<InputDevice> PedalEventSource::findDevice(QString* error) {
    std::vector<InputDeviceInfo> devices;
    if (!m_backend->enumerate(devices, error))
        return nullptr;

    const std::vector<DiscoveryTarget> targets = rankDiscoveryTargets(m_candidates, devices);
    for (const DiscoveryTarget& target : targets) {
        if (target.explicitPath && !m_backend->pathExists(target.path))
            continue;
        QString openError;
        std::unique_ptr<InputDevice> device = m_backend->open(target.path, &openError);
        if (device)
            return device;
        qDebug() << "Pedal" << "open-failed" << openError;
    }
    return nullptr;
}

QString PedalEventSource::readUntilDisconnect(InputDevice& device) {
    std::vector<RawKeyEvent> batch;
    while (!m_abort.load(std::memory_order_acquire)) {
        batch.clear();
        QString error;
        const InputDevice::ReadResult result = device.waitForKeyEvents(batch, m_options.readTimeoutMs, &error);
        if (result == InputDevice::ReadResult::Error)
            return error.isEmpty() ? QStringLiteral("read error") : error;
        if (result == InputDevice::ReadResult::Timeout)
            continue;

        for (const RawKeyEvent& event : batch) {
            if (event.value == static_cast<qint32>(KeyValue::Autorepeat))
                continue;
            if (!m_events.tryPush(event))
                qWarning() << "Pedal" << "event-dropped" << event.code << event.value
                           << "total" << static_cast<qulonglong>(m_events.dropped());
        }
    }
    return {};
}

void PedalEventSource::scanLoop() {
    while (!m_abort.load(std::memory_order_acquire)) {
        publishStatus(PedalStatus::scanning());

        QString error;
        std::unique_ptr<InputDevice> device = findDevice(&error);
        if (!device) {
            if (!error.isEmpty()) {
                qWarning() << "Pedal" << "scan-failed" << error;
                publishStatus(PedalStatus::error(error, false));
            }
            sleepFor(m_options.scanBackoffMs);
            continue;
        }

        qInfo() << "Pedal" << "connected" << device->name() << device->path()
                << QString::number(device->vendorId(), 16) << QString::number(device->productId(), 16);
        publishStatus(PedalStatus::connected(device->name(), device->path(),
                                             device->vendorId(), device->productId()));

        const QString reason = readUntilDisconnect(*device);
        device.reset();
        if (m_abort.load(std::memory_order_acquire))
            break;

        qWarning() << "Pedal" << "disconnected" << reason;
        publishStatus(PedalStatus::error(QStringLiteral("Pedal disconnected: %1").arg(reason), true));
        sleepFor(m_options.disconnectBackoffMs);
    }
    m_running.store(false, std::memory_order_release);
}
