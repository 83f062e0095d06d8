#include "EvdevInputBackend.h"

#include <QDebug>
#include <QDir>
#include <QFile>
#include <QFileInfo>

#include <linux/input.h>

#include <array>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <sys/ioctl.h>
#include <unistd.h>
#include <utility>

namespace {
constexpr int kNameBufferSize = 256;
constexpr int kEventBatch = 64;

QString errnoText(int err) {
    return QString::fromLocal8Bit(std::strerror(err));
}

class ScopedFd {
public:
    explicit ScopedFd(int fd = -1) : m_fd(fd) {}
    ~ScopedFd() { reset(); }

    ScopedFd(const ScopedFd&) = delete;
    ScopedFd& operator=(const ScopedFd&) = delete;

    int get() const noexcept { return m_fd; }
    bool valid() const noexcept { return m_fd >= 0; }
    int release() noexcept {
        const int fd = m_fd;
        m_fd = -1;
        return fd;
    }
    void reset() {
        if (m_fd >= 0)
            ::close(m_fd);
        m_fd = -1;
    }

private:
    int m_fd;
};

int openEventNode(const QString& path) {
    const QByteArray encoded = QFile::encodeName(path);
    return ::open(encoded.constData(), O_RDONLY | O_NONBLOCK | O_CLOEXEC);
}

bool queryIdentity(int fd, QString& name, quint16& vendor, quint16& product) {
    input_id id {};
    if (::ioctl(fd, EVIOCGID, &id) < 0)
        return false;
    vendor = id.vendor;
    product = id.product;

    std::array<char, kNameBufferSize> buffer {};
    if (::ioctl(fd, EVIOCGNAME(buffer.size() - 1), buffer.data()) < 0)
        name = QStringLiteral("Unknown");
    else
        name = QString::fromUtf8(buffer.data());
    return true;
}

class EvdevDevice : public InputDevice {
public:
    EvdevDevice(int fd, QString path, QString name, quint16 vendor, quint16 product)
        : m_fd(fd)
        , m_path(std::move(path))
        , m_name(std::move(name))
        , m_vendor(vendor)
        , m_product(product) {}

    QString name() const override { return m_name; }
    QString path() const override { return m_path; }
    quint16 vendorId() const override { return m_vendor; }
    quint16 productId() const override { return m_product; }

    ReadResult waitForKeyEvents(std::vector<RawKeyEvent>& out, int timeoutMs, QString* error) override {
        pollfd pfd {};
        pfd.fd = m_fd.get();
        pfd.events = POLLIN;
        const int rc = ::poll(&pfd, 1, timeoutMs);
        if (rc == 0)
            return ReadResult::Timeout;
        if (rc < 0) {
            if (errno == EINTR)
                return ReadResult::Timeout;
            if (error)
                *error = QStringLiteral("poll failed: %1").arg(errnoText(errno));
            return ReadResult::Error;
        }
        if (pfd.revents & (POLLERR | POLLHUP | POLLNVAL)) {
            if (error)
                *error = QStringLiteral("device went away");
            return ReadResult::Error;
        }

        std::array<input_event, kEventBatch> events {};
        const ssize_t bytes = ::read(m_fd.get(), events.data(), sizeof(events));
        if (bytes < 0) {
            if (errno == EAGAIN || errno == EINTR)
                return ReadResult::Timeout;
            if (error)
                *error = QStringLiteral("read failed: %1").arg(errnoText(errno));
            return ReadResult::Error;
        }
        if (bytes == 0) {
            if (error)
                *error = QStringLiteral("end of device stream");
            return ReadResult::Error;
        }

        const std::size_t count = static_cast<std::size_t>(bytes) / sizeof(input_event);
        for (std::size_t i = 0; i < count; ++i) {
            if (events[i].type != EV_KEY)
                continue;
            out.push_back(RawKeyEvent{static_cast<quint32>(events[i].code), static_cast<qint32>(events[i].value)});
        }
        return ReadResult::Events;
    }

private:
    ScopedFd m_fd;
    QString m_path;
    QString m_name;
    quint16 m_vendor {0};
    quint16 m_product {0};
};
}

EvdevInputBackend::EvdevInputBackend(QString inputDir)
    : m_inputDir(std::move(inputDir)) {}

bool EvdevInputBackend::enumerate(std::vector<InputDeviceInfo>& out, QString* error) {
    QDir dir(m_inputDir);
    if (!dir.exists()) {
        if (error)
            *error = QStringLiteral("Input directory '%1' not found").arg(m_inputDir);
        return false;
    }

    const QStringList nodes = dir.entryList(QStringList{QStringLiteral("event*")}, QDir::System | QDir::Files, QDir::Name);
    for (const QString& node : nodes) {
        const QString path = dir.filePath(node);
        ScopedFd fd(openEventNode(path));
        if (!fd.valid()) {
            qDebug() << "Pedal" << "enumerate-open-failed" << path << errnoText(errno);
            continue;
        }

        InputDeviceInfo info;
        info.path = path;
        if (!queryIdentity(fd.get(), info.name, info.vendorId, info.productId)) {
            qDebug() << "Pedal" << "enumerate-ioctl-failed" << path;
            continue;
        }
        out.push_back(std::move(info));
    }
    return true;
}

std::unique_ptr<InputDevice> EvdevInputBackend::open(const QString& path, QString* error) {
    ScopedFd fd(openEventNode(path));
    if (!fd.valid()) {
        if (error)
            *error = QStringLiteral("Failed to open %1: %2").arg(path, errnoText(errno));
        return nullptr;
    }

    QString name;
    quint16 vendor = 0;
    quint16 product = 0;
    if (!queryIdentity(fd.get(), name, vendor, product)) {
        if (error)
            *error = QStringLiteral("%1 is not an evdev device").arg(path);
        return nullptr;
    }

    return std::make_unique<EvdevDevice>(fd.release(), path, name, vendor, product);
}

bool EvdevInputBackend::pathExists(const QString& path) const {
    return !path.isEmpty() && QFileInfo::exists(path);
}
