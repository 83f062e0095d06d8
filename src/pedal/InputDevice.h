#pragma once

#include "PedalTypes.h"

#include <QString>
#include <memory>
#include <vector>

struct InputDeviceInfo {
    QString path;
    QString name;
    quint16 vendorId {0};
    quint16 productId {0};
};

class InputDevice {
public:
    enum class ReadResult {
        Events,
        Timeout,
        Error
    };

    virtual ~InputDevice() = default;

    virtual QString name() const = 0;
    virtual QString path() const = 0;
    virtual quint16 vendorId() const = 0;
    virtual quint16 productId() const = 0;

    // Blocks up to |timeoutMs| for the next batch. Appends key-type events
    // only, with their raw values (0, 1 or 2). Error means the handle is dead.
    virtual ReadResult waitForKeyEvents(std::vector<RawKeyEvent>& out, int timeoutMs, QString* error) = 0;
};

class InputDeviceBackend {
public:
    virtual ~InputDeviceBackend() = default;

    virtual bool enumerate(std::vector<InputDeviceInfo>& out, QString* error) = 0;
    virtual std::unique_ptr<InputDevice> open(const QString& path, QString* error) = 0;
    virtual bool pathExists(const QString& path) const = 0;
};
