#pragma once

#include "InputDevice.h"

#include <QString>

// /dev/input/event* through the kernel evdev interface.
class EvdevInputBackend : public InputDeviceBackend {
public:
    explicit EvdevInputBackend(QString inputDir = QStringLiteral("/dev/input"));

    bool enumerate(std::vector<InputDeviceInfo>& out, QString* error) override;
    std::unique_ptr<InputDevice> open(const QString& path, QString* error) override;
    bool pathExists(const QString& path) const override;

private:
    QString m_inputDir;
};
