#include "AudioOutput.h"
#include "JackAudioOutput.h"
#include "QtAudioOutput.h"

#include <QDebug>
#include <QtGlobal>

std::unique_ptr<AudioOutput> createAudioOutput() {
    if (!qEnvironmentVariableIsSet("PEDALSCRIBE_DISABLE_JACK")) {
        auto jack = std::make_unique<JackAudioOutput>();
        if (jack->start())
            return jack;
        qInfo() << "AudioOut" << "jack-unavailable" << "falling-back-to-qt";
    }

    qInfo() << "AudioOut" << "backend" << "qt-multimedia";
    return std::make_unique<QtAudioOutput>();
}
