#pragma once

#include "AudioOutput.h"

#include <QAudioDevice>
#include <QString>

class QtAudioOutput : public AudioOutput {
public:
    QtAudioOutput();

    std::unique_ptr<PlaybackSink> createSink(int channels, int sampleRate, QString* error) override;
    QString backendName() const override { return QStringLiteral("qt-multimedia"); }

private:
    class SourceDevice;
    class Sink;

    QAudioDevice selectOutputDevice() const;
};
