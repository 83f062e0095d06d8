#pragma once

#include "PedalDispatcher.h"
#include "pedal/PedalTypes.h"

#include <QString>
#include <vector>

struct PedalModel {
    QString name;
    quint16 vendorId {0};
    quint16 productId {0};
    quint32 leftCode {kDefaultLeftCode};
    quint32 middleCode {kDefaultMiddleCode};
    quint32 rightCode {kDefaultRightCode};
};

struct AppConfig {
    QString defaultOpenDir;

    int rewindSeconds {3};
    int forwardSeconds {3};
    int holdRewindIntervalMs {500};
    int playStartRewindSeconds {1};

    QString devicePath;
    QString selectedModel;

    PedalModel pedalDefaults {QStringLiteral("default"), kDefaultPedalVendorId, kDefaultPedalProductId,
                              kDefaultLeftCode, kDefaultMiddleCode, kDefaultRightCode};
    std::vector<PedalModel> pedals;

    // Default pedal first, configured pedals in order, explicit path last.
    PedalCandidateList candidates() const;
    PedalKeyMap keyMap() const;
    PedalTiming timing() const;
    QString resolveDefaultOpenDir() const;
};

struct ConfigLoadResult {
    AppConfig config;
    QString path;
    bool missing {false};
    bool malformed {false};
};

class ConfigStore {
public:
    // Empty |directory| resolves PEDALSCRIBE_CONFIG_DIR, then AppConfigLocation.
    explicit ConfigStore(QString directory = {});

    QString configPath() const;
    ConfigLoadResult loadOrDefault() const;
    bool save(const AppConfig& config, QString* error = nullptr) const;

    static AppConfig fromJson(const QByteArray& json, bool* ok = nullptr);
    static QByteArray toJson(const AppConfig& config);

private:
    QString m_directory;
};
