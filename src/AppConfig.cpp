#include "AppConfig.h"

#include <QDebug>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QSaveFile>
#include <QStandardPaths>
#include <QtGlobal>

#include <algorithm>
#include <limits>
#include <utility>

namespace {
constexpr const char* kConfigFileName = "config.json";

// Ids are accepted as JSON numbers or as strings ("0x0911", "2321").
quint32 readCode(const QJsonValue& value, quint32 fallback) {
    if (value.isDouble()) {
        const double number = value.toDouble();
        if (number < 0.0 || number > static_cast<double>(std::numeric_limits<quint32>::max()))
            return fallback;
        return static_cast<quint32>(number);
    }
    if (value.isString()) {
        bool ok = false;
        const quint32 parsed = value.toString().trimmed().toUInt(&ok, 0);
        return ok ? parsed : fallback;
    }
    return fallback;
}

quint16 readId(const QJsonValue& value, quint16 fallback) {
    const quint32 raw = readCode(value, fallback);
    return raw <= 0xffff ? static_cast<quint16>(raw) : fallback;
}

QString hexId(quint16 id) {
    return QStringLiteral("0x%1").arg(id, 4, 16, QLatin1Char('0'));
}

PedalModel readModel(const QJsonObject& obj, const PedalModel& fallback) {
    PedalModel model = fallback;
    model.name = obj.value(QStringLiteral("name")).toString(fallback.name);
    model.vendorId = readId(obj.value(QStringLiteral("vendorId")), fallback.vendorId);
    model.productId = readId(obj.value(QStringLiteral("productId")), fallback.productId);
    model.leftCode = readCode(obj.value(QStringLiteral("leftCode")), fallback.leftCode);
    model.middleCode = readCode(obj.value(QStringLiteral("middleCode")), fallback.middleCode);
    model.rightCode = readCode(obj.value(QStringLiteral("rightCode")), fallback.rightCode);
    return model;
}

QJsonObject writeModel(const PedalModel& model, bool withName) {
    QJsonObject obj;
    if (withName)
        obj.insert(QStringLiteral("name"), model.name);
    obj.insert(QStringLiteral("vendorId"), hexId(model.vendorId));
    obj.insert(QStringLiteral("productId"), hexId(model.productId));
    obj.insert(QStringLiteral("leftCode"), static_cast<qint64>(model.leftCode));
    obj.insert(QStringLiteral("middleCode"), static_cast<qint64>(model.middleCode));
    obj.insert(QStringLiteral("rightCode"), static_cast<qint64>(model.rightCode));
    return obj;
}

int readPositive(const QJsonObject& obj, const char* key, int fallback) {
    const int value = obj.value(QLatin1String(key)).toInt(fallback);
    return value >= 0 ? value : fallback;
}
}

PedalCandidateList AppConfig::candidates() const {
    PedalCandidateList list;
    list.push_back(PedalCandidate::byId(kDefaultPedalVendorId, kDefaultPedalProductId));
    if (pedalDefaults.vendorId != kDefaultPedalVendorId || pedalDefaults.productId != kDefaultPedalProductId)
        list.push_back(PedalCandidate::byId(pedalDefaults.vendorId, pedalDefaults.productId));
    for (const PedalModel& model : pedals)
        list.push_back(PedalCandidate::byId(model.vendorId, model.productId));
    if (!devicePath.trimmed().isEmpty())
        list.push_back(PedalCandidate::byPath(devicePath.trimmed()));
    return list;
}

PedalKeyMap AppConfig::keyMap() const {
    const PedalModel* source = &pedalDefaults;
    if (!selectedModel.isEmpty()) {
        const auto it = std::find_if(pedals.begin(), pedals.end(), [this](const PedalModel& model) {
            return model.name == selectedModel;
        });
        if (it != pedals.end())
            source = &(*it);
        else
            qWarning() << "Config" << "selected-model-not-found" << selectedModel;
    }
    return PedalKeyMap{source->leftCode, source->middleCode, source->rightCode};
}

PedalTiming AppConfig::timing() const {
    PedalTiming timing;
    timing.startRewindSec = static_cast<double>(playStartRewindSeconds);
    timing.repeatRewindSec = static_cast<double>(rewindSeconds);
    timing.holdRepeatInterval = std::chrono::milliseconds(std::max(1, holdRewindIntervalMs));
    return timing;
}

QString AppConfig::resolveDefaultOpenDir() const {
    if (!defaultOpenDir.isEmpty() && QFileInfo(defaultOpenDir).isDir())
        return defaultOpenDir;
    const QString home = QDir::homePath();
    if (QFileInfo(home).isDir())
        return home;
    return QDir::currentPath();
}

ConfigStore::ConfigStore(QString directory)
    : m_directory(std::move(directory)) {
    if (m_directory.isEmpty())
        m_directory = qEnvironmentVariable("PEDALSCRIBE_CONFIG_DIR");
    if (m_directory.isEmpty())
        m_directory = QStandardPaths::writableLocation(QStandardPaths::AppConfigLocation);
    if (m_directory.isEmpty())
        m_directory = QDir::home().filePath(QStringLiteral(".config/pedalscribe"));
}

QString ConfigStore::configPath() const {
    return QDir(m_directory).filePath(QLatin1String(kConfigFileName));
}

AppConfig ConfigStore::fromJson(const QByteArray& json, bool* ok) {
    AppConfig config;
    QJsonParseError parseError {};
    const QJsonDocument doc = QJsonDocument::fromJson(json, &parseError);
    if (parseError.error != QJsonParseError::NoError || !doc.isObject()) {
        if (ok)
            *ok = false;
        return config;
    }

    const QJsonObject root = doc.object();
    const QJsonObject paths = root.value(QStringLiteral("paths")).toObject();
    config.defaultOpenDir = paths.value(QStringLiteral("defaultOpenDir")).toString();

    const QJsonObject app = root.value(QStringLiteral("application")).toObject();
    config.rewindSeconds = readPositive(app, "rewindSeconds", config.rewindSeconds);
    config.forwardSeconds = readPositive(app, "forwardSeconds", config.forwardSeconds);
    config.holdRewindIntervalMs = readPositive(app, "holdRewindIntervalMs", config.holdRewindIntervalMs);
    config.playStartRewindSeconds = readPositive(app, "playStartRewindSeconds", config.playStartRewindSeconds);

    const QJsonObject input = root.value(QStringLiteral("input")).toObject();
    config.devicePath = input.value(QStringLiteral("devicePath")).toString();
    config.selectedModel = input.value(QStringLiteral("selectedModel")).toString();

    if (root.contains(QStringLiteral("pedalDefaults")))
        config.pedalDefaults = readModel(root.value(QStringLiteral("pedalDefaults")).toObject(), config.pedalDefaults);

    const QJsonArray pedals = root.value(QStringLiteral("pedals")).toArray();
    for (const QJsonValue& value : pedals) {
        if (!value.isObject())
            continue;
        PedalModel model = readModel(value.toObject(), PedalModel{});
        if (model.vendorId == 0 && model.productId == 0) {
            qWarning() << "Config" << "pedal-without-ids" << model.name;
            continue;
        }
        config.pedals.push_back(std::move(model));
    }

    if (ok)
        *ok = true;
    return config;
}

QByteArray ConfigStore::toJson(const AppConfig& config) {
    QJsonObject root;

    QJsonObject paths;
    paths.insert(QStringLiteral("defaultOpenDir"), config.defaultOpenDir);
    root.insert(QStringLiteral("paths"), paths);

    QJsonObject app;
    app.insert(QStringLiteral("rewindSeconds"), config.rewindSeconds);
    app.insert(QStringLiteral("forwardSeconds"), config.forwardSeconds);
    app.insert(QStringLiteral("holdRewindIntervalMs"), config.holdRewindIntervalMs);
    app.insert(QStringLiteral("playStartRewindSeconds"), config.playStartRewindSeconds);
    root.insert(QStringLiteral("application"), app);

    QJsonObject input;
    input.insert(QStringLiteral("devicePath"), config.devicePath);
    input.insert(QStringLiteral("selectedModel"), config.selectedModel);
    root.insert(QStringLiteral("input"), input);

    root.insert(QStringLiteral("pedalDefaults"), writeModel(config.pedalDefaults, false));

    QJsonArray pedals;
    for (const PedalModel& model : config.pedals)
        pedals.append(writeModel(model, true));
    root.insert(QStringLiteral("pedals"), pedals);

    return QJsonDocument(root).toJson(QJsonDocument::Indented);
}

ConfigLoadResult ConfigStore::loadOrDefault() const {
    ConfigLoadResult result;
    result.path = configPath();

    QFile file(result.path);
    if (!file.exists()) {
        result.missing = true;
        qWarning() << "Config" << "not-found" << result.path << "using defaults";
        return result;
    }
    if (!file.open(QIODevice::ReadOnly)) {
        result.malformed = true;
        qWarning() << "Config" << "open-failed" << result.path << file.errorString() << "using defaults";
        return result;
    }

    bool ok = false;
    AppConfig parsed = fromJson(file.readAll(), &ok);
    file.close();
    if (!ok) {
        result.malformed = true;
        qWarning() << "Config" << "parse-failed" << result.path << "using defaults";
        return result;
    }

    result.config = std::move(parsed);
    qInfo() << "Config" << "loaded" << result.path;
    return result;
}

bool ConfigStore::save(const AppConfig& config, QString* error) const {
    if (!QDir().mkpath(m_directory)) {
        if (error)
            *error = QStringLiteral("Cannot create config directory '%1'").arg(m_directory);
        return false;
    }

    QSaveFile file(configPath());
    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        if (error)
            *error = file.errorString();
        qWarning() << "Config" << "save-open-failed" << file.fileName();
        return false;
    }
    file.write(toJson(config));
    if (!file.commit()) {
        if (error)
            *error = file.errorString();
        qWarning() << "Config" << "save-commit-failed" << file.fileName();
        return false;
    }
    qInfo() << "Config" << "saved" << file.fileName();
    return true;
}
