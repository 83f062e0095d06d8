#pragma once

#include <QString>
#include <QtGlobal>
#include <vector>

// Linux key codes BTN_0.. reported by the common three-button USB foot pedal.
inline constexpr quint16 kDefaultPedalVendorId = 0x0911;
inline constexpr quint16 kDefaultPedalProductId = 0x1844;
inline constexpr quint32 kDefaultLeftCode = 288;
inline constexpr quint32 kDefaultRightCode = 289;
inline constexpr quint32 kDefaultMiddleCode = 290;

struct PedalCandidate {
    enum class Kind {
        VendorProduct,
        Path
    };

    Kind kind {Kind::VendorProduct};
    quint16 vendorId {0};
    quint16 productId {0};
    QString path;

    static PedalCandidate byId(quint16 vendor, quint16 product) {
        return PedalCandidate{Kind::VendorProduct, vendor, product, {}};
    }

    static PedalCandidate byPath(const QString& devicePath) {
        return PedalCandidate{Kind::Path, 0, 0, devicePath};
    }
};

// Priority is list order.
using PedalCandidateList = std::vector<PedalCandidate>;

enum class KeyValue : qint32 {
    Release = 0,
    Press = 1,
    Autorepeat = 2
};

struct RawKeyEvent {
    quint32 code {0};
    qint32 value {0};
};

struct PedalStatus {
    enum class State {
        NotStarted,
        Scanning,
        Connected,
        Error
    };

    State state {State::NotStarted};
    QString name;
    QString path;
    quint16 vendorId {0};
    quint16 productId {0};
    QString message;
    bool disconnected {false};

    static PedalStatus scanning() {
        PedalStatus status;
        status.state = State::Scanning;
        return status;
    }

    static PedalStatus connected(const QString& name, const QString& path, quint16 vendor, quint16 product) {
        PedalStatus status;
        status.state = State::Connected;
        status.name = name;
        status.path = path;
        status.vendorId = vendor;
        status.productId = product;
        return status;
    }

    static PedalStatus error(const QString& message, bool disconnected) {
        PedalStatus status;
        status.state = State::Error;
        status.message = message;
        status.disconnected = disconnected;
        return status;
    }

    bool operator==(const PedalStatus& other) const {
        return state == other.state && name == other.name && path == other.path
            && vendorId == other.vendorId && productId == other.productId
            && message == other.message && disconnected == other.disconnected;
    }
    bool operator!=(const PedalStatus& other) const { return !(*this == other); }

    QString describe() const;
};
