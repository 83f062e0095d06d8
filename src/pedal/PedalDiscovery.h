#pragma once

#include "InputDevice.h"
#include "PedalTypes.h"

#include <vector>

struct DiscoveryTarget {
    QString path;
    quint16 vendorId {0};
    quint16 productId {0};
    bool explicitPath {false};
};

// Orders the enumerated devices by candidate priority. Every device matching
// the first candidate comes before any device matching the second, and so
// on; a path candidate contributes its path verbatim. Paths appear once.
std::vector<DiscoveryTarget> rankDiscoveryTargets(const PedalCandidateList& candidates,
                                                  const std::vector<InputDeviceInfo>& devices);
