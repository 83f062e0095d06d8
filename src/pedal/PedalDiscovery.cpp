#include "PedalDiscovery.h"

#include <QSet>
#include <algorithm>

std::vector<DiscoveryTarget> rankDiscoveryTargets(const PedalCandidateList& candidates,
                                                  const std::vector<InputDeviceInfo>& devices) {
    std::vector<DiscoveryTarget> targets;
    QSet<QString> seen;

    for (const PedalCandidate& candidate : candidates) {
        if (candidate.kind == PedalCandidate::Kind::Path) {
            if (candidate.path.isEmpty() || seen.contains(candidate.path))
                continue;
            DiscoveryTarget target;
            target.path = candidate.path;
            target.explicitPath = true;
            const auto known = std::find_if(devices.begin(), devices.end(), [&](const InputDeviceInfo& info) {
                return info.path == candidate.path;
            });
            if (known != devices.end()) {
                target.vendorId = known->vendorId;
                target.productId = known->productId;
            }
            seen.insert(candidate.path);
            targets.push_back(std::move(target));
            continue;
        }

        for (const InputDeviceInfo& info : devices) {
            if (info.vendorId != candidate.vendorId || info.productId != candidate.productId)
                continue;
            if (seen.contains(info.path))
                continue;
            seen.insert(info.path);
            targets.push_back(DiscoveryTarget{info.path, info.vendorId, info.productId, false});
        }
    }
    return targets;
}
