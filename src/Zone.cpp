#include "Zone.hpp"
#include "Errors.hpp"
#include <algorithm>
#include <cmath>

ZonePartitioner::ZonePartitioner(int maxFloor, ZoneMode mode, double overlapFraction)
    : maxFloor_(maxFloor), mode_(mode), overlap_(overlapFraction) {
    if (maxFloor_ < 0) {
        throw ConfigurationError("building needs at least one floor");
    }
    if (overlap_ < 0.0) {
        throw ConfigurationError("zone overlap must not be negative");
    }
}

int ZonePartitioner::getMaxFloor() const { return maxFloor_; }
ZoneMode ZonePartitioner::getMode() const { return mode_; }

void ZonePartitioner::checkIndex(int index, int total) const {
    if (total < 1) {
        throw ConfigurationError("fleet must have at least one car");
    }
    if (index < 0 || index >= total) {
        throw ConfigurationError("car index " + std::to_string(index) +
                                 " outside fleet of " + std::to_string(total));
    }
}

// floor(index*segment + segment/2) with segment = (maxFloor+1)/total,
// kept in integers so boundaries never drift.
int ZonePartitioner::homeFloor(int index, int total) const {
    checkIndex(index, total);

    if (total == 1) {
        return maxFloor_ / 2;
    }

    const int floors = maxFloor_ + 1;
    int home = ((2 * index + 1) * floors) / (2 * total);
    return std::min(home, maxFloor_);
}

Zone ZonePartitioner::zoneFor(int index, int total) const {
    checkIndex(index, total);

    if (total == 1) {
        return Zone{0, maxFloor_};
    }

    const int floors = maxFloor_ + 1;
    Zone zone;
    zone.low = (index * floors) / total;
    zone.high = (index < total - 1) ? ((index + 1) * floors) / total - 1 : maxFloor_;

    if (zone.empty()) {
        return zone;
    }

    int margin = overlapMargin(total);
    zone.low = std::max(0, zone.low - margin);
    zone.high = std::min(maxFloor_, zone.high + margin);
    return zone;
}

int ZonePartitioner::overlapMargin(int total) const {
    if (mode_ != ZoneMode::Overlapping || overlap_ <= 0.0) {
        return 0;
    }
    double segment = static_cast<double>(maxFloor_ + 1) / total;
    return static_cast<int>(std::ceil(overlap_ * segment));
}
