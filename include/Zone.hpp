#ifndef ZONE_HPP
#define ZONE_HPP

#include "Types.hpp"

// ============== Zone ==============

// Inclusive floor range. low > high marks an empty zone, which happens when
// there are more cars than floors.
struct Zone {
    int low = 0;
    int high = -1;

    bool empty() const { return low > high; }
    bool contains(int floor) const { return floor >= low && floor <= high; }
    int center() const { return (low + high) / 2; }

    bool operator==(const Zone& other) const {
        return low == other.low && high == other.high;
    }
};

// ============== Zone Partitioner ==============
// Spreads a fleet over [0, maxFloor]. Only biases dispatch, never restricts it.

class ZonePartitioner {
private:
    int maxFloor_;
    ZoneMode mode_;
    double overlap_;

public:
    explicit ZonePartitioner(int maxFloor,
                             ZoneMode mode = ZoneMode::Contiguous,
                             double overlapFraction = 0.1);

    int homeFloor(int index, int total) const;
    Zone zoneFor(int index, int total) const;

    int getMaxFloor() const;
    ZoneMode getMode() const;

private:
    void checkIndex(int index, int total) const;
    int overlapMargin(int total) const;
};

#endif // ZONE_HPP
