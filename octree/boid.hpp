#pragma once
#include <ostream>
#include "utils.hpp"

// one member of the simulated flock. the octree only ever reads the
// position, everything else is opaque to it
struct Boid {
    int id;
    Point3D pos;
    Point3D vel;
};

inline const Point3D& entityPosition(const Boid& b) {
    return b.pos;
}

inline std::ostream& operator<<(std::ostream& os, const Boid& b) {
    return os << "Boid#" << b.id << " " << b.pos;
}
