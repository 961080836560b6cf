// Octant addressing and cube/sphere geometry
#include <cmath>
#include <algorithm>

#include "octant.hpp"

// one strict less-than per axis, each sets one bit of the code
Octant octantOf(const Point3D& center, const Point3D& pos) {
    int oct = 0;
    if (pos.x < center.x) oct |= 1;
    if (pos.y < center.y) oct |= 2;
    if (pos.z < center.z) oct |= 4;
    return octantFromIndex(oct);
}

Octant oppositeOctant(Octant o, Axis axis) {
    return octantFromIndex(octantIndex(o) ^ (1 << static_cast<int>(axis)));
}

Point3D childCenter(const Point3D& center, float side, Octant o) {
    float q = side / 4.0f;  // half of the child's side
    int code = octantIndex(o);
    return {
        (code & 1) ? center.x - q : center.x + q,
        (code & 2) ? center.y - q : center.y + q,
        (code & 4) ? center.z - q : center.z + q
    };
}

bool cubeContains(const Point3D& center, float side, const Point3D& pos) {
    float hl = side / 2.0f;
    for (int a = 0; a < 3; ++a) {
        float d = component(pos, a) - component(center, a);
        // written so a NaN coordinate is rejected too
        if (!(d >= -hl && d <= hl)) return false;
    }
    return true;
}

bool sphereWithinCube(const Point3D& center, float side, const Point3D& pos, float radius) {
    float hl = side / 2.0f;
    Point3D d = pos - center;
    return -hl < d.x - radius && -hl < d.y - radius && -hl < d.z - radius &&
            hl > d.x + radius &&  hl > d.y + radius &&  hl > d.z + radius;
}

bool cubeWithinSphere(const Point3D& center, float side, const Point3D& pos, float radius) {
    if (!(radius > 0.0f)) return false;
    float hl = side / 2.0f;
    // the farthest corner decides
    Point3D corner;
    corner.x = std::max(std::fabs(pos.x - (center.x - hl)), std::fabs(pos.x - (center.x + hl)));
    corner.y = std::max(std::fabs(pos.y - (center.y - hl)), std::fabs(pos.y - (center.y + hl)));
    corner.z = std::max(std::fabs(pos.z - (center.z - hl)), std::fabs(pos.z - (center.z + hl)));
    return radius * radius > sqLength(corner);
}

std::vector<Octant> candidateOctants(const Point3D& center, float side,
                                     const Point3D& pos, float radius) {
    std::vector<Octant> out;

    // sphere bigger than the whole cube, pruning buys nothing
    if (radius > side) {
        out.reserve(kNumOctants);
        for (int b = 0; b < kNumOctants; ++b) out.push_back(octantFromIndex(b));
        return out;
    }

    Octant own = octantOf(center, pos);

    // does the sphere cross the splitting plane on this axis?
    bool cross[3];
    for (int a = 0; a < 3; ++a) {
        cross[a] = radius > std::fabs(component(pos, a) - component(center, a));
    }

    for (int fz = 0; fz <= (cross[2] ? 1 : 0); ++fz) {
        for (int fy = 0; fy <= (cross[1] ? 1 : 0); ++fy) {
            for (int fx = 0; fx <= (cross[0] ? 1 : 0); ++fx) {
                Octant o = own;
                if (fx) o = oppositeOctant(o, Axis::X);
                if (fy) o = oppositeOctant(o, Axis::Y);
                if (fz) o = oppositeOctant(o, Axis::Z);
                out.push_back(o);
            }
        }
    }
    return out;
}
