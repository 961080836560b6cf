#pragma once
#include <cstdint>
#include <vector>
#include "utils.hpp"

// octant code, 3 bits, one per axis:
//   bit 0 set -> pos.x < center.x
//   bit 1 set -> pos.y < center.y
//   bit 2 set -> pos.z < center.z
// names spell the side per axis in x,y,z order (P = not less, N = less),
// so PPP (0) is the (+x,+y,+z) child and NNN (7) the (-x,-y,-z) child.
// a point exactly on a splitting plane lands on the P side of that axis,
// changing this moves boundary points to another leaf
enum class Octant : std::uint8_t {
    PPP = 0, NPP = 1, PNP = 2, NNP = 3,
    PPN = 4, NPN = 5, PNN = 6, NNN = 7
};

enum class Axis : int { X = 0, Y = 1, Z = 2 };

constexpr int kNumOctants = 8;

inline int octantIndex(Octant o) { return static_cast<int>(o); }
inline Octant octantFromIndex(int i) { return static_cast<Octant>(i & 7); }

Octant octantOf(const Point3D& center, const Point3D& pos);

// mirror across the splitting plane of one axis (single bit flip)
Octant oppositeOctant(Octant o, Axis axis);

// center of child 'o' of a cube (center, side); the child has side/2
Point3D childCenter(const Point3D& center, float side, Octant o);

// closed cube test, used for the out-of-bounds policy at the root
bool cubeContains(const Point3D& center, float side, const Point3D& pos);

// true iff the sphere (pos, radius) lies strictly inside the cube on all 6 faces
bool sphereWithinCube(const Point3D& center, float side, const Point3D& pos, float radius);

// true iff every point of the closed cube is strictly closer than radius to pos
bool cubeWithinSphere(const Point3D& center, float side, const Point3D& pos, float radius);

// children of the cube (center, side) that could hold a point closer than
// radius to pos. own octant first, then the per-axis mirrors with x varying
// fastest and z slowest. all 8 (in code order) once radius exceeds side
std::vector<Octant> candidateOctants(const Point3D& center, float side,
                                     const Point3D& pos, float radius);
