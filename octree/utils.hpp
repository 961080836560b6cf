#pragma once
#include <cmath>
#include <ostream>

struct Point3D {
    float x, y, z;
};

inline bool operator==(const Point3D& a, const Point3D& b) {
    return a.x == b.x && a.y == b.y && a.z == b.z;
}

inline bool operator!=(const Point3D& a, const Point3D& b) {
    return !(a == b);
}

inline Point3D operator-(const Point3D& a, const Point3D& b) {
    return {a.x - b.x, a.y - b.y, a.z - b.z};
}

inline Point3D operator+(const Point3D& a, const Point3D& b) {
    return {a.x + b.x, a.y + b.y, a.z + b.z};
}

inline Point3D operator*(const Point3D& a, float s) {
    return {a.x * s, a.y * s, a.z * s};
}

inline std::ostream& operator<<(std::ostream& os, const Point3D& p) {
    return os << "(" << p.x << ", " << p.y << ", " << p.z << ")";
}

// axis 0 = x, 1 = y, 2 = z
inline float component(const Point3D& p, int axis) {
    return axis == 0 ? p.x : (axis == 1 ? p.y : p.z);
}

inline float sqLength(const Point3D& v) {
    return v.x*v.x + v.y*v.y + v.z*v.z;
}

inline float length(const Point3D& v) {
    return std::sqrt(sqLength(v));
}

inline float sqDist(const Point3D& a, const Point3D& b) {
    return sqLength(a - b);
}

// every distance the octree reports goes through here, the brute force
// reference uses the same function so results compare exactly
inline float distance(const Point3D& a, const Point3D& b) {
    return length(a - b);
}

// a bare point is its own position, so Point3D can be indexed directly
inline const Point3D& entityPosition(const Point3D& p) {
    return p;
}
