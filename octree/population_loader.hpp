// population_loader.hpp
#pragma once
#include <vector>
#include <string>
#include <fstream>
#include <iostream>
#include "boid.hpp"

// population file: flat binary, one record of 6 floats per boid
//   x y z vx vy vz
// boid ids are the record index

// maxBoids == 0 -> load all; otherwise stop once we hit maxBoids
inline std::vector<Boid> loadPopulationBin(
    const std::string& filename,
    size_t maxBoids = 0)
{
    std::ifstream in(filename, std::ios::binary);
    if (!in) {
        std::cerr << "ERROR: cannot open population file: " << filename << "\n";
        return {};
    }

    std::vector<Boid> boids;

    float data[6];
    while (in.read(reinterpret_cast<char*>(data), sizeof(data))) {
        Boid b;
        b.id = (int)boids.size();
        b.pos = {data[0], data[1], data[2]};
        b.vel = {data[3], data[4], data[5]};
        boids.push_back(b);
        if (maxBoids > 0 && boids.size() >= maxBoids)
            break;
    }

    return boids;
}

inline bool writePopulationBin(const std::string& filename, const std::vector<Boid>& boids) {
    std::ofstream out(filename, std::ios::binary);
    if (!out) return false;
    for (const auto& b : boids) {
        float data[6] = {b.pos.x, b.pos.y, b.pos.z, b.vel.x, b.vel.y, b.vel.z};
        out.write(reinterpret_cast<const char*>(data), sizeof(data));
    }
    return (bool)out;
}

// thin a population down to at most maxCount entities, picks spread evenly
// over the whole input (the first one is always kept). maxCount == 0 keeps all
template <typename Entity>
std::vector<Entity> downsample_stride(const std::vector<Entity>& in, size_t maxCount) {
    if (maxCount == 0 || in.size() <= maxCount) return in;

    std::vector<Entity> out;
    out.reserve(maxCount);
    for (size_t i = 0; i < maxCount; ++i) {
        out.push_back(in[i * in.size() / maxCount]);
    }
    return out;
}
