// generate_population.cpp
#include <iostream>
#include <random>
#include <string>
#include <vector>
#include <algorithm>

#include "octree/boid.hpp"
#include "octree/population_loader.hpp"

/// Usage:
///   ./generate_population data/flock.bin 100000 123
///   ./generate_population data/flock.bin 100000 123  100.0  32
///                           ^ output      N      seed world  flocks
///
/// Writes N boids grouped in 'flocks' gaussian clusters inside the cube
/// [-world/2, world/2]^3. boids of one flock share a heading plus noise.

static std::vector<Boid> makeFlocks(size_t N, float world, int flocks, std::mt19937& rng) {
    const float hl = world / 2.0f;
    std::uniform_real_distribution<float> dist_center(-0.8f * hl, 0.8f * hl);
    std::uniform_real_distribution<float> dist_heading(-1.0f, 1.0f);
    std::normal_distribution<float> spread(0.0f, world / 40.0f);
    std::normal_distribution<float> jitter(0.0f, 0.1f);

    std::vector<Point3D> centers(flocks), headings(flocks);
    for (int f = 0; f < flocks; ++f) {
        centers[f]  = {dist_center(rng), dist_center(rng), dist_center(rng)};
        headings[f] = {dist_heading(rng), dist_heading(rng), dist_heading(rng)};
    }

    std::uniform_int_distribution<int> pick(0, flocks - 1);
    std::vector<Boid> boids;
    boids.reserve(N);
    for (size_t i = 0; i < N; ++i) {
        int f = pick(rng);
        Boid b;
        b.id = (int)i;
        // keep everyone inside the world cube
        b.pos.x = std::min(hl, std::max(-hl, centers[f].x + spread(rng)));
        b.pos.y = std::min(hl, std::max(-hl, centers[f].y + spread(rng)));
        b.pos.z = std::min(hl, std::max(-hl, centers[f].z + spread(rng)));
        b.vel.x = headings[f].x + jitter(rng);
        b.vel.y = headings[f].y + jitter(rng);
        b.vel.z = headings[f].z + jitter(rng);
        boids.push_back(b);
    }
    return boids;
}

int main(int argc, char** argv) {
    if (argc < 3) {
        std::cerr << "Usage: " << argv[0]
                  << " <output.bin> <num_boids> [seed] [world_side] [flocks]\n";
        return 1;
    }

    std::string outPath = argv[1];
    size_t numBoids = std::stoul(argv[2]);
    unsigned seed   = (argc > 3) ? (unsigned)std::stoul(argv[3]) : 123u;
    float world     = (argc > 4) ? std::stof(argv[4]) : 100.0f;
    int flocks      = (argc > 5) ? std::stoi(argv[5]) : 32;

    if (world <= 0.0f || flocks <= 0) {
        std::cerr << "ERROR: world_side and flocks must be positive\n";
        return 1;
    }

    std::mt19937 rng(seed);

    auto boids = makeFlocks(numBoids, world, flocks, rng);
    if (!writePopulationBin(outPath, boids)) {
        std::cerr << "ERROR: cannot open " << outPath << " for writing\n";
        return 1;
    }

    std::cout << "Wrote " << boids.size() << " boids (" << flocks << " flocks, world side "
              << world << ") to " << outPath << "\n";
    return 0;
}
