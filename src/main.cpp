#include "Mesh.hpp"
#include "Simulation.hpp"
#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <exception>
#include <stdexcept>
#include <iostream>
#include <string>

// Начальная кора: два континента (гауссовы пятна сиаля) на океанической симе
void init_continents(Simulation &sim, float_t sial_thickness, float_t sigma) {
    const Mesh& mesh = sim.get_mesh();
    float_t xmin = mesh.position(0).x, xmax = xmin;
    float_t ymin = mesh.position(0).y, ymax = ymin;
    for (int_t c = 0; c < mesh.get_ncells(); ++c) {
        xmin = std::min(xmin, mesh.position(c).x);
        xmax = std::max(xmax, mesh.position(c).x);
        ymin = std::min(ymin, mesh.position(c).y);
        ymax = std::max(ymax, mesh.position(c).y);
    }

    float_t x1 = xmin + (xmax - xmin) * 0.3f;
    float_t y1 = ymin + (ymax - ymin) * 0.3f;
    float_t x2 = xmin + (xmax - xmin) * 0.7f;
    float_t y2 = ymin + (ymax - ymin) * 0.7f;

    for (int_t c = 0; c < mesh.get_ncells(); ++c) {
        Float3 cen = mesh.position(c);
        float_t r2_1 = (cen.x - x1)*(cen.x - x1) + (cen.y - y1)*(cen.y - y1);
        float_t r2_2 = (cen.x - x2)*(cen.x - x2) + (cen.y - y2)*(cen.y - y2);
        float_t g1 = std::exp(-r2_1 / (2.0f * sigma * sigma));
        float_t g2 = std::exp(-r2_2 / (2.0f * sigma * sigma));

        sim.crust.sial[c] = sial_thickness * (g1 + g2);
        sim.crust.metamorphic[c] = 0.1f * sim.crust.sial[c];
        sim.crust.sedimentary[c] = 0.05f * sim.crust.sial[c];
        sim.crust.sediment[c] = 0.0f;
        sim.crust.sima[c] = 7000.0f;
    }
}

int parse_arg(int argc, char** argv, int index, int fallback) {
    if (argc <= index) return fallback;
    const int value = std::atoi(argv[index]);
    if (value <= 0) {
        throw std::invalid_argument("argument " + std::to_string(index) + " must be a positive integer");
    }
    return value;
}

int main(int argc, char** argv) {
    try {
        int_t nx = parse_arg(argc, argv, 1, 64);
        int_t ny = parse_arg(argc, argv, 2, 64);
        int steps = parse_arg(argc, argv, 3, 100);

        Mesh mesh(nx, ny, Float3(0.0f, 0.0f, 0.0f), Float3(10.0f, 10.0f, 0.0f));

        SimulationConfig config;
        config.sealevel = 3000.0f;

        Simulation sim(mesh, config);
        init_continents(sim, 30000.0f, 1.5f);

        sim.run(steps, 1.0f, 10);
    } catch (const std::exception& e) {
        std::cerr << "ERROR: " << e.what() << "\n";
        return 1;
    }
    return 0;
}
