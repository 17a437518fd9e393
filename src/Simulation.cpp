#include "Simulation.hpp"
#include "FieldOps.hpp"
#include "Isostasy.hpp"
#include <chrono>
#include <memory>
#include <iostream>

Simulation::Simulation(const Mesh& mesh_, const SimulationConfig& config_, bool enable_opencl)
    : mesh(mesh_), config(config_),
      erosion(config_.erosion), weathering(config_.weathering),
      asthenosphere(config_.asthenosphere), segmentation(config_.segmentation),
      scratch(mesh_), use_opencl(false), time(0.0), steps(0), plate_count(0),
      crust(mesh_), delta(mesh_),
      thickness(mesh_), density(mesh_), displacement(mesh_), pressure(mesh_),
      velocity(mesh_), angular_velocity(mesh_), plates(mesh_)
{
    if (enable_opencl) {
        ocl = std::make_unique<OpenCLDiffusion>();
        use_opencl = ocl->is_available() && ocl->init_buffers(mesh);
        if (use_opencl) {
            std::cout << "Asthenosphere smoothing on OpenCL device: " << ocl->device_name() << "\n";
        } else {
            std::cerr << "OpenCL is not available, smoothing on CPU\n";
        }
    }
}

void Simulation::update_thickness_and_density() {
    for (int_t i = 0; i < mesh.get_ncells(); ++i) {
        const float_t t = crust.sediment[i] + crust.sedimentary[i] + crust.metamorphic[i] +
                          crust.sial[i] + crust.sima[i];
        const float_t mass = crust.sediment[i] * config.sediment_density +
                             crust.sedimentary[i] * config.sedimentary_density +
                             crust.metamorphic[i] * config.metamorphic_density +
                             crust.sial[i] * config.sial_density +
                             crust.sima[i] * config.sima_density;
        thickness[i] = t;
        density[i] = t > 0.0f ? mass / t : 0.0f;
    }
}

void Simulation::update_pressure() {
    const AsthenosphereParams& p = asthenosphere.get_params();
    if (use_opencl) {
        if (ocl->smooth(density, p.smoothing_iterations, p.diffusion_constant, pressure)) return;
        std::cerr << "OpenCL smoothing failed at step " << steps << ", falling back to CPU\n";
        use_opencl = false;
    }
    asthenosphere.pressure(density, pressure, scratch);
}

void Simulation::step(float_t timestep) {
    update_thickness_and_density();
    Isostasy::displacement(thickness, density, config.mantle_density, displacement);

    weathering.compute(displacement, config.sealevel, timestep, crust, delta, scratch);
    crust.apply_delta(delta);

    erosion.compute(displacement, config.sealevel, timestep, crust, delta, scratch);
    crust.apply_delta(delta);

    update_thickness_and_density();
    update_pressure();
    asthenosphere.velocity(pressure, velocity);
    asthenosphere.angular_velocity(velocity, angular_velocity);

    time += timestep;
    ++steps;
}

int Simulation::update_plates() {
    plate_count = segmentation.plate_map(velocity, config.plate_count, config.min_plate_size, plates);
    return plate_count;
}

void Simulation::run(int total_steps, float_t timestep, int report_every) {
    std::cout << "Parameters: dt=" << timestep << " My, sealevel=" << config.sealevel
              << ", precipitation=" << config.erosion.precipitation << "\n";
    std::cout << "Mesh: " << mesh.get_ncells() << " cells, " << mesh.get_narrows() << " arrows\n";

    const double initial_mass = crust.conserved_total();
    auto t_start = std::chrono::high_resolution_clock::now();

    for (int s = 1; s <= total_steps; ++s) {
        step(timestep);

        if (report_every > 0 && s % report_every == 0) {
            update_plates();
            std::cout << "Progress: step " << s << "/" << total_steps
                      << " (" << (100.0f * s / total_steps) << "%)"
                      << ", plates=" << plate_count
                      << ", sediment=" << FieldOps::sum(crust.sediment) << "\n";
        }
    }

    update_plates();

    auto t_end = std::chrono::high_resolution_clock::now();
    std::chrono::duration<double> dur = t_end - t_start;

    std::cout << "=====================================\n";
    std::cout << "Simulation completed!\n";
    std::cout << "Total steps: " << total_steps << "\n";
    std::cout << "Simulated time: " << time << " My\n";
    std::cout << "Plates: " << plate_count << "\n";
    std::cout << "Crust mass drift: " << (crust.conserved_total() - initial_mass) << "\n";
    std::cout << "Compute time: " << dur.count() << " seconds\n";
    if (dur.count() > 0) {
        std::cout << "Performance: " << (total_steps / dur.count()) << " steps/second\n";
    }
    std::cout << "=====================================\n";
}
