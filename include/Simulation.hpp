#pragma once
#include "Asthenosphere.hpp"
#include "Config.hpp"
#include "Crust.hpp"
#include "Erosion.hpp"
#include "OpenCLDiffusion.hpp"
#include "PlateSegmentation.hpp"
#include "ScratchArena.hpp"
#include "Weathering.hpp"
#include <memory>

// Один мир: кора, производные поля и последовательность шагов моделирования.
class Simulation {
private:
    const Mesh& mesh;
    SimulationConfig config;

    Erosion erosion;
    Weathering weathering;
    Asthenosphere asthenosphere;
    PlateSegmentation segmentation;

    ScratchArena scratch;
    std::unique_ptr<OpenCLDiffusion> ocl;
    bool use_opencl;

    double time;
    int steps;
    int plate_count;

    void update_pressure();

public:
    Crust crust;
    Crust delta;

    ScalarField thickness;
    ScalarField density;
    ScalarField displacement;
    ScalarField pressure;
    VectorField velocity;
    VectorField angular_velocity;
    LabelField plates;

    // enable_opencl = false: только CPU (детерминированные тесты)
    Simulation(const Mesh& mesh_, const SimulationConfig& config_ = SimulationConfig(), bool enable_opencl = true);

    const Mesh& get_mesh() const { return mesh; }
    const SimulationConfig& get_config() const { return config; }
    double get_time() const { return time; }
    int get_steps() const { return steps; }
    int get_plate_count() const { return plate_count; }
    bool is_using_opencl() const { return use_opencl; }

    // Толщина как сумма слоёв, плотность как средневзвешенная по толщине
    void update_thickness_and_density();

    // Изостазия -> выветривание -> эрозия -> давление -> скорость
    void step(float_t timestep);

    // Пересчёт карты плит по текущему полю скоростей
    int update_plates();

    void run(int total_steps, float_t timestep, int report_every);
};
