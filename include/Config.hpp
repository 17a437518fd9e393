#pragma once
#include "Types.hpp"

// Осадконакопление и эрозия: перенос вещества вниз по склону
struct ErosionParams {
    float_t precipitation = 7.8e5f;       // метров осадков за миллион лет (среднее по суше)
    float_t erosion_coefficient = 1.8e-7f; // доля перепада высот на метр осадков
};

// Выветривание: превращение коренных пород в осадок на месте
struct WeatheringParams {
    float_t precipitation = 7.8e5f;
    float_t weathering_factor = 1.8e-7f;
    float_t critical_sediment_thickness = 1.0f; // м; при большей толщине осадка порода не выветривается
    float_t surface_gravity = 9.8f;
    float_t earth_surface_gravity = 9.8f;
    float_t min_rock_thickness = 0.01f;         // ниже считаем деление на ноль
};

// Давление и скорость астеносферы
struct AsthenosphereParams {
    int smoothing_iterations = 15;
    float_t diffusion_constant = 1.0f;
};

// Разбиение поля скоростей на плиты
struct SegmentationParams {
    float_t similarity_threshold = 0.7f; // косинус угла с вектором области
    int morphology_radius = 5;           // в шагах по рёбрам
};

struct SimulationConfig {
    ErosionParams erosion;
    WeatheringParams weathering;
    AsthenosphereParams asthenosphere;
    SegmentationParams segmentation;

    float_t sealevel = 0.0f;
    float_t mantle_density = 3300.0f; // кг/м^3

    // плотности слоёв коры, кг/м^3
    float_t sediment_density = 2500.0f;
    float_t sedimentary_density = 2600.0f;
    float_t metamorphic_density = 2800.0f;
    float_t sial_density = 2700.0f;
    float_t sima_density = 3000.0f;
    int plate_count = 8;
    int min_plate_size = 10;
};
