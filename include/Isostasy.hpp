#pragma once
#include "Field.hpp"

// Изостазия: displacement = thickness * (1 - density / mantle_density).
// mantle_density должна быть положительной, иначе std::invalid_argument.
// out может совпадать с thickness или density.
class Isostasy {
public:
    static void displacement(const ScalarField& thickness, const ScalarField& density,
                             float_t mantle_density, ScalarField& out);
};
