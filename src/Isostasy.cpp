#include "Isostasy.hpp"
#include <cmath>
#include <stdexcept>

void Isostasy::displacement(const ScalarField& thickness, const ScalarField& density,
                            float_t mantle_density, ScalarField& out)
{
    if (!std::isfinite(mantle_density) || mantle_density <= 0.0f) {
        throw std::invalid_argument("Isostasy::displacement: mantle density must be positive");
    }
    require_same_mesh(thickness, density, "Isostasy::displacement");
    require_same_mesh(thickness, out, "Isostasy::displacement");

    const float_t inverse_mantle_density = 1.0f / mantle_density;
    for (int_t i = 0; i < thickness.size(); ++i) {
        const float_t t = thickness[i];
        out[i] = t - t * density[i] * inverse_mantle_density;
    }
}
