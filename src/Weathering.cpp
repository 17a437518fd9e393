#include "Weathering.hpp"
#include "FieldOps.hpp"
#include <cmath>
#include <stdexcept>

void Weathering::compute(const ScalarField& displacement, float_t sealevel, float_t timestep,
                         const Crust& crust, Crust& delta, ScratchArena& scratch) const
{
    if (!std::isfinite(timestep) || timestep < 0.0f) {
        throw std::invalid_argument("Weathering::compute: timestep must be finite and non-negative");
    }
    if (!(params.critical_sediment_thickness > 0.0f)) {
        throw std::invalid_argument("Weathering::compute: critical sediment thickness must be positive");
    }
    if (!(params.earth_surface_gravity > 0.0f)) {
        throw std::invalid_argument("Weathering::compute: reference surface gravity must be positive");
    }
    if (&crust == &delta) {
        throw std::invalid_argument("Weathering::compute: delta must not alias the crust");
    }
    const Mesh& mesh = displacement.get_mesh();
    require_mesh(crust.sediment, mesh, "Weathering::compute");
    require_mesh(delta.sediment, mesh, "Weathering::compute");
    if (&scratch.get_mesh() != &mesh) {
        throw std::invalid_argument("Weathering::compute: scratch arena belongs to a different mesh");
    }

    ScratchArena::Scope scope(scratch, "Weathering::compute");

    ScalarField& water_height = scope.get_scalar_field();
    FieldOps::sub_scalar(displacement, sealevel, water_height);
    FieldOps::max_scalar(water_height, 0.0f, water_height);

    // weathering и relief делят один буфер
    ScalarField& weathering = scope.get_scalar_field();
    FieldOps::average_difference(water_height, weathering);
    FieldOps::max_scalar(weathering, 0.0f, weathering);
    FieldOps::mult_scalar(weathering,
                          params.weathering_factor *
                          params.precipitation *
                          timestep *
                          params.surface_gravity / params.earth_surface_gravity,
                          weathering);

    // под толстым слоем осадка коренная порода не выветривается
    ScalarField& bedrock_exposure = scope.get_scalar_field();
    FieldOps::mult_scalar(crust.sediment, -1.0f / params.critical_sediment_thickness, bedrock_exposure);
    FieldOps::add_scalar(bedrock_exposure, 1.0f, bedrock_exposure);
    FieldOps::clamp(bedrock_exposure, 0.0f, 1.0f, bedrock_exposure);
    FieldOps::mult(weathering, bedrock_exposure, weathering);

    // TODO: брать сначала из верхних слоёв, как в Erosion, а не пропорционально
    ScalarField& rock = scope.get_scalar_field();
    FieldOps::add(crust.sedimentary, crust.metamorphic, rock);
    FieldOps::add(rock, crust.sial, rock);

    FieldOps::min_field(weathering, rock, weathering);
    FieldOps::max_scalar(weathering, 0.0f, weathering);

    ScalarField& ratio = scope.get_scalar_field();
    for (int_t i = 0; i < mesh.get_ncells(); ++i) {
        if (rock[i] < params.min_rock_thickness) {
            ratio[i] = 0.0f;
            weathering[i] = 0.0f;
        } else {
            ratio[i] = weathering[i] / rock[i];
        }
    }

    FieldOps::copy(weathering, delta.sediment);
    FieldOps::mult(crust.sedimentary, ratio, delta.sedimentary);
    FieldOps::mult_scalar(delta.sedimentary, -1.0f, delta.sedimentary);
    FieldOps::mult(crust.metamorphic, ratio, delta.metamorphic);
    FieldOps::mult_scalar(delta.metamorphic, -1.0f, delta.metamorphic);
    FieldOps::mult(crust.sial, ratio, delta.sial);
    FieldOps::mult_scalar(delta.sial, -1.0f, delta.sial);
    FieldOps::fill(delta.sima, 0.0f);
}
