#pragma once
#include "Config.hpp"
#include "Field.hpp"
#include "ScratchArena.hpp"

// Течение астеносферы: давление как сглаженная плотность, скорость как градиент давления,
// угловая скорость как cross(velocity, position).
class Asthenosphere {
private:
    AsthenosphereParams params;

public:
    Asthenosphere(const AsthenosphereParams& params_ = AsthenosphereParams());

    const AsthenosphereParams& get_params() const { return params; }

    // iterations проходов diffusion_by_constant по копии density.
    // iterations <= 0 даёт копию. out может совпадать с density.
    void pressure(const ScalarField& density, int iterations, ScalarField& out, ScratchArena& scratch) const;

    void pressure(const ScalarField& density, ScalarField& out, ScratchArena& scratch) const {
        pressure(density, params.smoothing_iterations, out, scratch);
    }

    void velocity(const ScalarField& pressure, VectorField& out) const;

    void angular_velocity(const VectorField& velocity, VectorField& out) const;
};
