#include "Asthenosphere.hpp"
#include "FieldOps.hpp"
#include <stdexcept>

Asthenosphere::Asthenosphere(const AsthenosphereParams& params_) : params(params_) {
    // при k вне [0, 1] сглаживание может создать новый экстремум
    if (!(params.diffusion_constant >= 0.0f && params.diffusion_constant <= 1.0f)) {
        throw std::invalid_argument("Asthenosphere: diffusion constant must lie in [0, 1]");
    }
}

void Asthenosphere::pressure(const ScalarField& density, int iterations, ScalarField& out, ScratchArena& scratch) const {
    require_same_mesh(density, out, "Asthenosphere::pressure");
    if (&scratch.get_mesh() != &density.get_mesh()) {
        throw std::invalid_argument("Asthenosphere::pressure: scratch arena belongs to a different mesh");
    }

    FieldOps::copy(density, out);
    if (iterations <= 0) return;

    ScratchArena::Scope scope(scratch, "Asthenosphere::pressure");
    ScalarField& average = scope.get_scalar_field();
    for (int i = 0; i < iterations; ++i) {
        FieldOps::diffusion_by_constant(out, params.diffusion_constant, out, average);
    }
}

void Asthenosphere::velocity(const ScalarField& pressure, VectorField& out) const {
    FieldOps::gradient(pressure, out);
}

void Asthenosphere::angular_velocity(const VectorField& velocity, VectorField& out) const {
    const Mesh& mesh = velocity.get_mesh();
    require_same_mesh(velocity, out, "Asthenosphere::angular_velocity");
    for (int_t i = 0; i < mesh.get_ncells(); ++i) {
        out[i] = cross(velocity[i], mesh.position(i));
    }
}
