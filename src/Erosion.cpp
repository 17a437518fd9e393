#include "Erosion.hpp"
#include "FieldOps.hpp"
#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace {

// Доля суммарного кандидата total, которую покрывает резервуар;
// remaining уменьшается на взятое количество
float_t withdraw_fraction(float_t reservoir, float_t total, float_t& remaining) {
    if (!(total > 0.0f) || !(remaining > 0.0f)) return 0.0f;
    const float_t withdrawn = std::min(std::max(reservoir, 0.0f), remaining);
    const float_t fraction = withdrawn / total;
    if (!std::isfinite(fraction)) return 0.0f;
    remaining -= withdrawn;
    return fraction;
}

} // namespace

void Erosion::compute(const ScalarField& displacement, float_t sealevel, float_t timestep,
                      const Crust& crust, Crust& delta, ScratchArena& scratch) const
{
    if (!std::isfinite(timestep) || timestep < 0.0f) {
        throw std::invalid_argument("Erosion::compute: timestep must be finite and non-negative");
    }
    if (&crust == &delta) {
        throw std::invalid_argument("Erosion::compute: delta must not alias the crust");
    }
    const Mesh& mesh = displacement.get_mesh();
    require_mesh(crust.sediment, mesh, "Erosion::compute");
    require_mesh(delta.sediment, mesh, "Erosion::compute");
    if (&scratch.get_mesh() != &mesh) {
        throw std::invalid_argument("Erosion::compute: scratch arena belongs to a different mesh");
    }

    ScratchArena::Scope scope(scratch, "Erosion::compute");

    delta.reset();

    ScalarField& water_height = scope.get_scalar_field();
    FieldOps::sub_scalar(displacement, sealevel, water_height);
    FieldOps::max_scalar(water_height, 0.0f, water_height);

    const std::vector<Mesh::Arrow>& arrows = mesh.get_arrows();
    const std::vector<int_t>& neighbor_count = mesh.get_neighbor_count();

    // проход 1: суммарный исходящий поток-кандидат по ячейкам
    ScalarField& outbound = scope.get_scalar_field();
    FieldOps::fill(outbound, 0.0f);
    for (const auto& a : arrows) {
        outbound[a.from] += outbound_flux(water_height[a.from], water_height[a.to], timestep);
    }

    ScalarField& sediment_fraction = scope.get_scalar_field();
    ScalarField& sedimentary_fraction = scope.get_scalar_field();
    ScalarField& metamorphic_fraction = scope.get_scalar_field();
    ScalarField& sial_fraction = scope.get_scalar_field();

    for (int_t i = 0; i < mesh.get_ncells(); ++i) {
        const float_t total = outbound[i];
        float_t remaining = total;
        const float_t n = static_cast<float_t>(neighbor_count[i]);

        // порядок важен: осадок уходит раньше коренных пород
        const float_t f_sediment = withdraw_fraction(crust.sediment[i], total, remaining);
        const float_t f_sedimentary = withdraw_fraction(crust.sedimentary[i], total, remaining);
        const float_t f_metamorphic = withdraw_fraction(crust.metamorphic[i], total, remaining);
        const float_t f_sial = withdraw_fraction(crust.sial[i], total, remaining);

        sediment_fraction[i] = n > 0 ? f_sediment / n : 0.0f;
        sedimentary_fraction[i] = n > 0 ? f_sedimentary / n : 0.0f;
        metamorphic_fraction[i] = n > 0 ? f_metamorphic / n : 0.0f;
        sial_fraction[i] = n > 0 ? f_sial / n : 0.0f;
    }

    // проход 2: перенос по рёбрам
    for (const auto& a : arrows) {
        const float_t flux = outbound_flux(water_height[a.from], water_height[a.to], timestep);
        if (flux == 0.0f) continue;

        float_t transfer = flux * sediment_fraction[a.from];
        delta.sediment[a.from] -= transfer;
        delta.sediment[a.to] += transfer;

        transfer = flux * sedimentary_fraction[a.from];
        delta.sedimentary[a.from] -= transfer;
        delta.sedimentary[a.to] += transfer;

        transfer = flux * metamorphic_fraction[a.from];
        delta.metamorphic[a.from] -= transfer;
        delta.metamorphic[a.to] += transfer;

        transfer = flux * sial_fraction[a.from];
        delta.sial[a.from] -= transfer;
        delta.sial[a.to] += transfer;
    }
}
