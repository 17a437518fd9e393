#pragma once
#include "Config.hpp"
#include "Crust.hpp"
#include "ScratchArena.hpp"

// Консервативный перенос вещества вниз по склону между соседними ячейками.
//
// Высота воды h = max(displacement - sealevel, 0). По каждому ребру from->to с
// h[from] > h[to] поток-кандидат равен (h[from] - h[to]) * precipitation * timestep * erosion_coefficient.
// Резервуары расходуются по приоритету sediment, sedimentary, metamorphic, sial,
// так что ячейка никогда не отдаёт больше, чем имеет.
//
// Результат пишется в delta (обнуляется на входе); вызывающий применяет его сам.
// crust и delta не должны совпадать.
class Erosion {
private:
    ErosionParams params;

public:
    Erosion(const ErosionParams& params_ = ErosionParams()) : params(params_) {}

    const ErosionParams& get_params() const { return params; }

    void compute(const ScalarField& displacement, float_t sealevel, float_t timestep,
                 const Crust& crust, Crust& delta, ScratchArena& scratch) const;

    // Поток-кандидат по ребру при данной высоте воды
    float_t outbound_flux(float_t height_from, float_t height_to, float_t timestep) const {
        const float_t difference = height_from - height_to;
        return difference > 0 ? difference * params.precipitation * timestep * params.erosion_coefficient : 0.0f;
    }
};
