#pragma once
#include "Config.hpp"
#include "Crust.hpp"
#include "ScratchArena.hpp"

// Выветривание: коренные породы (sedimentary, metamorphic, sial) переходят в осадок
// в той же ячейке. Интенсивность пропорциональна превышению высоты воды над соседями
// и падает до нуля, когда толщина осадка достигает critical_sediment_thickness.
// Приращения пишутся в delta (sima = 0), в каждой ячейке их сумма равна нулю.
class Weathering {
private:
    WeatheringParams params;

public:
    Weathering(const WeatheringParams& params_ = WeatheringParams()) : params(params_) {}

    const WeatheringParams& get_params() const { return params; }

    void compute(const ScalarField& displacement, float_t sealevel, float_t timestep,
                 const Crust& crust, Crust& delta, ScratchArena& scratch) const;
};
