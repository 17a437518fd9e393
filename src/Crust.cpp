#include "Crust.hpp"
#include "FieldOps.hpp"
#include <stdexcept>

void Crust::reset() {
    FieldOps::fill(sediment, 0.0f);
    FieldOps::fill(sedimentary, 0.0f);
    FieldOps::fill(metamorphic, 0.0f);
    FieldOps::fill(sial, 0.0f);
    FieldOps::fill(sima, 0.0f);
}

void Crust::apply_delta(const Crust& delta) {
    if (&delta == this) {
        throw std::invalid_argument("Crust::apply_delta: delta must not alias the crust");
    }
    FieldOps::add(sediment, delta.sediment, sediment);
    FieldOps::add(sedimentary, delta.sedimentary, sedimentary);
    FieldOps::add(metamorphic, delta.metamorphic, metamorphic);
    FieldOps::add(sial, delta.sial, sial);
    FieldOps::add(sima, delta.sima, sima);
}

double Crust::conserved_total() const {
    return FieldOps::sum(sediment) + FieldOps::sum(sedimentary) +
           FieldOps::sum(metamorphic) + FieldOps::sum(sial);
}
