#pragma once
#include "Field.hpp"

// Набор резервуаров коры. sediment, sedimentary, metamorphic, sial неотрицательны;
// sima считается неисчерпаемым фоновым резервуаром.
struct Crust {
    ScalarField sediment;
    ScalarField sedimentary;
    ScalarField metamorphic;
    ScalarField sial;
    ScalarField sima;

    explicit Crust(const Mesh& mesh)
        : sediment(mesh), sedimentary(mesh), metamorphic(mesh), sial(mesh), sima(mesh) {}

    const Mesh& get_mesh() const { return sediment.get_mesh(); }

    // Обнуляет все поля (используется для набора приращений)
    void reset();

    // this += delta
    void apply_delta(const Crust& delta);

    // sediment + sedimentary + metamorphic + sial по всей сетке
    double conserved_total() const;
};
