#pragma once
#include "Field.hpp"

// Поэлементные операции над полями и операторы на рёбрах сетки.
// Если не оговорено иное, out может совпадать с любым из входов.
class FieldOps {
public:
    template <typename T>
    static void fill(Field<T>& out, T value) {
        for (auto& v : out) v = value;
    }

    template <typename T>
    static void copy(const Field<T>& a, Field<T>& out) {
        require_same_mesh(a, out, "FieldOps::copy");
        if (&a == &out) return;
        for (int_t i = 0; i < a.size(); ++i) out[i] = a[i];
    }

    template <typename T>
    static void fill_into_selection(const Field<T>& a, T value, const MaskField& selection, Field<T>& out) {
        require_same_mesh(a, selection, "FieldOps::fill_into_selection");
        require_same_mesh(a, out, "FieldOps::fill_into_selection");
        for (int_t i = 0; i < a.size(); ++i) {
            out[i] = selection[i] ? value : a[i];
        }
    }

    template <typename T>
    static void eq_scalar(const Field<T>& a, T value, MaskField& out) {
        require_same_mesh(a, out, "FieldOps::eq_scalar");
        for (int_t i = 0; i < a.size(); ++i) out[i] = a[i] == value ? 1 : 0;
    }

    template <typename T>
    static void ne_scalar(const Field<T>& a, T value, MaskField& out) {
        require_same_mesh(a, out, "FieldOps::ne_scalar");
        for (int_t i = 0; i < a.size(); ++i) out[i] = a[i] != value ? 1 : 0;
    }

    static void add(const ScalarField& a, const ScalarField& b, ScalarField& out);
    static void sub(const ScalarField& a, const ScalarField& b, ScalarField& out);
    static void mult(const ScalarField& a, const ScalarField& b, ScalarField& out);
    // деление на ноль даёт 0
    static void div(const ScalarField& a, const ScalarField& b, ScalarField& out);

    static void add_scalar(const ScalarField& a, float_t b, ScalarField& out);
    static void sub_scalar(const ScalarField& a, float_t b, ScalarField& out);
    static void mult_scalar(const ScalarField& a, float_t b, ScalarField& out);
    static void min_scalar(const ScalarField& a, float_t b, ScalarField& out);
    static void max_scalar(const ScalarField& a, float_t b, ScalarField& out);
    static void min_field(const ScalarField& a, const ScalarField& b, ScalarField& out);
    static void clamp(const ScalarField& a, float_t lo, float_t hi, ScalarField& out);

    static double sum(const ScalarField& a);
    static float_t min_value(const ScalarField& a);
    static float_t max_value(const ScalarField& a);

    static void magnitude(const VectorField& a, ScalarField& out);
    static void cross(const VectorField& a, const VectorField& b, VectorField& out);

    // Позиции ячеек сетки как векторное поле
    static void positions(const Mesh& mesh, VectorField& out);

    // Среднее по соседям; ячейка без соседей сохраняет своё значение. out != a.
    static void neighbor_average(const ScalarField& a, ScalarField& out);

    // Среднее по соседям от (a[i] - a[j])
    static void average_difference(const ScalarField& a, ScalarField& out);

    // out = a + k * (neighbor_average(a) - a); scratch != a, scratch != out
    static void diffusion_by_constant(const ScalarField& a, float_t k, ScalarField& out, ScalarField& scratch);

    // Градиент по рёбрам: (1/n) * sum (a[to]-a[from]) * d / |d|^2, d = pos[to]-pos[from]
    static void gradient(const ScalarField& a, VectorField& out);
};
