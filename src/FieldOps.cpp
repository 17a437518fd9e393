#include "FieldOps.hpp"
#include <algorithm>
#include <limits>

void FieldOps::add(const ScalarField& a, const ScalarField& b, ScalarField& out) {
    require_same_mesh(a, b, "FieldOps::add");
    require_same_mesh(a, out, "FieldOps::add");
    for (int_t i = 0; i < a.size(); ++i) out[i] = a[i] + b[i];
}

void FieldOps::sub(const ScalarField& a, const ScalarField& b, ScalarField& out) {
    require_same_mesh(a, b, "FieldOps::sub");
    require_same_mesh(a, out, "FieldOps::sub");
    for (int_t i = 0; i < a.size(); ++i) out[i] = a[i] - b[i];
}

void FieldOps::mult(const ScalarField& a, const ScalarField& b, ScalarField& out) {
    require_same_mesh(a, b, "FieldOps::mult");
    require_same_mesh(a, out, "FieldOps::mult");
    for (int_t i = 0; i < a.size(); ++i) out[i] = a[i] * b[i];
}

void FieldOps::div(const ScalarField& a, const ScalarField& b, ScalarField& out) {
    require_same_mesh(a, b, "FieldOps::div");
    require_same_mesh(a, out, "FieldOps::div");
    for (int_t i = 0; i < a.size(); ++i) {
        out[i] = b[i] != 0.0f ? a[i] / b[i] : 0.0f;
    }
}

void FieldOps::add_scalar(const ScalarField& a, float_t b, ScalarField& out) {
    require_same_mesh(a, out, "FieldOps::add_scalar");
    for (int_t i = 0; i < a.size(); ++i) out[i] = a[i] + b;
}

void FieldOps::sub_scalar(const ScalarField& a, float_t b, ScalarField& out) {
    require_same_mesh(a, out, "FieldOps::sub_scalar");
    for (int_t i = 0; i < a.size(); ++i) out[i] = a[i] - b;
}

void FieldOps::mult_scalar(const ScalarField& a, float_t b, ScalarField& out) {
    require_same_mesh(a, out, "FieldOps::mult_scalar");
    for (int_t i = 0; i < a.size(); ++i) out[i] = a[i] * b;
}

void FieldOps::min_scalar(const ScalarField& a, float_t b, ScalarField& out) {
    require_same_mesh(a, out, "FieldOps::min_scalar");
    for (int_t i = 0; i < a.size(); ++i) out[i] = std::min(a[i], b);
}

void FieldOps::max_scalar(const ScalarField& a, float_t b, ScalarField& out) {
    require_same_mesh(a, out, "FieldOps::max_scalar");
    for (int_t i = 0; i < a.size(); ++i) out[i] = std::max(a[i], b);
}

void FieldOps::min_field(const ScalarField& a, const ScalarField& b, ScalarField& out) {
    require_same_mesh(a, b, "FieldOps::min_field");
    require_same_mesh(a, out, "FieldOps::min_field");
    for (int_t i = 0; i < a.size(); ++i) out[i] = std::min(a[i], b[i]);
}

void FieldOps::clamp(const ScalarField& a, float_t lo, float_t hi, ScalarField& out) {
    require_same_mesh(a, out, "FieldOps::clamp");
    for (int_t i = 0; i < a.size(); ++i) out[i] = std::min(std::max(a[i], lo), hi);
}

double FieldOps::sum(const ScalarField& a) {
    double total = 0.0;
    for (float_t v : a) total += v;
    return total;
}

float_t FieldOps::min_value(const ScalarField& a) {
    float_t result = std::numeric_limits<float_t>::infinity();
    for (float_t v : a) result = std::min(result, v);
    return result;
}

float_t FieldOps::max_value(const ScalarField& a) {
    float_t result = -std::numeric_limits<float_t>::infinity();
    for (float_t v : a) result = std::max(result, v);
    return result;
}

void FieldOps::magnitude(const VectorField& a, ScalarField& out) {
    require_same_mesh(a, out, "FieldOps::magnitude");
    for (int_t i = 0; i < a.size(); ++i) out[i] = length(a[i]);
}

void FieldOps::cross(const VectorField& a, const VectorField& b, VectorField& out) {
    require_same_mesh(a, b, "FieldOps::cross");
    require_same_mesh(a, out, "FieldOps::cross");
    for (int_t i = 0; i < a.size(); ++i) out[i] = ::cross(a[i], b[i]);
}

void FieldOps::positions(const Mesh& mesh, VectorField& out) {
    require_mesh(out, mesh, "FieldOps::positions");
    for (int_t i = 0; i < mesh.get_ncells(); ++i) out[i] = mesh.position(i);
}

void FieldOps::neighbor_average(const ScalarField& a, ScalarField& out) {
    require_same_mesh(a, out, "FieldOps::neighbor_average");
    if (&a == &out) {
        throw std::invalid_argument("FieldOps::neighbor_average: output must not alias input");
    }
    const Mesh& mesh = a.get_mesh();
    for (int_t c = 0; c < mesh.get_ncells(); ++c) {
        const int_t n = mesh.neighbors_of(c);
        if (n == 0) {
            out[c] = a[c];
            continue;
        }
        float_t total = 0.0f;
        for (const int_t* nb = mesh.neighbors_begin(c); nb != mesh.neighbors_end(c); ++nb) {
            total += a[*nb];
        }
        out[c] = total / static_cast<float_t>(n);
    }
}

void FieldOps::average_difference(const ScalarField& a, ScalarField& out) {
    require_same_mesh(a, out, "FieldOps::average_difference");
    if (&a == &out) {
        throw std::invalid_argument("FieldOps::average_difference: output must not alias input");
    }
    const Mesh& mesh = a.get_mesh();
    for (int_t c = 0; c < mesh.get_ncells(); ++c) {
        const int_t n = mesh.neighbors_of(c);
        float_t total = 0.0f;
        for (const int_t* nb = mesh.neighbors_begin(c); nb != mesh.neighbors_end(c); ++nb) {
            total += a[c] - a[*nb];
        }
        out[c] = n > 0 ? total / static_cast<float_t>(n) : 0.0f;
    }
}

void FieldOps::diffusion_by_constant(const ScalarField& a, float_t k, ScalarField& out, ScalarField& scratch) {
    require_same_mesh(a, out, "FieldOps::diffusion_by_constant");
    require_same_mesh(a, scratch, "FieldOps::diffusion_by_constant");
    if (&scratch == &a || &scratch == &out) {
        throw std::invalid_argument("FieldOps::diffusion_by_constant: scratch must not alias input or output");
    }
    neighbor_average(a, scratch);
    for (int_t i = 0; i < a.size(); ++i) {
        out[i] = a[i] + k * (scratch[i] - a[i]);
    }
}

void FieldOps::gradient(const ScalarField& a, VectorField& out) {
    require_same_mesh(a, out, "FieldOps::gradient");
    const Mesh& mesh = a.get_mesh();
    fill(out, Float3());

    for (const auto& arrow : mesh.get_arrows()) {
        const Float3 d = mesh.position(arrow.to) - mesh.position(arrow.from);
        const float_t d2 = dot(d, d);
        if (d2 <= 0.0f) continue;
        out[arrow.from] += d * ((a[arrow.to] - a[arrow.from]) / d2);
    }

    for (int_t c = 0; c < mesh.get_ncells(); ++c) {
        const int_t n = mesh.neighbors_of(c);
        if (n > 0) out[c] *= 1.0f / static_cast<float_t>(n);
    }
}
