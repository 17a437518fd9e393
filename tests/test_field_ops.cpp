#include <gtest/gtest.h>

#include "FieldOps.hpp"
#include "test_support.hpp"

#include <stdexcept>

TEST(FieldOpsTest, ElementwiseArithmeticAllowsAliasing) {
    Mesh mesh = test_support::make_ring(4);
    ScalarField a(mesh), b(mesh);
    for (int_t i = 0; i < 4; ++i) { a[i] = static_cast<float_t>(i); b[i] = 2.0f; }

    FieldOps::mult(a, b, a);
    EXPECT_FLOAT_EQ(a[3], 6.0f);

    FieldOps::sub_scalar(a, 1.0f, a);
    FieldOps::max_scalar(a, 0.0f, a);
    EXPECT_FLOAT_EQ(a[0], 0.0f);
    EXPECT_FLOAT_EQ(a[1], 1.0f);

    FieldOps::clamp(a, 0.5f, 3.0f, a);
    EXPECT_FLOAT_EQ(a[0], 0.5f);
    EXPECT_FLOAT_EQ(a[3], 3.0f);
}

TEST(FieldOpsTest, DivisionByZeroYieldsZero) {
    Mesh mesh = test_support::make_ring(3);
    ScalarField a(mesh, 4.0f), b(mesh, 2.0f), out(mesh);
    b[1] = 0.0f;

    FieldOps::div(a, b, out);
    EXPECT_FLOAT_EQ(out[0], 2.0f);
    EXPECT_FLOAT_EQ(out[1], 0.0f);
}

TEST(FieldOpsTest, RejectsFieldsOfDifferentMeshes) {
    // одинаковая длина, разные объекты сетки
    Mesh first = test_support::make_ring(4);
    Mesh second = test_support::make_ring(4);
    ScalarField a(first), b(second), out(first);

    EXPECT_THROW(FieldOps::add(a, b, out), std::invalid_argument);
    EXPECT_THROW(FieldOps::copy(b, out), std::invalid_argument);
}

TEST(FieldOpsTest, Reductions) {
    Mesh mesh = test_support::make_line(4);
    ScalarField a(mesh);
    a[0] = -1.0f; a[1] = 2.0f; a[2] = 0.5f; a[3] = 3.5f;

    EXPECT_DOUBLE_EQ(FieldOps::sum(a), 5.0);
    EXPECT_FLOAT_EQ(FieldOps::min_value(a), -1.0f);
    EXPECT_FLOAT_EQ(FieldOps::max_value(a), 3.5f);
}

TEST(FieldOpsTest, NeighborAverageAndAverageDifference) {
    Mesh mesh = test_support::make_line(3);
    ScalarField a(mesh), out(mesh);
    a[0] = 0.0f; a[1] = 3.0f; a[2] = 9.0f;

    FieldOps::neighbor_average(a, out);
    EXPECT_FLOAT_EQ(out[0], 3.0f);
    EXPECT_FLOAT_EQ(out[1], 4.5f);
    EXPECT_FLOAT_EQ(out[2], 3.0f);

    FieldOps::average_difference(a, out);
    EXPECT_FLOAT_EQ(out[0], -3.0f);
    EXPECT_FLOAT_EQ(out[1], -1.5f);
    EXPECT_FLOAT_EQ(out[2], 6.0f);

    EXPECT_THROW(FieldOps::neighbor_average(a, a), std::invalid_argument);
}

TEST(FieldOpsTest, DiffusionByConstant) {
    Mesh mesh = test_support::make_line(3);
    ScalarField a(mesh), out(mesh), scratch(mesh);
    a[0] = 0.0f; a[1] = 4.0f; a[2] = 0.0f;

    FieldOps::diffusion_by_constant(a, 0.5f, out, scratch);
    EXPECT_FLOAT_EQ(out[0], 2.0f);
    EXPECT_FLOAT_EQ(out[1], 2.0f);
    EXPECT_FLOAT_EQ(out[2], 2.0f);

    EXPECT_THROW(FieldOps::diffusion_by_constant(a, 1.0f, out, a), std::invalid_argument);
}

TEST(FieldOpsTest, GradientOfLinearField) {
    Mesh mesh = test_support::make_line(5);
    ScalarField a(mesh);
    VectorField grad(mesh);
    for (int_t i = 0; i < 5; ++i) a[i] = 2.0f * i + 1.0f;

    FieldOps::gradient(a, grad);
    for (int_t i = 0; i < 5; ++i) {
        EXPECT_FLOAT_EQ(grad[i].x, 2.0f);
        EXPECT_FLOAT_EQ(grad[i].y, 0.0f);
        EXPECT_FLOAT_EQ(grad[i].z, 0.0f);
    }
}

TEST(FieldOpsTest, MagnitudeCrossAndPositions) {
    Mesh mesh = test_support::make_line(2, 1.0f);
    VectorField v(mesh, Float3(3.0f, 4.0f, 0.0f));
    VectorField pos(mesh), out(mesh);
    ScalarField mag(mesh);

    FieldOps::magnitude(v, mag);
    EXPECT_FLOAT_EQ(mag[0], 5.0f);

    FieldOps::positions(mesh, pos);
    EXPECT_FLOAT_EQ(pos[1].x, 1.0f);
    EXPECT_FLOAT_EQ(pos[1].y, 1.0f);

    FieldOps::cross(v, pos, out);
    // (3,4,0) x (1,1,0) = (0,0,-1)
    EXPECT_FLOAT_EQ(out[1].x, 0.0f);
    EXPECT_FLOAT_EQ(out[1].y, 0.0f);
    EXPECT_FLOAT_EQ(out[1].z, -1.0f);
}

TEST(FieldOpsTest, MasksAndSelection) {
    Mesh mesh = test_support::make_ring(5);
    LabelField labels(mesh);
    labels[0] = 1; labels[1] = 2; labels[2] = 1;
    MaskField eq(mesh), ne(mesh);

    FieldOps::eq_scalar(labels, 1, eq);
    FieldOps::ne_scalar(labels, 0, ne);
    EXPECT_EQ(eq[0], 1);
    EXPECT_EQ(eq[1], 0);
    EXPECT_EQ(eq[2], 1);
    EXPECT_EQ(ne[1], 1);
    EXPECT_EQ(ne[4], 0);

    FieldOps::fill_into_selection(labels, 7, eq, labels);
    EXPECT_EQ(labels[0], 7);
    EXPECT_EQ(labels[1], 2);
    EXPECT_EQ(labels[2], 7);
    EXPECT_EQ(labels[3], 0);
}
