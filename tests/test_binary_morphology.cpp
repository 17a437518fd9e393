#include <gtest/gtest.h>

#include "BinaryMorphology.hpp"
#include "test_support.hpp"

namespace {

MaskField single_cell(const Mesh& mesh, int_t cell) {
    MaskField m(mesh);
    m[cell] = 1;
    return m;
}

} // namespace

TEST(BinaryMorphologyTest, DilationGrowsByHops) {
    Mesh mesh = test_support::make_line(9);
    MaskField m = single_cell(mesh, 4);

    BinaryMorphology::dilation(m, 2, m);
    EXPECT_EQ(BinaryMorphology::count(m), 5);
    EXPECT_EQ(m[1], 0);
    EXPECT_EQ(m[2], 1);
    EXPECT_EQ(m[6], 1);
    EXPECT_EQ(m[7], 0);
}

TEST(BinaryMorphologyTest, DiamondOnGrid) {
    Mesh mesh(10, 10, Float3(0, 0, 0), Float3(10, 10, 0));
    MaskField m = single_cell(mesh, 55);

    BinaryMorphology::dilation(m, 2, m);
    EXPECT_EQ(BinaryMorphology::count(m), 13);
}

TEST(BinaryMorphologyTest, ErosionShrinks) {
    Mesh mesh = test_support::make_line(9);
    MaskField m(mesh);
    for (int_t i = 2; i <= 6; ++i) m[i] = 1;

    BinaryMorphology::erosion(m, 1, m);
    EXPECT_EQ(BinaryMorphology::count(m), 3);
    EXPECT_EQ(m[2], 0);
    EXPECT_EQ(m[3], 1);
}

TEST(BinaryMorphologyTest, ClosingFillsSmallGap) {
    Mesh mesh = test_support::make_line(11);
    MaskField m(mesh);
    for (int_t i = 2; i <= 8; ++i) m[i] = 1;
    m[5] = 0;

    BinaryMorphology::closing(m, 1, m);
    EXPECT_EQ(m[5], 1);
    EXPECT_EQ(m[1], 0);
    EXPECT_EQ(m[9], 0);
    EXPECT_EQ(BinaryMorphology::count(m), 7);
}

TEST(BinaryMorphologyTest, OpeningRemovesSpeck) {
    Mesh mesh = test_support::make_line(11);
    MaskField m(mesh);
    for (int_t i = 0; i <= 4; ++i) m[i] = 1;
    m[8] = 1;

    BinaryMorphology::opening(m, 1, m);
    EXPECT_EQ(m[8], 0);
    EXPECT_EQ(m[2], 1);
}

TEST(BinaryMorphologyTest, SetOperations) {
    Mesh mesh = test_support::make_ring(4);
    MaskField a(mesh), b(mesh), out(mesh);
    a[0] = 1; a[1] = 1;
    b[1] = 1; b[2] = 1;

    BinaryMorphology::difference(a, b, out);
    EXPECT_EQ(out[0], 1);
    EXPECT_EQ(out[1], 0);
    EXPECT_EQ(out[2], 0);

    BinaryMorphology::union_(a, b, out);
    EXPECT_EQ(BinaryMorphology::count(out), 3);

    BinaryMorphology::intersection(a, b, out);
    EXPECT_EQ(BinaryMorphology::count(out), 1);
    EXPECT_EQ(out[1], 1);

    BinaryMorphology::negation(a, out);
    EXPECT_EQ(out[0], 0);
    EXPECT_EQ(out[3], 1);
}

TEST(BinaryMorphologyTest, ZeroRadiusIsIdentity) {
    Mesh mesh = test_support::make_line(5);
    MaskField m = single_cell(mesh, 2);
    MaskField out(mesh);

    BinaryMorphology::dilation(m, 0, out);
    EXPECT_EQ(BinaryMorphology::count(out), 1);
    EXPECT_EQ(out[2], 1);
}
