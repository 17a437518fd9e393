#include <gtest/gtest.h>

#include "Mesh.hpp"
#include "test_support.hpp"

#include <stdexcept>
#include <vector>

TEST(MeshTest, PeriodicGridHasFourNeighborsPerCell) {
    Mesh mesh(5, 4, Float3(0, 0, 0), Float3(5, 4, 0));

    ASSERT_EQ(mesh.get_ncells(), 20);
    EXPECT_EQ(mesh.get_narrows(), 80);
    for (int_t c = 0; c < mesh.get_ncells(); ++c) {
        EXPECT_EQ(mesh.neighbors_of(c), 4);
    }

    // центр ячейки (1, 2)
    EXPECT_FLOAT_EQ(mesh.position(2 * 5 + 1).x, 1.5f);
    EXPECT_FLOAT_EQ(mesh.position(2 * 5 + 1).y, 2.5f);
}

TEST(MeshTest, PeriodicGridWrapsAround) {
    Mesh mesh(4, 3, Float3(0, 0, 0), Float3(4, 3, 0));

    // ячейка (0, 0): left, right, bottom, top
    std::vector<int_t> nb(mesh.neighbors_begin(0), mesh.neighbors_end(0));
    ASSERT_EQ(nb.size(), 4u);
    EXPECT_EQ(nb[0], 3);
    EXPECT_EQ(nb[1], 1);
    EXPECT_EQ(nb[2], 8);
    EXPECT_EQ(nb[3], 4);
}

TEST(MeshTest, NeighborCountMatchesArrows) {
    Mesh mesh = test_support::make_line(6);

    std::vector<int_t> counted(mesh.get_ncells(), 0);
    for (const auto& a : mesh.get_arrows()) ++counted[a.from];

    for (int_t c = 0; c < mesh.get_ncells(); ++c) {
        EXPECT_EQ(mesh.neighbors_of(c), counted[c]);
        EXPECT_EQ(mesh.neighbors_end(c) - mesh.neighbors_begin(c), counted[c]);
    }
    EXPECT_EQ(mesh.neighbors_of(0), 1);
    EXPECT_EQ(mesh.neighbors_of(3), 2);
}

TEST(MeshTest, AdjacencyPreservesArrowOrder) {
    std::vector<Float3> positions(3);
    std::vector<Mesh::Arrow> arrows = {{1, 2}, {0, 2}, {1, 0}, {2, 1}};
    Mesh mesh(positions, arrows);

    std::vector<int_t> nb1(mesh.neighbors_begin(1), mesh.neighbors_end(1));
    ASSERT_EQ(nb1.size(), 2u);
    EXPECT_EQ(nb1[0], 2);
    EXPECT_EQ(nb1[1], 0);
    EXPECT_EQ(mesh.get_offsets().back(), 4);
}

TEST(MeshTest, RejectsArrowOutOfRange) {
    std::vector<Float3> positions(3);
    std::vector<Mesh::Arrow> bad_to = {{0, 1}, {1, 3}};
    std::vector<Mesh::Arrow> bad_from = {{-1, 0}};

    EXPECT_THROW(Mesh(positions, bad_to), std::invalid_argument);
    EXPECT_THROW(Mesh(positions, bad_from), std::invalid_argument);
}

TEST(MeshTest, RejectsDegenerateGrid) {
    EXPECT_THROW(Mesh(2, 5, Float3(0, 0, 0), Float3(1, 1, 0)), std::invalid_argument);
    EXPECT_THROW(Mesh(5, 1, Float3(0, 0, 0), Float3(1, 1, 0)), std::invalid_argument);
}

TEST(MeshTest, CellWithoutArrowsIsIsolated) {
    std::vector<Float3> positions(3);
    std::vector<Mesh::Arrow> arrows = {{0, 1}, {1, 0}};
    Mesh mesh(positions, arrows);

    EXPECT_EQ(mesh.neighbors_of(2), 0);
    EXPECT_EQ(mesh.neighbors_begin(2), mesh.neighbors_end(2));
}
