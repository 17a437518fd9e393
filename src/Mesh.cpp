#include "Mesh.hpp"
#include <stdexcept>
#include <string>

Mesh::Mesh(const std::vector<Float3>& positions_, const std::vector<Arrow>& arrows_)
    : ncells(static_cast<int_t>(positions_.size())), positions(positions_), arrows(arrows_)
{
    for (size_t i = 0; i < arrows.size(); ++i) {
        const Arrow& a = arrows[i];
        if (a.from < 0 || a.from >= ncells || a.to < 0 || a.to >= ncells) {
            throw std::invalid_argument("Mesh: arrow " + std::to_string(i) + " (" +
                                        std::to_string(a.from) + " -> " + std::to_string(a.to) +
                                        ") is out of range for " + std::to_string(ncells) + " cells");
        }
    }
    build_adjacency();
}

Mesh::Mesh(int_t nx, int_t ny, Float3 min, Float3 max)
{
    // при nx или ny < 3 периодические соседи совпадают
    if (nx < 3 || ny < 3) {
        throw std::invalid_argument("Mesh: periodic grid needs at least 3x3 cells");
    }

    ncells = nx * ny;
    const float_t hx = (max.x - min.x) / static_cast<float_t>(nx);
    const float_t hy = (max.y - min.y) / static_cast<float_t>(ny);

    positions.resize(ncells);
    arrows.reserve(4 * ncells);

    for (int_t j = 0; j < ny; ++j) {
        for (int_t i = 0; i < nx; ++i) {
            const int_t c = j * nx + i;
            positions[c] = Float3(min.x + (i + 0.5f) * hx,
                                  min.y + (j + 0.5f) * hy,
                                  0.0f);

            // left, right, bottom, top
            arrows.push_back({c, j * nx + (i - 1 + nx) % nx});
            arrows.push_back({c, j * nx + (i + 1) % nx});
            arrows.push_back({c, ((j - 1 + ny) % ny) * nx + i});
            arrows.push_back({c, ((j + 1) % ny) * nx + i});
        }
    }

    build_adjacency();
}

void Mesh::build_adjacency()
{
    neighbor_count.assign(ncells, 0);
    for (const auto& a : arrows) {
        ++neighbor_count[a.from];
    }

    offsets.assign(ncells + 1, 0);
    for (int_t c = 0; c < ncells; ++c) {
        offsets[c + 1] = offsets[c] + neighbor_count[c];
    }

    // порядок соседей внутри ячейки совпадает с порядком рёбер
    neighbors.resize(arrows.size());
    std::vector<int_t> cursor(offsets.begin(), offsets.end() - 1);
    for (const auto& a : arrows) {
        neighbors[cursor[a.from]++] = a.to;
    }
}
