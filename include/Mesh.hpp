#pragma once
#include "Types.hpp"
#include <vector>

// Класс Mesh: топология сетки (ячейки + направленные рёбра "arrows").
// После построения не изменяется; поля ссылаются на сетку по адресу.
class Mesh {
public:
    // направленное ребро from -> to; каждое проходимое направление хранится отдельно
    struct Arrow {
        int_t from;
        int_t to;
    };

private:
    int_t ncells;

    std::vector<Float3> positions;     // size = ncells
    std::vector<Arrow> arrows;
    std::vector<int_t> neighbor_count; // size = ncells

    // CSR-индекс: соседи ячейки c лежат в neighbors[offsets[c] .. offsets[c+1])
    std::vector<int_t> offsets;        // size = ncells + 1
    std::vector<int_t> neighbors;      // size = arrows.size()

    void build_adjacency();

public:
    // Произвольная топология. Бросает std::invalid_argument, если индекс ребра
    // выходит за [0, ncells).
    Mesh(const std::vector<Float3>& positions_, const std::vector<Arrow>& arrows_);

    // Периодическая прямоугольная сетка nx*ny (4 соседа), центры ячеек в плоскости z=0.
    Mesh(int_t nx, int_t ny, Float3 min, Float3 max);

    // поля хранят адрес сетки: копирование запрещено, перемещать можно только до создания полей
    Mesh(const Mesh&) = delete;
    Mesh& operator=(const Mesh&) = delete;
    Mesh(Mesh&&) = default;
    ~Mesh() = default;

    int_t get_ncells() const { return ncells; }
    int_t get_narrows() const { return static_cast<int_t>(arrows.size()); }

    const std::vector<Arrow>& get_arrows() const { return arrows; }
    const std::vector<Float3>& get_positions() const { return positions; }
    const std::vector<int_t>& get_neighbor_count() const { return neighbor_count; }
    const std::vector<int_t>& get_offsets() const { return offsets; }
    const std::vector<int_t>& get_neighbors() const { return neighbors; }

    const Float3& position(int_t cell) const { return positions[cell]; }
    int_t neighbors_of(int_t cell) const { return neighbor_count[cell]; }
    const int_t* neighbors_begin(int_t cell) const { return neighbors.data() + offsets[cell]; }
    const int_t* neighbors_end(int_t cell) const { return neighbors.data() + offsets[cell + 1]; }
};
