#include "PlateSegmentation.hpp"
#include "BinaryMorphology.hpp"
#include "FieldOps.hpp"
#include <deque>
#include <stdexcept>
#include <vector>

PlateSegmentation::PlateSegmentation(const SegmentationParams& params_) : params(params_) {
    if (!(params.similarity_threshold >= -1.0f && params.similarity_threshold <= 1.0f)) {
        throw std::invalid_argument("PlateSegmentation: similarity threshold must lie in [-1, 1]");
    }
    if (params.morphology_radius < 0) {
        throw std::invalid_argument("PlateSegmentation: morphology radius must be non-negative");
    }
}

float_t PlateSegmentation::similarity(const Float3& a, const Float3& b) {
    const float_t la = length(a);
    const float_t lb = length(b);
    if (la == 0.0f && lb == 0.0f) return 1.0f;
    if (la == 0.0f || lb == 0.0f) return 0.0f;
    return dot(a, b) / (la * lb);
}

int PlateSegmentation::segment(const VectorField& velocity, int target_segment_count, int min_segment_size,
                               LabelField& labels) const
{
    if (target_segment_count <= 0) {
        throw std::invalid_argument("PlateSegmentation::segment: target segment count must be positive");
    }
    if (min_segment_size <= 0) {
        throw std::invalid_argument("PlateSegmentation::segment: minimum segment size must be positive");
    }
    require_same_mesh(velocity, labels, "PlateSegmentation::segment");

    const Mesh& mesh = velocity.get_mesh();
    const int_t ncells = mesh.get_ncells();

    std::vector<float_t> magnitude(ncells);
    for (int_t i = 0; i < ncells; ++i) magnitude[i] = length(velocity[i]);

    // 1 = ячейка ещё может стать затравкой или войти в область
    std::vector<std::uint8_t> available(ncells, 1);
    FieldOps::fill(labels, 0);

    std::vector<int_t> region;
    std::deque<int_t> queue;
    int regions = 0;

    while (regions < target_segment_count) {
        int_t seed = -1;
        for (int_t i = 0; i < ncells; ++i) {
            if (available[i] && (seed < 0 || magnitude[i] > magnitude[seed])) seed = i;
        }
        if (seed < 0) break;

        region.clear();
        queue.clear();
        available[seed] = 0;
        region.push_back(seed);
        queue.push_back(seed);
        Float3 representative = velocity[seed];

        while (!queue.empty()) {
            const int_t c = queue.front();
            queue.pop_front();
            for (const int_t* nb = mesh.neighbors_begin(c); nb != mesh.neighbors_end(c); ++nb) {
                if (!available[*nb]) continue;
                if (similarity(velocity[*nb], representative) <= params.similarity_threshold) continue;
                available[*nb] = 0;
                region.push_back(*nb);
                queue.push_back(*nb);
                representative += velocity[*nb];
            }
        }

        // мелкая область считается шумом: метка 0; затравка выбывает,
        // остальные ячейки снова доступны для следующих областей
        if (static_cast<int>(region.size()) < min_segment_size) {
            for (int_t c : region) {
                if (c != seed) available[c] = 1;
            }
            continue;
        }

        ++regions;
        for (int_t c : region) labels[c] = regions;
    }

    return regions;
}

void PlateSegmentation::smooth_boundaries(LabelField& labels, int plate_count) const {
    const Mesh& mesh = labels.get_mesh();
    MaskField segment(mesh);
    MaskField is_empty(mesh);
    MaskField is_occupied(mesh);

    const int radius = params.morphology_radius;
    for (int id = 1; id <= plate_count; ++id) {
        FieldOps::eq_scalar(labels, id, segment);
        FieldOps::eq_scalar(labels, 0, is_empty);
        FieldOps::ne_scalar(labels, id, is_occupied);
        BinaryMorphology::difference(is_occupied, is_empty, is_occupied);
        BinaryMorphology::dilation(segment, radius, segment);
        BinaryMorphology::closing(segment, radius, segment);
        BinaryMorphology::difference(segment, is_occupied, segment);
        FieldOps::fill_into_selection(labels, id, segment, labels);
    }
}

int PlateSegmentation::plate_map(const VectorField& velocity, int target_segment_count, int min_segment_size,
                                 LabelField& labels) const
{
    const int regions = segment(velocity, target_segment_count, min_segment_size, labels);
    smooth_boundaries(labels, regions);
    return regions;
}
