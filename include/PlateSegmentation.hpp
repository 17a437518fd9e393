#pragma once
#include "Config.hpp"
#include "Field.hpp"

// Разбиение векторного поля (скорости) на плиты.
//
// segment(): пока не набрано target_segment_count областей и остаются свободные ячейки,
// берём свободную ячейку с наибольшим |v| (при равенстве с меньшим индексом) и
// заливаем в ширину соседей, чей вектор близок к среднему вектору области
// (косинус > similarity_threshold). Область меньше min_segment_size отбрасывается:
// её ячейки остаются с меткой 0, затравка больше не участвует, остальные ячейки
// могут войти в следующие области. Иначе область получает следующую метку 1, 2, ...
//
// plate_map(): segment() и затем для каждой метки по возрастанию: дилатация и замыкание
// маски с вычитанием ячеек других плит. Меньшая метка выигрывает спорные ячейки.
class PlateSegmentation {
private:
    SegmentationParams params;

public:
    PlateSegmentation(const SegmentationParams& params_ = SegmentationParams());

    const SegmentationParams& get_params() const { return params; }

    // Возвращает число созданных областей
    int segment(const VectorField& velocity, int target_segment_count, int min_segment_size,
                LabelField& labels) const;

    int plate_map(const VectorField& velocity, int target_segment_count, int min_segment_size,
                  LabelField& labels) const;

    // Морфологическая очистка меток 1..plate_count
    void smooth_boundaries(LabelField& labels, int plate_count) const;

    // Косинус угла; два нулевых вектора считаются совпадающими
    static float_t similarity(const Float3& a, const Float3& b);
};
