#pragma once
#include "Field.hpp"

// Морфология бинарных масок по смежности сетки. Радиус задаётся в "шагах"
// по рёбрам. out может совпадать со входом.
class BinaryMorphology {
public:
    static void dilation(const MaskField& a, int radius, MaskField& out);
    static void erosion(const MaskField& a, int radius, MaskField& out);
    static void closing(const MaskField& a, int radius, MaskField& out);
    static void opening(const MaskField& a, int radius, MaskField& out);

    static void union_(const MaskField& a, const MaskField& b, MaskField& out);
    static void intersection(const MaskField& a, const MaskField& b, MaskField& out);
    // a AND NOT b
    static void difference(const MaskField& a, const MaskField& b, MaskField& out);
    static void negation(const MaskField& a, MaskField& out);

    static int_t count(const MaskField& a);
};
