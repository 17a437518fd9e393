#include "BinaryMorphology.hpp"
#include <vector>

namespace {

// Один проход: dilate=true -> OR по соседям, иначе AND по соседям
void morph_pass(const Mesh& mesh, const std::vector<std::uint8_t>& in, std::vector<std::uint8_t>& out, bool dilate) {
    for (int_t c = 0; c < mesh.get_ncells(); ++c) {
        std::uint8_t v = in[c];
        for (const int_t* nb = mesh.neighbors_begin(c); nb != mesh.neighbors_end(c); ++nb) {
            if (dilate) {
                if (in[*nb]) { v = 1; break; }
            } else {
                if (!in[*nb]) { v = 0; break; }
            }
        }
        out[c] = v;
    }
}

void morph(const MaskField& a, int radius, MaskField& out, bool dilate, const char* op) {
    require_same_mesh(a, out, op);
    const Mesh& mesh = a.get_mesh();

    std::vector<std::uint8_t> curr(a.begin(), a.end());
    std::vector<std::uint8_t> next(curr.size());
    for (int i = 0; i < radius; ++i) {
        morph_pass(mesh, curr, next, dilate);
        curr.swap(next);
    }
    for (int_t c = 0; c < a.size(); ++c) out[c] = curr[c] ? 1 : 0;
}

} // namespace

void BinaryMorphology::dilation(const MaskField& a, int radius, MaskField& out) {
    morph(a, radius, out, true, "BinaryMorphology::dilation");
}

void BinaryMorphology::erosion(const MaskField& a, int radius, MaskField& out) {
    morph(a, radius, out, false, "BinaryMorphology::erosion");
}

void BinaryMorphology::closing(const MaskField& a, int radius, MaskField& out) {
    dilation(a, radius, out);
    erosion(out, radius, out);
}

void BinaryMorphology::opening(const MaskField& a, int radius, MaskField& out) {
    erosion(a, radius, out);
    dilation(out, radius, out);
}

void BinaryMorphology::union_(const MaskField& a, const MaskField& b, MaskField& out) {
    require_same_mesh(a, b, "BinaryMorphology::union_");
    require_same_mesh(a, out, "BinaryMorphology::union_");
    for (int_t i = 0; i < a.size(); ++i) out[i] = (a[i] || b[i]) ? 1 : 0;
}

void BinaryMorphology::intersection(const MaskField& a, const MaskField& b, MaskField& out) {
    require_same_mesh(a, b, "BinaryMorphology::intersection");
    require_same_mesh(a, out, "BinaryMorphology::intersection");
    for (int_t i = 0; i < a.size(); ++i) out[i] = (a[i] && b[i]) ? 1 : 0;
}

void BinaryMorphology::difference(const MaskField& a, const MaskField& b, MaskField& out) {
    require_same_mesh(a, b, "BinaryMorphology::difference");
    require_same_mesh(a, out, "BinaryMorphology::difference");
    for (int_t i = 0; i < a.size(); ++i) out[i] = (a[i] && !b[i]) ? 1 : 0;
}

void BinaryMorphology::negation(const MaskField& a, MaskField& out) {
    require_same_mesh(a, out, "BinaryMorphology::negation");
    for (int_t i = 0; i < a.size(); ++i) out[i] = a[i] ? 0 : 1;
}

int_t BinaryMorphology::count(const MaskField& a) {
    int_t n = 0;
    for (std::uint8_t v : a) n += v ? 1 : 0;
    return n;
}
