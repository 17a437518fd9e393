#pragma once
#include "Mesh.hpp"
#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

// Поле: одно значение на ячейку сетки. Сетка хранится по адресу,
// два поля совместимы только если ссылаются на один и тот же объект Mesh.
template <typename T>
class Field {
private:
    const Mesh* mesh;
    std::vector<T> values;

public:
    typedef T value_type;

    explicit Field(const Mesh& mesh_, T value = T())
        : mesh(&mesh_), values(mesh_.get_ncells(), value) {}

    const Mesh& get_mesh() const { return *mesh; }
    int_t size() const { return static_cast<int_t>(values.size()); }

    T& operator[](int_t i) { return values[i]; }
    const T& operator[](int_t i) const { return values[i]; }

    T* data() { return values.data(); }
    const T* data() const { return values.data(); }

    typename std::vector<T>::iterator begin() { return values.begin(); }
    typename std::vector<T>::iterator end() { return values.end(); }
    typename std::vector<T>::const_iterator begin() const { return values.begin(); }
    typename std::vector<T>::const_iterator end() const { return values.end(); }
};

typedef Field<float_t> ScalarField;
typedef Field<Float3> VectorField;
typedef Field<std::uint8_t> MaskField;
typedef Field<int_t> LabelField;

template <typename A, typename B>
inline void require_same_mesh(const Field<A>& a, const Field<B>& b, const char* op) {
    if (&a.get_mesh() != &b.get_mesh()) {
        throw std::invalid_argument(std::string(op) + ": fields are defined over different meshes");
    }
}

template <typename T>
inline void require_mesh(const Field<T>& a, const Mesh& mesh, const char* op) {
    if (&a.get_mesh() != &mesh) {
        throw std::invalid_argument(std::string(op) + ": field is defined over a different mesh");
    }
}
