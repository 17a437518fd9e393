#pragma once
#include <cmath>
#include <cstdint>

typedef float float_t;
typedef std::int32_t int_t;

// 3D вектор: позиции ячеек и векторные поля (скорость, угловая скорость)
struct Float3 {
    float_t x, y, z;
    Float3(float_t x = 0, float_t y = 0, float_t z = 0) : x(x), y(y), z(z) {}

    Float3& operator+=(const Float3& o) { x += o.x; y += o.y; z += o.z; return *this; }
    Float3& operator-=(const Float3& o) { x -= o.x; y -= o.y; z -= o.z; return *this; }
    Float3& operator*=(float_t s) { x *= s; y *= s; z *= s; return *this; }
};

inline Float3 operator+(Float3 a, const Float3& b) { return a += b; }
inline Float3 operator-(Float3 a, const Float3& b) { return a -= b; }
inline Float3 operator*(Float3 a, float_t s) { return a *= s; }
inline Float3 operator*(float_t s, Float3 a) { return a *= s; }

inline bool operator==(const Float3& a, const Float3& b) {
    return a.x == b.x && a.y == b.y && a.z == b.z;
}
inline bool operator!=(const Float3& a, const Float3& b) { return !(a == b); }

inline float_t dot(const Float3& a, const Float3& b) {
    return a.x*b.x + a.y*b.y + a.z*b.z;
}

inline Float3 cross(const Float3& a, const Float3& b) {
    return Float3(a.y*b.z - a.z*b.y,
                  a.z*b.x - a.x*b.z,
                  a.x*b.y - a.y*b.x);
}

inline float_t length(const Float3& a) { return std::sqrt(dot(a, a)); }
