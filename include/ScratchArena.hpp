#pragma once
#include "Field.hpp"
#include <memory>
#include <string>
#include <utility>
#include <vector>

// Пул временных скалярных полей одной сетки. Поля выдаются внутри именованной
// области (allocate/deallocate), области вкладываются как стек.
// Нарушение порядка бросает std::logic_error.
class ScratchArena {
private:
    const Mesh* mesh;
    std::vector<std::unique_ptr<ScalarField>> pool;
    size_t in_use;
    // имя области и значение in_use на момент открытия
    std::vector<std::pair<std::string, size_t>> scopes;

public:
    explicit ScratchArena(const Mesh& mesh_) : mesh(&mesh_), in_use(0) {}

    ScratchArena(const ScratchArena&) = delete;
    ScratchArena& operator=(const ScratchArena&) = delete;

    const Mesh& get_mesh() const { return *mesh; }

    void allocate(const std::string& name);
    void deallocate(const std::string& name);

    // Поле не обнуляется; действительно до закрытия текущей области
    ScalarField& get_scalar_field();

    bool is_open(const std::string& name) const;
    size_t depth() const { return scopes.size(); }
    size_t fields_in_use() const { return in_use; }
    size_t pool_size() const { return pool.size(); }

    // RAII-обёртка над allocate/deallocate
    class Scope {
    private:
        ScratchArena& arena;
        std::string name;

    public:
        Scope(ScratchArena& arena_, const std::string& name_) : arena(arena_), name(name_) {
            arena.allocate(name);
        }
        ~Scope() { arena.deallocate(name); }

        Scope(const Scope&) = delete;
        Scope& operator=(const Scope&) = delete;

        ScalarField& get_scalar_field() { return arena.get_scalar_field(); }
    };
};
