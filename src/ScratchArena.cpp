#include "ScratchArena.hpp"
#include <memory>
#include <stdexcept>

void ScratchArena::allocate(const std::string& name) {
    if (is_open(name)) {
        throw std::logic_error("ScratchArena: scope '" + name + "' is already open");
    }
    scopes.push_back(std::make_pair(name, in_use));
}

void ScratchArena::deallocate(const std::string& name) {
    if (scopes.empty() || scopes.back().first != name) {
        throw std::logic_error("ScratchArena: scope '" + name + "' is not the innermost open scope");
    }
    in_use = scopes.back().second;
    scopes.pop_back();
}

ScalarField& ScratchArena::get_scalar_field() {
    if (scopes.empty()) {
        throw std::logic_error("ScratchArena: no open scope");
    }
    if (in_use == pool.size()) {
        pool.push_back(std::make_unique<ScalarField>(*mesh));
    }
    return *pool[in_use++];
}

bool ScratchArena::is_open(const std::string& name) const {
    for (const auto& s : scopes) {
        if (s.first == name) return true;
    }
    return false;
}
