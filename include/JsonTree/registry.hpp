#pragma once

#include <functional>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <typeindex>
#include <unordered_map>
#include <utility>

#include "errors.hpp"
#include "node.hpp"
#include "options.hpp"
#include "type_name.hpp"

namespace JsonTree {

// Builds a concrete value for the abstract destination I from a node.
// The constructor usually inspects a discriminator field, allocates the
// matching implementation and decodes the node into it under ctx.
template<class I>
using Constructor = std::function<DecodeResult(const Node &, const Context &, std::unique_ptr<I> &)>;

// Abstract type -> constructor table. Populated at startup, read
// concurrently by decoding threads.
class TypeRegistry {
public:
    TypeRegistry() = default;
    TypeRegistry(const TypeRegistry &) = delete;
    TypeRegistry & operator=(const TypeRegistry &) = delete;

    static TypeRegistry & global() {
        static TypeRegistry instance;
        return instance;
    }

    // Throws std::logic_error if I already has a constructor.
    template<class I, class Fn>
    void registerType(Fn && fn) {
        static_assert(std::is_abstract_v<I>,
                      "[[[ JsonTree ]]] user types are registered against an abstract class");
        static_assert(std::is_invocable_r_v<DecodeResult, Fn&, const Node &, const Context &, std::unique_ptr<I> &>,
                      "[[[ JsonTree ]]] constructor must be callable as DecodeResult(const Node&, const Context&, std::unique_ptr<I>&)");

        auto ctor = std::make_shared<const Constructor<I>>(std::forward<Fn>(fn));
        std::unique_lock lock(m_mutex);
        auto [it, inserted] = m_constructors.try_emplace(std::type_index(typeid(I)), std::move(ctor));
        if(!inserted) {
            throw std::logic_error("JsonTree: user type " + std::string(type_name<I>()) + " is already registered");
        }
    }

    // Deduces I from a plain function.
    template<class I>
    void registerType(DecodeResult (*fn)(const Node &, const Context &, std::unique_ptr<I> &)) {
        if(fn == nullptr) {
            throw std::logic_error("JsonTree: null constructor for " + std::string(type_name<I>()));
        }
        registerType<I>(Constructor<I>(fn));
    }

    // nullptr when I has no constructor
    template<class I>
    std::shared_ptr<const Constructor<I>> lookup() const {
        std::shared_lock lock(m_mutex);
        auto it = m_constructors.find(std::type_index(typeid(I)));
        if(it == m_constructors.end()) return nullptr;
        return std::static_pointer_cast<const Constructor<I>>(it->second);
    }

private:
    mutable std::shared_mutex m_mutex;
    std::unordered_map<std::type_index, std::shared_ptr<const void>> m_constructors;
};

inline TypeRegistry & Context::typeRegistry() const {
    return types ? *types : TypeRegistry::global();
}

} // namespace JsonTree
