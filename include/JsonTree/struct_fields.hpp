#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <string_view>
#include <type_traits>
#include <unordered_map>
#include <utility>
#include <vector>

#include "errors.hpp"
#include "node.hpp"
#include "options.hpp"
#include "static_schema.hpp"
#include "struct_introspection.hpp"
#include "type_name.hpp"

namespace JsonTree {

namespace decoder_detail {
template<class T>
DecodeResult decodeValue(const Node & node, T & dst, const DecodeOptions & opt);
}

namespace detail {

// Target of a nullable slot, allocated on first use.
template<class N>
auto & ensureAllocated(N & slot) {
    using U = typename static_schema::nullable_traits<N>::element_type;
    if(!slot) {
        if constexpr (static_schema::is_specialization_of_v<N, std::optional>) {
            slot.emplace();
        } else if constexpr (static_schema::is_specialization_of_v<N, std::unique_ptr>) {
            slot = std::make_unique<U>();
        } else {
            slot = std::make_shared<U>();
        }
    }
    return *slot;
}

} // namespace detail

namespace struct_fields {

template<class Root>
using FieldDecodeFn = DecodeResult (*)(Root &, const Node &, const DecodeOptions &);

template<class Root>
struct FieldEntry {
    std::string_view name;
    std::size_t depth = 0;       // 0 for Root's own members, +1 per embedding
    FieldOptions options;
    FieldDecodeFn<Root> decode = nullptr;
};

// Walks the member path P... from S down to the field, allocating nullable
// embedded records on the way.
template<class S, std::size_t... P>
struct SlotWalker;

template<class S, std::size_t I>
struct SlotWalker<S, I> {
    static DecodeResult decode(S & s, const Node & node, const DecodeOptions & o) {
        return decoder_detail::decodeValue(node, introspection::getStructElementByIndex<I>(s), o);
    }
};

template<class S, std::size_t I, std::size_t Next, std::size_t... Rest>
struct SlotWalker<S, I, Next, Rest...> {
    using Meta = static_schema::annotation_meta_getter<introspection::structureElementTypeByIndex<I, S>>;
    using Member = typename Meta::value_t;
    using Inner = typename static_schema::embedded_record<Member>::type;

    static DecodeResult decode(S & s, const Node & node, const DecodeOptions & o) {
        Member & member = Meta::getRef(introspection::getStructElementByIndex<I>(s));
        if constexpr (static_schema::NullableDestination<Member>) {
            Inner & inner = detail::ensureAllocated(member);
            return SlotWalker<Inner, Next, Rest...>::decode(inner, node, o);
        } else {
            return SlotWalker<Inner, Next, Rest...>::decode(member, node, o);
        }
    }
};

template<class Root>
struct Collected {
    std::vector<FieldEntry<Root>> fields;
    std::vector<std::string_view> cycles;   // records reached again through embedding
};

template<class Root, class S, class Path, class... Visited>
struct Collector;

// Depth-first over S's members. Visited holds the records on the current
// embedding chain; embedding one of them again is a cycle and is not
// followed.
template<class Root, class S, std::size_t... P, class... Visited>
struct Collector<Root, S, std::index_sequence<P...>, Visited...> {
    static void run(Collected<Root> & out) {
        [&]<std::size_t... I>(std::index_sequence<I...>) {
            (one<I>(out), ...);
        }(std::make_index_sequence<introspection::structureElementsCount<S>>{});
    }

    template<std::size_t I>
    static void one(Collected<Root> & out) {
        using Meta = static_schema::annotation_meta_getter<introspection::structureElementTypeByIndex<I, S>>;
        using Member = typename Meta::value_t;
        using Embed = static_schema::embedded_record<Member>;
        static constexpr FieldTag tag = parseFieldTag(Meta::tag);

        if constexpr (tag.ignored) {
            return;
        } else if constexpr (Meta::embedded && tag.name.empty() && Embed::value) {
            using Inner = typename Embed::type;
            if constexpr ((std::is_same_v<Inner, Visited> || ...)) {
                out.cycles.push_back(type_name<Inner>());
            } else {
                Collector<Root, Inner, std::index_sequence<P..., I>, Visited..., Inner>::run(out);
            }
        } else {
            constexpr std::string_view declared = introspection::structureElementNameByIndex<I, S>;
            static_assert(!tag.name.empty() || !declared.empty(),
                          "[[[ JsonTree ]]] StructMeta fields need a name in their tag");
            out.fields.push_back(FieldEntry<Root>{
                tag.name.empty() ? declared : tag.name,
                sizeof...(P),
                FieldOptions::parse(tag.options),
                &SlotWalker<Root, P..., I>::decode
            });
        }
    }
};

// Flattened field set of a record: own members plus promoted members of
// embedded records. When several members map to one name the shallowest
// wins; at equal depth the first declared wins.
template<class Root>
class FieldTable {
public:
    static const FieldTable & get() {
        static const FieldTable table;
        return table;
    }

    // nullptr when no member is named key
    const FieldEntry<Root> * find(std::string_view key) const {
        auto it = m_index.find(key);
        if(it == m_index.end()) return nullptr;
        return &m_entries[it->second];
    }

    const std::vector<FieldEntry<Root>> & entries() const { return m_entries; }

    // Embedded records skipped because they were already on the path.
    const std::vector<std::string_view> & cycles() const { return m_cycles; }

private:
    FieldTable() {
        Collected<Root> all;
        Collector<Root, Root, std::index_sequence<>, Root>::run(all);
        m_cycles = std::move(all.cycles);

        for(auto & entry : all.fields) {
            auto it = m_index.find(entry.name);
            if(it == m_index.end()) {
                m_index.emplace(entry.name, m_entries.size());
                m_entries.push_back(std::move(entry));
            } else if(entry.depth < m_entries[it->second].depth) {
                m_entries[it->second] = std::move(entry);
            }
        }
    }

    std::vector<FieldEntry<Root>> m_entries;
    std::vector<std::string_view> m_cycles;
    std::unordered_map<std::string_view, std::size_t> m_index;
};

} // namespace struct_fields

} // namespace JsonTree
