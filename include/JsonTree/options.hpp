#pragma once

#include <concepts>
#include <cstddef>
#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "encoding.hpp"
#include "errors.hpp"

#ifndef JSONTREE_DEFAULT_MAX_DEPTH
#define JSONTREE_DEFAULT_MAX_DEPTH 512
#endif

namespace JsonTree {

class TypeRegistry;

// Call-wide policy. Copied unchanged into every nested decode unless an
// option replaces it explicitly.
struct Context {
    bool disallowUnknownFields = false;
    TypeRegistry * types = nullptr;          // nullptr: TypeRegistry::global()
    EncodingRegistry * encodings = nullptr;  // nullptr: EncodingRegistry::global()
    std::size_t maxDepth = JSONTREE_DEFAULT_MAX_DEPTH;
    std::size_t depth = 0;                   // nesting level of the node being handed to an extension

    TypeRegistry & typeRegistry() const;     // registry.hpp
    EncodingRegistry & encodingRegistry() const {
        return encodings ? *encodings : EncodingRegistry::global();
    }
};

// Per-node configuration. Options are applied left to right; scalar fields
// are overwritten, element options accumulate.
struct DecodeOptions {
    Context context;
    bool asString = false;
    std::shared_ptr<const Encoding> encoding;
    std::string encodingName;                // looked up in context.encodings when used
    std::shared_ptr<const DecodeOptions> elem;
    std::size_t depth = 0;

    // Element options are shared between copies, so edits go to a fresh copy.
    DecodeOptions & element() {
        auto fresh = elem ? std::make_shared<DecodeOptions>(*elem) : std::make_shared<DecodeOptions>();
        DecodeOptions & ref = *fresh;
        elem = std::move(fresh);
        return ref;
    }
};

template<class O>
concept DecodeOption = std::invocable<O&, DecodeOptions&>;

template<class... Opts>
    requires (DecodeOption<Opts> && ...)
void applyOptions(DecodeOptions & o, Opts && ... opts) {
    (std::invoke(opts, o), ...);
}

// Options for a container element or a struct field: the parent's element
// options (one level only) under the parent's context.
inline DecodeOptions childOptions(const DecodeOptions & parent) {
    DecodeOptions child;
    if(parent.elem) {
        child = *parent.elem;
        child.elem.reset();
    }
    child.context = parent.context;
    child.depth = parent.depth + 1;
    return child;
}

// Explicit scheme if any, else the named one. Unknown names are an error.
inline DecodeResult resolveEncoding(const DecodeOptions & o, std::shared_ptr<const Encoding> & out) {
    out = o.encoding;
    if(out || o.encodingName.empty()) {
        return {};
    }
    out = o.context.encodingRegistry().lookup(o.encodingName);
    if(!out) {
        return DecodeResult(DecodeError::UNKNOWN_ENCODING, "unknown encoding '" + o.encodingName + "'");
    }
    return {};
}

namespace options {

inline void as_string(DecodeOptions & o) {
    o.asString = true;
}

inline void disallow_unknown_fields(DecodeOptions & o) {
    o.context.disallowUnknownFields = true;
}

inline auto encoding(std::string name) {
    return [name = std::move(name)](DecodeOptions & o) {
        o.encoding.reset();
        o.encodingName = name;
    };
}

inline auto encoding(std::shared_ptr<const Encoding> scheme) {
    return [scheme = std::move(scheme)](DecodeOptions & o) {
        o.encoding = scheme;
        o.encodingName.clear();
    };
}

inline auto types(TypeRegistry & registry) {
    return [&registry](DecodeOptions & o) {
        o.context.types = &registry;
    };
}

inline auto encodings(EncodingRegistry & registry) {
    return [&registry](DecodeOptions & o) {
        o.context.encodings = &registry;
    };
}

inline auto context(const Context & ctx) {
    return [ctx](DecodeOptions & o) {
        o.context = ctx;
    };
}

inline auto max_depth(std::size_t depth) {
    return [depth](DecodeOptions & o) {
        o.context.maxDepth = depth;
    };
}

// Applies opts to container elements, one level down.
template<class... Opts>
    requires (DecodeOption<Opts> && ...)
auto element(Opts... opts) {
    return [=](DecodeOptions & o) {
        DecodeOptions & e = o.element();
        (std::invoke(opts, e), ...);
    };
}

} // namespace options

// ============================================================================
// Field tags: "name,opt1,opt2,..."
// ============================================================================

struct FieldTag {
    std::string_view name;
    bool ignored = false;
    std::string_view options;   // everything after the first comma
};

constexpr FieldTag parseFieldTag(std::string_view tag) {
    FieldTag out;
    const std::size_t comma = tag.find(',');
    out.name = tag.substr(0, comma);
    if(comma != std::string_view::npos) {
        out.options = tag.substr(comma + 1);
    }
    out.ignored = out.name == "-";
    return out;
}

struct ScopedFieldOptions {
    bool asString = false;
    std::vector<std::string_view> encodings;   // candidates in tag order

    bool empty() const { return !asString && encodings.empty(); }
};

// Tag options after parsing. "[x]" scopes x to container elements.
// Names that are not "string" are kept as encoding candidates and resolved
// against the active registry; unregistered ones are ignored.
struct FieldOptions {
    ScopedFieldOptions self;
    ScopedFieldOptions element;

    static FieldOptions parse(std::string_view text) {
        FieldOptions out;
        while(!text.empty()) {
            const std::size_t comma = text.find(',');
            std::string_view opt = text.substr(0, comma);
            text = comma == std::string_view::npos ? std::string_view{} : text.substr(comma + 1);

            ScopedFieldOptions * scope = &out.self;
            if(opt.size() >= 2 && opt.front() == '[' && opt.back() == ']') {
                opt = opt.substr(1, opt.size() - 2);
                scope = &out.element;
            }
            if(opt.empty()) continue;
            if(opt == "string") {
                scope->asString = true;
            } else {
                scope->encodings.push_back(opt);
            }
        }
        return out;
    }
};

namespace detail {
inline void applyScopedFieldOptions(DecodeOptions & o, const ScopedFieldOptions & scoped,
                                    const EncodingRegistry & registry) {
    if(scoped.asString) {
        o.asString = true;
    }
    for(std::string_view name : scoped.encodings) {
        if(auto scheme = registry.lookup(name)) {
            o.encoding = std::move(scheme);
            o.encodingName.clear();
        }
    }
}
}

inline void applyFieldOptions(DecodeOptions & o, const FieldOptions & field) {
    const EncodingRegistry & registry = o.context.encodingRegistry();
    detail::applyScopedFieldOptions(o, field.self, registry);
    if(!field.element.empty()) {
        detail::applyScopedFieldOptions(o.element(), field.element, registry);
    }
}

} // namespace JsonTree
