#pragma once

#include <algorithm>
#include <charconv>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <memory>
#include <ratio>
#include <string>
#include <string_view>
#include <system_error>
#include <type_traits>
#include <utility>
#include <vector>

#include "decimal.hpp"
#include "errors.hpp"
#include "node.hpp"
#include "options.hpp"
#include "registry.hpp"
#include "static_schema.hpp"
#include "struct_fields.hpp"
#include "type_name.hpp"
#include "value.hpp"

namespace JsonTree {

namespace decoder_detail {

using namespace static_schema;

template<class T>
DecodeResult cannotConvert(DecodeError err, const Node & node) {
    return DecodeResult(err, "can't convert " + std::string(node.type()) + " to " + std::string(type_name<T>()));
}

template<class T>
DecodeResult cannotConvert(DecodeError err, std::string_view from) {
    return DecodeResult(err, "can't convert " + std::string(from) + " to " + std::string(type_name<T>()));
}

// The node as a shared handle. Nodes built outside a NodePtr are copied;
// their children are shared either way.
inline NodePtr nodeHandle(const Node & node) {
    if(NodePtr self = node.weak_from_this().lock()) {
        return self;
    }
    return std::make_shared<const Node>(node);
}

template<class Bytes>
void assignBytes(Bytes & dst, const std::uint8_t * data, std::size_t size) {
    using E = typename Bytes::value_type;
    dst.clear();
    dst.reserve(size);
    for(std::size_t i = 0; i < size; i ++) {
        dst.push_back(static_cast<E>(data[i]));
    }
}

// from_chars with an optional leading '+' for signed targets. The whole
// text must be consumed.
template<class I>
DecodeResult parseInteger(std::string_view text, I & out) {
    std::string_view digits = text;
    if constexpr (std::is_signed_v<I>) {
        if(!digits.empty() && digits.front() == '+') {
            digits.remove_prefix(1);
            if(!digits.empty() && digits.front() == '-') {
                digits = {};
            }
        }
    }
    I value{};
    auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), value);
    if(ec == std::errc::result_out_of_range) {
        return DecodeResult(DecodeError::NUMBER_OUT_OF_RANGE,
                            "value " + std::string(text) + " out of range for " + std::string(type_name<I>()));
    }
    if(ec != std::errc{} || ptr != digits.data() + digits.size() || digits.empty()) {
        return DecodeResult(DecodeError::ILLFORMED_NUMBER, "invalid number '" + std::string(text) + "'");
    }
    out = value;
    return {};
}

// ============================================================================
// Number nodes
// ============================================================================

template<class T>
DecodeResult decodeNumber(const Decimal & num, const Node & node, T & dst) {
    if constexpr (BigIntDestination<T>) {
        auto value = num.toBigInt();
        if(!value) {
            return DecodeResult(DecodeError::NUMBER_OUT_OF_RANGE, "number " + num.toString() + " too large for BigInt");
        }
        dst = std::move(*value);
    } else if constexpr (DecimalDestination<T>) {
        dst = num;
    } else if constexpr (TimestampDestination<T>) {
        using Duration = typename T::duration;
        const std::int64_t seconds = num.toInt64();
        if constexpr (std::ratio_less_v<typename Duration::period, std::ratio<1>>) {
            constexpr auto maxSeconds = std::chrono::duration_cast<std::chrono::seconds>(Duration::max()).count();
            constexpr auto minSeconds = std::chrono::duration_cast<std::chrono::seconds>(Duration::min()).count();
            if(seconds > maxSeconds || seconds < minSeconds) {
                return DecodeResult(DecodeError::NUMBER_OUT_OF_RANGE, "timestamp " + num.toString() + " out of range");
            }
        }
        dst = T(std::chrono::duration_cast<Duration>(std::chrono::seconds(seconds)));
    } else if constexpr (BoolDestination<T>) {
        dst = !num.isZero();
    } else if constexpr (EnumDestination<T>) {
        std::underlying_type_t<T> raw{};
        if(auto r = decodeNumber(num, node, raw); !r) return r;
        dst = static_cast<T>(raw);
    } else if constexpr (IntegerDestination<T> && std::is_signed_v<T>) {
        dst = static_cast<T>(num.toInt64());
    } else if constexpr (IntegerDestination<T>) {
        dst = static_cast<T>(num.toUint64());
    } else if constexpr (FloatDestination<T>) {
        dst = static_cast<T>(num.toDouble());
    } else if constexpr (TextDestination<T>) {
        dst = num.toString();
    } else {
        return cannotConvert<T>(DecodeError::CANNOT_CONVERT_NUMBER, node);
    }
    return {};
}

// ============================================================================
// String nodes
// ============================================================================

template<class T>
DecodeResult decodeQuotedValue(const std::string & s, T & dst) {
    if constexpr (BigIntDestination<T>) {
        auto value = BigInt::parse(s);
        if(!value) return DecodeResult(DecodeError::ILLFORMED_NUMBER, "invalid number '" + s + "'");
        dst = std::move(*value);
        return {};
    } else if constexpr (DecimalDestination<T>) {
        auto value = Decimal::parse(s);
        if(!value) return DecodeResult(DecodeError::ILLFORMED_NUMBER, "invalid number '" + s + "'");
        dst = std::move(*value);
        return {};
    } else if constexpr (BoolDestination<T>) {
        if(s == "true") {
            dst = true;
        } else if(s == "false") {
            dst = false;
        } else {
            return DecodeResult(DecodeError::ILLFORMED_BOOL, "invalid boolean '" + s + "'");
        }
        return {};
    } else if constexpr (EnumDestination<T>) {
        std::underlying_type_t<T> raw{};
        if(auto r = parseInteger(s, raw); !r) return r;
        dst = static_cast<T>(raw);
        return {};
    } else if constexpr (IntegerDestination<T>) {
        return parseInteger(s, dst);
    } else {
        return cannotConvert<T>(DecodeError::CANNOT_CONVERT_STRING, "string");
    }
}

template<class T>
DecodeResult decodeString(const std::string & s, T & dst, const DecodeOptions & opt) {
    if constexpr (TextDecodable<T>) {
        DecodeResult r = dst.decodeText(s);
        if(!r) return std::move(r).wrap(DecodeError::TEXT_DECODER_ERROR);
        return {};
    } else if constexpr (TextDestination<T> || ByteSequenceDestination<T>) {
        std::shared_ptr<const Encoding> enc;
        if(auto r = resolveEncoding(opt, enc); !r) return r;
        if(!enc && ByteSequenceDestination<T> && !opt.asString) {
            enc = encodings::base64();
        }
        if(!enc) {
            if constexpr (TextDestination<T>) {
                dst = s;
            } else {
                assignBytes(dst, reinterpret_cast<const std::uint8_t *>(s.data()), s.size());
            }
            return {};
        }
        std::vector<std::uint8_t> bytes;
        if(auto r = enc->decode(s, bytes); !r) return r;
        if constexpr (TextDestination<T>) {
            dst.assign(bytes.begin(), bytes.end());
        } else {
            assignBytes(dst, bytes.data(), bytes.size());
        }
        return {};
    } else {
        if(!opt.asString) {
            return cannotConvert<T>(DecodeError::CANNOT_CONVERT_STRING, "string");
        }
        return decodeQuotedValue(s, dst);
    }
}

// ============================================================================
// Boolean nodes
// ============================================================================

template<class T>
DecodeResult decodeBool(bool b, const Node & node, T & dst) {
    if constexpr (BoolDestination<T>) {
        dst = b;
    } else if constexpr (TextDestination<T>) {
        dst = b ? "true" : "false";
    } else if constexpr (IntegerDestination<T> || FloatDestination<T> || EnumDestination<T>) {
        dst = static_cast<T>(b ? 1 : 0);
    } else {
        return cannotConvert<T>(DecodeError::CANNOT_CONVERT_BOOLEAN, node);
    }
    return {};
}

// ============================================================================
// Object nodes
// ============================================================================

template<class T>
DecodeResult decodeObject(const Object & obj, T & dst, const DecodeOptions & opt) {
    if constexpr (RecordDestination<T>) {
        const auto & table = struct_fields::FieldTable<T>::get();
        for(const auto & [key, child] : obj) {
            const auto * field = table.find(key);
            if(field == nullptr) {
                if(opt.context.disallowUnknownFields) {
                    return DecodeResult(DecodeError::UNDEFINED_FIELD,
                                        "undefined field '" + key + "': " + std::string(type_name<T>()));
                }
                continue;
            }
            DecodeOptions fieldOpt = childOptions(opt);
            applyFieldOptions(fieldOpt, field->options);
            if(auto r = field->decode(dst, *child, fieldOpt); !r) {
                return std::move(r).at(key);
            }
        }
        return {};
    } else if constexpr (MapDestination<T>) {
        if constexpr (!TextDestination<typename T::key_type>) {
            return DecodeResult(DecodeError::MAP_KEY_MUST_BE_STRING,
                                "map key must be std::string, got " + std::string(type_name<typename T::key_type>()));
        } else {
            T fresh;
            for(const auto & [key, child] : obj) {
                typename T::mapped_type value{};
                if(auto r = decodeValue(*child, value, childOptions(opt)); !r) {
                    return std::move(r).at(key);
                }
                fresh.insert_or_assign(key, std::move(value));
            }
            dst = std::move(fresh);
            return {};
        }
    } else {
        return DecodeResult(DecodeError::STRUCT_OR_MAP_EXPECTED,
                            "struct or map expected, got " + std::string(type_name<T>()));
    }
}

// ============================================================================
// Array nodes
// ============================================================================

template<class T>
DecodeResult decodeArray(const Array & arr, T & dst, const DecodeOptions & opt) {
    if constexpr (FixedSequenceDestination<T>) {
        // Extra elements are dropped; missing ones keep their value.
        const std::size_t n = std::min(arr.size(), dst.size());
        for(std::size_t i = 0; i < n; i ++) {
            if(auto r = decodeValue(*arr[i], dst[i], childOptions(opt)); !r) {
                return std::move(r).at(i);
            }
        }
        return {};
    } else if constexpr (SequenceDestination<T>) {
        T fresh;
        if constexpr (requires { fresh.reserve(arr.size()); }) {
            fresh.reserve(arr.size());
        }
        for(std::size_t i = 0; i < arr.size(); i ++) {
            typename T::value_type value{};
            if(auto r = decodeValue(*arr[i], value, childOptions(opt)); !r) {
                return std::move(r).at(i);
            }
            fresh.push_back(std::move(value));
        }
        dst = std::move(fresh);
        return {};
    } else {
        return DecodeResult(DecodeError::SEQUENCE_EXPECTED,
                            "slice or array expected, got " + std::string(type_name<T>()));
    }
}

// ============================================================================
// Extension points
// ============================================================================

template<class Handle>
DecodeResult decodeAbstract(const Node & node, Handle & dst, const DecodeOptions & opt) {
    using I = typename smart_pointer_traits<Handle>::element_type;
    auto ctor = opt.context.typeRegistry().template lookup<I>();
    if(!ctor) {
        return cannotConvert<I>(DecodeError::INCOMPATIBLE_TYPES, node);
    }
    Context ctx = opt.context;
    ctx.depth = opt.depth;
    std::unique_ptr<I> made;
    DecodeResult r = (*ctor)(node, ctx, made);
    if(!r) return std::move(r).wrap(DecodeError::USER_TYPE_ERROR);
    if(!made) {
        return DecodeResult(DecodeError::USER_TYPE_ERROR,
                            "constructor for " + std::string(type_name<I>()) + " produced no value");
    }
    dst = std::move(made);
    return {};
}

template<class T>
DecodeResult decodeWithHook(const Node & node, T & dst, const DecodeOptions & opt) {
    DecodeResult r;
    if constexpr (NodeDecodableWithContext<T>) {
        Context ctx = opt.context;
        ctx.depth = opt.depth;
        r = dst.decodeJson(node, ctx);
    } else {
        r = dst.decodeJson(node);
    }
    if(!r) return std::move(r).wrap(DecodeError::DECODER_HOOK_ERROR);
    return {};
}

// No concrete type named: the node's own kind picks one.
inline DecodeResult decodeDynamic(const Node & node, Value & dst, const DecodeOptions & opt) {
    switch(node.kind()) {
    case NodeKind::Number: {
        double d = 0;
        if(auto r = decodeNumber(*node.asNumber(), node, d); !r) return r;
        dst = Value(d);
        return {};
    }
    case NodeKind::String: {
        std::string s;
        if(auto r = decodeString(*node.asString(), s, opt); !r) return r;
        dst = Value(std::move(s));
        return {};
    }
    case NodeKind::Object: {
        Value::Object o;
        if(auto r = decodeObject(*node.asObject(), o, opt); !r) return r;
        dst = Value(std::move(o));
        return {};
    }
    case NodeKind::Array: {
        Value::Array a;
        if(auto r = decodeArray(*node.asArray(), a, opt); !r) return r;
        dst = Value(std::move(a));
        return {};
    }
    case NodeKind::Boolean:
        dst = Value(*node.asBool());
        return {};
    case NodeKind::Null:
        dst = Value();
        return {};
    }
    return {};
}

template<class T>
DecodeResult decodeValue(const Node & node, T & dst, const DecodeOptions & opt) {
    static_assert(!std::is_pointer_v<T>,
                  "[[[ JsonTree ]]] raw pointers do not own their target; use std::unique_ptr, std::shared_ptr or std::optional");
    static_assert(!std::is_const_v<T>, "[[[ JsonTree ]]] destination is const");

    if constexpr (is_annotated_v<T>) {
        return decodeValue(node, dst.value, opt);
    } else {
        if(opt.depth > opt.context.maxDepth) {
            return DecodeResult(DecodeError::NESTING_TOO_DEEP,
                                "nesting deeper than " + std::to_string(opt.context.maxDepth));
        }
        if(node.isNull()) {
            dst = T{};
            return {};
        }

        if constexpr (NodeDestination<T>) {
            dst = nodeHandle(node);
            return {};
        } else if constexpr (AbstractHandle<T>) {
            return decodeAbstract(node, dst, opt);
        } else if constexpr (ValueDestination<T>) {
            return decodeDynamic(node, dst, opt);
        } else if constexpr (NullableDestination<T>) {
            return decodeValue(node, detail::ensureAllocated(dst), opt);
        } else if constexpr (NodeDecodable<T>) {
            return decodeWithHook(node, dst, opt);
        } else {
            switch(node.kind()) {
            case NodeKind::Number:  return decodeNumber(*node.asNumber(), node, dst);
            case NodeKind::String:  return decodeString(*node.asString(), dst, opt);
            case NodeKind::Object:  return decodeObject(*node.asObject(), dst, opt);
            case NodeKind::Array:   return decodeArray(*node.asArray(), dst, opt);
            case NodeKind::Boolean: return decodeBool(*node.asBool(), node, dst);
            case NodeKind::Null:    break;
            }
            return {};
        }
    }
}

} // namespace decoder_detail

template<class T, class... Opts>
DecodeResult Node::decode(T && dst, Opts && ... opts) const {
    using D = std::remove_reference_t<T>;
    DecodeOptions o;
    applyOptions(o, opts...);
    o.depth = o.context.depth;

    if constexpr (std::is_pointer_v<std::remove_cv_t<D>>) {
        using Target = std::remove_pointer_t<std::remove_cv_t<D>>;
        if constexpr (std::is_const_v<Target>) {
            return DecodeResult(DecodeError::POINTER_EXPECTED,
                                "destination " + std::string(type_name<D>()) + " is read-only");
        } else {
            if(dst == nullptr) {
                return DecodeResult(DecodeError::NIL_DESTINATION,
                                    "nil destination of type " + std::string(type_name<D>()));
            }
            return decoder_detail::decodeValue(*this, *dst, o);
        }
    } else if constexpr (!std::is_lvalue_reference_v<T> || std::is_const_v<D>) {
        return DecodeResult(DecodeError::POINTER_EXPECTED,
                            "destination " + std::string(type_name<D>()) + " is not writable");
    } else {
        return decoder_detail::decodeValue(*this, dst, o);
    }
}

// Same as node.decode(dst, opts...).
template<class T, class... Opts>
DecodeResult Decode(const Node & node, T && dst, Opts && ... opts) {
    return node.decode(std::forward<T>(dst), std::forward<Opts>(opts)...);
}

} // namespace JsonTree
