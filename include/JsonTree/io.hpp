#pragma once

#include <iterator>

namespace JsonTree {

// Iterator you can read as *it (convertible to char) and advance with ++it.
// Single-pass iterators (std::istreambuf_iterator) are fine: the tokenizer
// never looks back more than one character and buffers that itself.
template <class It>
concept CharInputIterator =
    std::input_iterator<It> &&
    std::convertible_to<std::iter_reference_t<It>, char>;

// Matching "end" type you can compare as it == end / it != end.
template <class It, class Sent>
concept CharSentinelFor =
    CharInputIterator<It> &&
    std::sentinel_for<Sent, It>;

} // namespace JsonTree
