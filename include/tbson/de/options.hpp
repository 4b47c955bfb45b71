#pragma once

namespace tbson {

/// The default limit on the nesting of documents and arrays while decoding
inline constexpr unsigned default_max_depth = 200;

namespace de {

/**
 * @brief Options that control a decoding session
 */
struct options {
    /**
     * @brief Whether the session presents itself as human-readable. Leaf types
     * such as `object_id` and `uuid` use this to choose between their textual and
     * compact representations.
     */
    bool human_readable = true;
    /**
     * @brief The deepest nesting of documents and arrays that will be entered.
     * Exceeding it fails the decode with `raw_errc::depth_exceeded`.
     */
    unsigned max_depth = default_max_depth;
};

}  // namespace de

}  // namespace tbson
