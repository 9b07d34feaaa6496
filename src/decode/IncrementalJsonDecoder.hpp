#pragma once

#include <cstddef>
#include <cstdint>
#include <deque>
#include <exception>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>

#include "Error.hpp"
#include "Types.hpp"

namespace b2core {

/**
 * @brief Parses a complete JSON document.
 * @throws DecodeError if the text is not valid JSON.
 */
json::value parse_json(std::string_view text);

/**
 * @brief Parses `text` and converts it with `json::value_to<T>`.
 * @throws DecodeError on malformed JSON or when the value does not match `T`.
 */
template <typename T>
T decode_json(std::string_view text) {
    json::value jv = parse_json(text);
    if constexpr (std::is_same_v<T, json::value>) {
        return jv;
    } else {
        try {
            return json::value_to<T>(jv);
        } catch (const std::exception& e) {
            throw DecodeError(std::string("unexpected JSON shape: ") + e.what());
        }
    }
}

// ============================================================================
// JsonElementScanner
// ============================================================================

/**
 * @brief Finds the byte spans of the elements of a JSON array (or object) nested
 * `level` deep, as the bytes arrive.
 *
 * @details
 * Only brackets, braces, quotes, escapes and commas are looked at; the spans themselves
 * are validated when they are parsed. Bytes in front of the target container (the
 * `{"files": ` of a wrapped list, say) are dropped as soon as they are scanned, so the
 * buffer never holds more than the element currently being received.
 *
 * Feeding the same bytes in any split yields the same spans.
 */
class JsonElementScanner {
   public:
    /**
     * @param level 1 for a bare array, 2 for a list wrapped in an object, and so on.
     * @param capacity Bytes reserved up front for one element.
     * @throws std::invalid_argument if level is 0.
     */
    explicit JsonElementScanner(std::uint32_t level, std::size_t capacity = 0);

    void push(std::span<const std::uint8_t> bytes);
    void push(std::string_view bytes);

    /**
     * @brief Text of the next complete element, or nullopt if more bytes are needed.
     * @throws DecodeError on a close bracket that has no opener.
     */
    std::optional<std::string> next_element();

    std::size_t buffered() const noexcept { return buffer_.size(); }
    std::uint32_t level() const noexcept { return level_; }

    // True when every container that was opened has been closed again.
    bool balanced() const noexcept { return depth_ == 0 && !in_string_; }

   private:
    // Moves the first `cursor_ - 1` bytes out as an element and drops the delimiter.
    std::string take_element();

    std::deque<char> buffer_;
    std::size_t capacity_;
    std::uint32_t level_;
    std::uint32_t depth_ = 0;
    std::size_t cursor_ = 0;
    bool in_string_ = false;
    bool last_was_escape_ = false;
    bool just_opened_ = false;
};

// ============================================================================
// IncrementalJsonDecoder
// ============================================================================

/**
 * @brief Decodes the elements of a JSON list one at a time while the body is still
 * arriving.
 *
 * Usage: `push()` every chunk, then call `next()` until it returns nullopt.
 */
template <typename T>
class IncrementalJsonDecoder {
   public:
    explicit IncrementalJsonDecoder(std::uint32_t level, std::size_t capacity = 0)
        : scanner_(level, capacity) {}

    void push(std::span<const std::uint8_t> bytes) { scanner_.push(bytes); }
    void push(std::string_view bytes) { scanner_.push(bytes); }

    /**
     * @brief The next element, or nullopt if the buffered bytes do not hold one yet.
     * @throws DecodeError on malformed structure or an element that does not match T.
     */
    std::optional<T> next() {
        auto element = scanner_.next_element();
        if (!element) return std::nullopt;
        return decode_json<T>(*element);
    }

    std::size_t buffered() const noexcept { return scanner_.buffered(); }
    bool balanced() const noexcept { return scanner_.balanced(); }

   private:
    JsonElementScanner scanner_;
};

}  // namespace b2core
