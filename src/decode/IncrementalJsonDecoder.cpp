#include "IncrementalJsonDecoder.hpp"

#include <cctype>
#include <iterator>
#include <stdexcept>

namespace b2core {

json::value parse_json(std::string_view text) {
    boost::system::error_code ec;
    json::value jv = json::parse(text, ec);
    if (ec) {
        throw DecodeError("malformed JSON: " + ec.message());
    }
    return jv;
}

JsonElementScanner::JsonElementScanner(std::uint32_t level, std::size_t capacity)
    : capacity_(capacity), level_(level) {
    if (level == 0) {
        throw std::invalid_argument("JsonElementScanner: level must be at least 1");
    }
}

void JsonElementScanner::push(std::span<const std::uint8_t> bytes) {
    buffer_.insert(buffer_.end(), bytes.begin(), bytes.end());
}

void JsonElementScanner::push(std::string_view bytes) {
    buffer_.insert(buffer_.end(), bytes.begin(), bytes.end());
}

std::string JsonElementScanner::take_element() {
    std::string element;
    element.reserve(capacity_);

    auto end = buffer_.begin() + static_cast<std::ptrdiff_t>(cursor_ - 1);
    element.assign(buffer_.begin(), end);
    buffer_.erase(buffer_.begin(), buffer_.begin() + static_cast<std::ptrdiff_t>(cursor_));
    cursor_ = 0;
    return element;
}

std::optional<std::string> JsonElementScanner::next_element() {
    while (cursor_ < buffer_.size()) {
        const char c = buffer_[cursor_];

        // Outside the target container nothing is kept. The cursor is 0 here.
        if (depth_ < level_) {
            buffer_.pop_front();
        } else {
            ++cursor_;
        }

        if (in_string_) {
            if (last_was_escape_) {
                last_was_escape_ = false;
            } else if (c == '"') {
                in_string_ = false;
            } else if (c == '\\') {
                last_was_escape_ = true;
            }
            continue;
        }

        switch (c) {
            case '[':
            case '{':
                ++depth_;
                just_opened_ = depth_ == level_;
                break;

            case ',':
                just_opened_ = false;
                if (depth_ == level_) {
                    return take_element();
                }
                break;

            case '"':
                just_opened_ = false;
                in_string_ = true;
                break;

            case ']':
            case '}':
                if (depth_ == 0) {
                    throw DecodeError("unbalanced JSON: closing bracket without opener");
                }
                --depth_;
                if (depth_ == level_ - 1) {
                    if (!just_opened_) {
                        return take_element();
                    }
                    // Empty container: drop the whitespace and bracket scanned so far.
                    buffer_.erase(buffer_.begin(),
                                  buffer_.begin() + static_cast<std::ptrdiff_t>(cursor_));
                    cursor_ = 0;
                }
                just_opened_ = false;
                break;

            default:
                if (!std::isspace(static_cast<unsigned char>(c))) {
                    just_opened_ = false;
                }
                break;
        }
    }
    return std::nullopt;
}

}  // namespace b2core
