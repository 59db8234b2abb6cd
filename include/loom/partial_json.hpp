#pragma once

#include <nlohmann/json.hpp>
#include <cctype>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace loom {

/**
 * @brief Best-effort decoder for JSON text that is still being streamed
 *
 * Accumulates chunks and, after each one, produces the most complete
 * document that the text so far determines. Truncated input is repaired
 * by closing an open value string and any open containers; dangling keys,
 * separators and partially received numbers or literals are dropped until
 * they complete. When no decoding is possible the previous value is kept.
 *
 * Only object and array documents are repaired. Nothing here throws on
 * malformed input.
 *
 * @threadsafety Not thread-safe.
 */
class PartialJsonParser {
public:
    /**
     * @brief Append a chunk and return the current best value.
     *
     * @return The latest successful decoding, or nullopt if none exists yet
     */
    const std::optional<nlohmann::json>& append(std::string_view chunk) {
        buffer_.append(chunk.data(), chunk.size());
        if (auto value = parse(buffer_)) {
            last_ = std::move(value);
        }
        return last_;
    }

    /** @brief Latest successful decoding, or nullopt. */
    const std::optional<nlohmann::json>& current() const { return last_; }

    /** @brief Raw accumulated text. */
    const std::string& buffer() const { return buffer_; }

    void reset() {
        buffer_.clear();
        last_.reset();
    }

    /**
     * @brief Decode a possibly truncated JSON document.
     *
     * @return The parsed value, the repaired value, or nullopt when nothing
     *         can be determined yet
     */
    static std::optional<nlohmann::json> parse(std::string_view text) {
        auto direct = nlohmann::json::parse(text.begin(), text.end(), nullptr, false);
        if (!direct.is_discarded()) {
            return direct;
        }

        auto repaired = repair(text);
        if (!repaired) {
            return std::nullopt;
        }
        auto value = nlohmann::json::parse(*repaired, nullptr, false);
        if (value.is_discarded()) {
            return std::nullopt;
        }
        return value;
    }

    /**
     * @brief Rewrite a truncated object or array prefix into well-formed text.
     *
     * @return The repaired text, or nullopt if the input does not start a
     *         container or is malformed before the truncation point
     */
    static std::optional<std::string> repair(std::string_view text) {
        size_t start = 0;
        while (start < text.size() && is_space(text[start])) {
            ++start;
        }
        if (start == text.size() || (text[start] != '{' && text[start] != '[')) {
            return std::nullopt;
        }

        std::vector<Frame> stack;
        Checkpoint checkpoint;
        bool have_checkpoint = false;

        bool in_string = false;
        bool string_is_key = false;
        bool escape = false;
        size_t escape_start = 0;
        int unicode_remaining = 0;
        size_t unicode_start = 0;
        unsigned unicode_value = 0;
        size_t last_unicode_end = 0;
        unsigned last_unicode_value = 0;
        bool in_literal = false;
        bool top_level_done = false;

        auto commit = [&](size_t pos) {
            checkpoint.length = pos;
            checkpoint.stack = stack;
            have_checkpoint = true;
        };

        // Marks the value that just ended at `pos` as complete.
        auto complete_value = [&](size_t pos) {
            if (stack.empty()) {
                top_level_done = true;
                return;
            }
            stack.back().expect = Expect::CommaOrClose;
            commit(pos);
        };

        auto expects_value = [&]() {
            if (stack.empty()) {
                return !top_level_done;
            }
            const Expect e = stack.back().expect;
            return e == Expect::Value || e == Expect::ValueOrClose;
        };

        bool malformed = false;
        size_t i = start;
        for (; i < text.size() && !malformed && !top_level_done; ++i) {
            const char c = text[i];

            if (in_string) {
                if (unicode_remaining > 0) {
                    if (!std::isxdigit(static_cast<unsigned char>(c))) {
                        malformed = true;
                        break;
                    }
                    unicode_value = unicode_value * 16 + hex_value(c);
                    if (--unicode_remaining == 0) {
                        last_unicode_end = i + 1;
                        last_unicode_value = unicode_value;
                    }
                } else if (escape) {
                    escape = false;
                    if (c == 'u') {
                        unicode_remaining = 4;
                        unicode_start = escape_start;
                        unicode_value = 0;
                    }
                } else if (c == '\\') {
                    escape = true;
                    escape_start = i;
                } else if (c == '"') {
                    in_string = false;
                    if (string_is_key) {
                        stack.back().expect = Expect::Colon;
                    } else {
                        complete_value(i + 1);
                    }
                }
                continue;
            }

            if (in_literal) {
                if (is_literal_char(c)) {
                    continue;
                }
                in_literal = false;
                complete_value(i);
                if (top_level_done) {
                    break;
                }
            }

            if (is_space(c)) {
                continue;
            }

            switch (c) {
                case '{':
                case '[':
                    if (!expects_value()) {
                        malformed = true;
                        break;
                    }
                    stack.push_back(Frame{c, c == '{' ? Expect::KeyOrClose : Expect::ValueOrClose});
                    commit(i + 1);
                    break;

                case '}':
                case ']': {
                    if (stack.empty()) {
                        malformed = true;
                        break;
                    }
                    const Frame& top = stack.back();
                    const bool matches = (c == '}') ? top.open == '{' : top.open == '[';
                    const bool closable = top.expect == Expect::CommaOrClose ||
                                          top.expect == Expect::KeyOrClose ||
                                          top.expect == Expect::ValueOrClose;
                    if (!matches || !closable) {
                        malformed = true;
                        break;
                    }
                    stack.pop_back();
                    complete_value(i + 1);
                    break;
                }

                case ':':
                    if (stack.empty() || stack.back().expect != Expect::Colon) {
                        malformed = true;
                        break;
                    }
                    stack.back().expect = Expect::Value;
                    break;

                case ',':
                    if (stack.empty() || stack.back().expect != Expect::CommaOrClose) {
                        malformed = true;
                        break;
                    }
                    stack.back().expect = stack.back().open == '{' ? Expect::Key : Expect::Value;
                    break;

                case '"':
                    if (!stack.empty() && (stack.back().expect == Expect::Key ||
                                           stack.back().expect == Expect::KeyOrClose)) {
                        string_is_key = true;
                    } else if (expects_value()) {
                        string_is_key = false;
                    } else {
                        malformed = true;
                        break;
                    }
                    in_string = true;
                    escape = false;
                    unicode_remaining = 0;
                    last_unicode_end = 0;
                    break;

                default:
                    if (!expects_value() || !is_literal_char(c)) {
                        malformed = true;
                        break;
                    }
                    in_literal = true;
                    break;
            }
        }

        if (malformed) {
            return std::nullopt;
        }

        if (!top_level_done && in_string && !string_is_key) {
            // Close the open value string, dropping an incomplete escape,
            // a lone high surrogate, or a partial UTF-8 sequence first.
            size_t cut = text.size();
            if (escape) {
                cut = escape_start;
            } else if (unicode_remaining > 0) {
                cut = unicode_start;
            }
            if (last_unicode_end == cut &&
                last_unicode_value >= 0xD800 && last_unicode_value <= 0xDBFF) {
                cut = last_unicode_end - 6;
            }
            cut = trim_partial_utf8(text, cut);

            std::string out(text.substr(0, cut));
            out.push_back('"');
            for (auto it = stack.rbegin(); it != stack.rend(); ++it) {
                out.push_back(it->open == '{' ? '}' : ']');
            }
            return out;
        }

        if (!have_checkpoint) {
            return std::nullopt;
        }

        std::string out(text.substr(0, checkpoint.length));
        for (auto it = checkpoint.stack.rbegin(); it != checkpoint.stack.rend(); ++it) {
            out.push_back(it->open == '{' ? '}' : ']');
        }
        return out;
    }

private:
    enum class Expect {
        KeyOrClose,    ///< Just after '{'
        Key,           ///< After ',' in an object
        Colon,         ///< After a key
        ValueOrClose,  ///< Just after '['
        Value,         ///< After ':' or after ',' in an array
        CommaOrClose   ///< After a complete member
    };

    struct Frame {
        char open;
        Expect expect;
    };

    /** Longest prefix that closes to valid JSON, with the containers open at that point. */
    struct Checkpoint {
        size_t length = 0;
        std::vector<Frame> stack;
    };

    static bool is_space(char c) {
        return c == ' ' || c == '\t' || c == '\n' || c == '\r';
    }

    static bool is_literal_char(char c) {
        return std::isalnum(static_cast<unsigned char>(c)) || c == '-' || c == '+' || c == '.';
    }

    static unsigned hex_value(char c) {
        if (c >= '0' && c <= '9') return static_cast<unsigned>(c - '0');
        if (c >= 'a' && c <= 'f') return static_cast<unsigned>(c - 'a' + 10);
        return static_cast<unsigned>(c - 'A' + 10);
    }

    /** @brief Move `end` back over a UTF-8 sequence that is missing trailing bytes. */
    static size_t trim_partial_utf8(std::string_view text, size_t end) {
        size_t lead = end;
        int continuation = 0;
        while (lead > 0 && continuation < 3) {
            const auto byte = static_cast<unsigned char>(text[lead - 1]);
            if ((byte & 0xC0) != 0x80) {
                break;
            }
            --lead;
            ++continuation;
        }
        if (lead == 0) {
            return end;
        }
        const auto byte = static_cast<unsigned char>(text[lead - 1]);
        int expected = 0;
        if ((byte & 0xE0) == 0xC0) expected = 1;
        else if ((byte & 0xF0) == 0xE0) expected = 2;
        else if ((byte & 0xF8) == 0xF0) expected = 3;
        if (expected > continuation) {
            return lead - 1;
        }
        return end;
    }

    std::string buffer_;
    std::optional<nlohmann::json> last_;
};

} // namespace loom
