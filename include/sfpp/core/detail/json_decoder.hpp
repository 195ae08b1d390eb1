#pragma once

#include "sfpp/core/exception.hpp"
#include <nlohmann/json.hpp>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace sfpp::core::detail {

// Binary subtype marking a number leaf; JSON text never yields binary values
constexpr std::uint8_t NUMBER_TEXT_SUBTYPE = 0x4E;

inline nlohmann::json number_text_node(const std::string& text) {
    return nlohmann::json::binary(nlohmann::json::binary_t::container_type(text.begin(), text.end()),
                                  NUMBER_TEXT_SUBTYPE);
}

inline bool is_number_text(const nlohmann::json& node) {
    return node.is_binary();
}

inline std::string number_text(const nlohmann::json& node) {
    const auto& bytes = node.get_binary();
    return std::string(bytes.begin(), bytes.end());
}

/**
 * @brief SAX handler that keeps every JSON number as its text
 *
 * NUMBER(38, s) values must not pass through a double, so the DOM it
 * builds holds numbers as tagged binary leaves ("12345678901234567890.5").
 */
class NumberPreservingSax : public nlohmann::json_sax<nlohmann::json> {
public:
    explicit NumberPreservingSax(nlohmann::json& root) : root_(root) {}

    bool null() override {
        handle(nullptr);
        return true;
    }

    bool boolean(bool val) override {
        handle(val);
        return true;
    }

    bool number_integer(number_integer_t val) override {
        handle(number_text_node(std::to_string(val)));
        return true;
    }

    bool number_unsigned(number_unsigned_t val) override {
        handle(number_text_node(std::to_string(val)));
        return true;
    }

    bool number_float(number_float_t, const string_t& s) override {
        handle(number_text_node(s));
        return true;
    }

    bool string(string_t& val) override {
        handle(val);
        return true;
    }

    bool binary(binary_t&) override {
        return true;
    }

    bool start_object(std::size_t) override {
        stack_.push_back(handle(nlohmann::json::object()));
        return true;
    }

    bool key(string_t& val) override {
        object_element_ = &(*stack_.back())[val];
        return true;
    }

    bool end_object() override {
        stack_.pop_back();
        return true;
    }

    bool start_array(std::size_t) override {
        stack_.push_back(handle(nlohmann::json::array()));
        return true;
    }

    bool end_array() override {
        stack_.pop_back();
        return true;
    }

    bool parse_error(std::size_t, const std::string&,
                     const nlohmann::detail::exception& ex) override {
        error_ = ex.what();
        return false;
    }

    const std::string& error() const { return error_; }

private:
    nlohmann::json* handle(nlohmann::json value) {
        if (stack_.empty()) {
            root_ = std::move(value);
            return &root_;
        }
        if (stack_.back()->is_array()) {
            stack_.back()->push_back(std::move(value));
            return &stack_.back()->back();
        }
        *object_element_ = std::move(value);
        return object_element_;
    }

    nlohmann::json& root_;
    std::vector<nlohmann::json*> stack_;
    nlohmann::json* object_element_ = nullptr;
    std::string error_;
};

inline void dump_preserving_numbers(const nlohmann::json& node, std::string& out) {
    if (is_number_text(node)) {
        out += number_text(node);
    } else if (node.is_object()) {
        out += '{';
        bool first = true;
        for (auto it = node.begin(); it != node.end(); ++it) {
            if (!first) out += ',';
            first = false;
            out += nlohmann::json(it.key()).dump();
            out += ':';
            dump_preserving_numbers(it.value(), out);
        }
        out += '}';
    } else if (node.is_array()) {
        out += '[';
        bool first = true;
        for (const auto& item : node) {
            if (!first) out += ',';
            first = false;
            dump_preserving_numbers(item, out);
        }
        out += ']';
    } else {
        out += node.dump();
    }
}

/// Compact JSON text of a parsed node with numbers written back verbatim
inline std::string dump_preserving_numbers(const nlohmann::json& node) {
    std::string out;
    dump_preserving_numbers(node, out);
    return out;
}

/**
 * @brief Parse JSON with numbers kept as text
 * @throws DataFormatException (ERR_INVALID_JSON) on malformed input
 */
inline nlohmann::json parse_json_preserving_numbers(std::string_view text,
                                                    const std::string& column = {}) {
    nlohmann::json root;
    NumberPreservingSax sax(root);
    if (!nlohmann::json::sax_parse(text.begin(), text.end(), &sax)) {
        throw DataFormatException("Invalid JSON: " + sax.error(), ERR_INVALID_JSON,
                                  column, std::string(text));
    }
    return root;
}

} // namespace sfpp::core::detail
