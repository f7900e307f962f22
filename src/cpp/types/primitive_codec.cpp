#include <xmlmap/types/primitive_codec.h>
#include <xmlmap/util/errors.h>
#include <xmlmap/util/string_utils.h>

#include <charconv>
#include <system_error>

namespace xmlmap {

    std::string_view to_string(PrimitiveType type) noexcept {
        switch (type) {
            case PrimitiveType::Boolean: return "boolean";
            case PrimitiveType::Integer: return "integer";
            case PrimitiveType::FloatingPoint: return "float";
            case PrimitiveType::String: return "string";
        }
        return "unknown";
    }

    namespace {
        [[noreturn]] void invalid_text(PrimitiveType type, std::string_view text) {
            throw InvalidPrimitiveValue{fmt::format("Invalid {} value: \"{}\"", to_string(type), text), {},
                                        std::string{text}};
        }

        // from_chars rejects an explicit '+', it is accepted here as long as a digit or '.' follows
        std::string_view drop_plus(std::string_view text) {
            if (text.size() > 1 && text.front() == '+' && text[1] != '-' && text[1] != '+') { text.remove_prefix(1); }
            return text;
        }

        template<typename T>
        Value parse_number(std::string_view raw, PrimitiveType type) {
            auto text = drop_plus(trim(raw));
            T result{};
            auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), result);
            if (text.empty() || ec != std::errc{} || ptr != text.data() + text.size()) { invalid_text(type, raw); }
            return result;
        }

        Value parse_boolean(std::string_view raw) {
            auto token = to_lower(trim(raw));
            if (token == "true" || token == "yes" || token == "1") { return true; }
            if (token == "false" || token == "no" || token == "0") { return false; }
            invalid_text(PrimitiveType::Boolean, raw);
        }
    } // namespace

    Value parse_primitive(std::string_view text, PrimitiveType type, bool strip_whitespace) {
        switch (type) {
            case PrimitiveType::Boolean: return parse_boolean(text);
            case PrimitiveType::Integer: return parse_number<int64_t>(text, type);
            case PrimitiveType::FloatingPoint: return parse_number<double>(text, type);
            case PrimitiveType::String: return std::string{strip_whitespace ? trim(text) : text};
        }
        invalid_text(type, text);
    }

    std::string serialize_primitive(const Value &value, PrimitiveType type) {
        switch (type) {
            case PrimitiveType::Boolean:
                if (value.is_bool()) { return to_string(value.as_bool()); }
                break;
            case PrimitiveType::Integer:
                if (value.is_int()) { return to_string(value.as_int()); }
                break;
            case PrimitiveType::FloatingPoint:
                if (value.is_float() || value.is_int()) { return to_string(value.as_float()); }
                break;
            case PrimitiveType::String:
                if (value.is_string()) { return value.as_string(); }
                break;
        }
        throw InvalidPrimitiveValue{
            fmt::format("Cannot serialize a {} value as {}", to_string(value.kind()), to_string(type)), {},
            value.to_string()
        };
    }

} // namespace xmlmap
