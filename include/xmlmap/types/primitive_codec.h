#ifndef XMLMAP_TYPES_PRIMITIVE_CODEC_H
#define XMLMAP_TYPES_PRIMITIVE_CODEC_H

#include <xmlmap/xmlmap_export.h>
#include <xmlmap/types/value.h>

#include <string>
#include <string_view>

namespace xmlmap {

    enum class PrimitiveType : uint8_t {
        Boolean,
        Integer,
        FloatingPoint,
        String,
    };

    [[nodiscard]] XMLMAP_EXPORT std::string_view to_string(PrimitiveType type) noexcept;

    /**
     * Converts raw text to the declared scalar type.
     *
     * - Boolean: true / false / yes / no / 1 / 0, case-insensitive, surrounding whitespace ignored
     * - Integer: base 10 int64 with optional sign, surrounding whitespace ignored
     * - FloatingPoint: decimal or scientific double (inf and nan included), surrounding whitespace ignored
     * - String: the text itself, trimmed when strip_whitespace is set
     *
     * @throws InvalidPrimitiveValue (without location) when the text does not convert
     */
    [[nodiscard]] XMLMAP_EXPORT Value parse_primitive(std::string_view text, PrimitiveType type,
                                                      bool strip_whitespace = true);

    /**
     * Renders a value of the declared type as text. Integers are accepted for FloatingPoint.
     *
     * @throws InvalidPrimitiveValue (without location) when the value holds an incompatible kind
     */
    [[nodiscard]] XMLMAP_EXPORT std::string serialize_primitive(const Value &value, PrimitiveType type);

} // namespace xmlmap

#endif // XMLMAP_TYPES_PRIMITIVE_CODEC_H
