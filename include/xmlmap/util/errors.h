#ifndef XMLMAP_UTIL_ERRORS
#define XMLMAP_UTIL_ERRORS

#include <xmlmap/xmlmap_export.h>

#include <fmt/format.h>

#include <concepts>
#include <stdexcept>
#include <string>
#include <string_view>

namespace xmlmap {

    /**
     * Base of every error raised while declaring, decoding or encoding.
     *
     * The detail is the human readable description, the location is the slash joined path of the elements
     * being processed when the error was raised (may be empty for declaration errors). what() renders
     * "<detail>: <location>" so the location is always the tail of the message.
     */
    class XMLMAP_EXPORT XmlError : public std::runtime_error {
    public:
        explicit XmlError(std::string detail, std::string location = {});

        [[nodiscard]] const std::string &detail() const noexcept { return _detail; }
        [[nodiscard]] const std::string &location() const noexcept { return _location; }
        [[nodiscard]] bool has_location() const noexcept { return !_location.empty(); }

    private:
        std::string _detail;
        std::string _location;
    };

    // A required element, attribute, container or value field is absent.
    class XMLMAP_EXPORT MissingValue : public XmlError {
    public:
        using XmlError::XmlError;
    };

    // Text is present but cannot be converted to (or from) the declared primitive type.
    class XMLMAP_EXPORT InvalidPrimitiveValue : public XmlError {
    public:
        InvalidPrimitiveValue(std::string detail, std::string location, std::string raw_text);

        [[nodiscard]] const std::string &raw_text() const noexcept { return _raw_text; }

    private:
        std::string _raw_text;
    };

    // Misuse of the declaration API or a processor that cannot be used at the document root.
    class XMLMAP_EXPORT InvalidRootConfiguration : public XmlError {
    public:
        using XmlError::XmlError;
    };

    // An aggregate received a value of the wrong kind, e.g. a string where a mapping is expected.
    class XMLMAP_EXPORT ValueTypeMismatch : public XmlError {
    public:
        using XmlError::XmlError;
    };

    // The markup could not be parsed, or the file could not be read or written.
    class XMLMAP_EXPORT MalformedDocument : public XmlError {
    public:
        using XmlError::XmlError;
    };

    // Raised from user hooks, the engine appends the location when the hook did not supply one.
    class XMLMAP_EXPORT UserFailure : public XmlError {
    public:
        using XmlError::XmlError;
    };

    template<typename Error = XmlError, typename... Ts>
        requires std::constructible_from<Error, std::string>
    [[noreturn]] auto throw_error(fmt::format_string<Ts...> fmt_str, Ts &&... xs) {
        throw Error{fmt::format(fmt_str, std::forward<Ts>(xs)...)};
    }

    template<typename Error = XmlError, typename... Ts>
        requires std::constructible_from<Error, std::string, std::string>
    [[noreturn]] auto throw_error_at(std::string location, fmt::format_string<Ts...> fmt_str, Ts &&... xs) {
        throw Error{fmt::format(fmt_str, std::forward<Ts>(xs)...), std::move(location)};
    }

} // namespace xmlmap

#endif // XMLMAP_UTIL_ERRORS
