#include <xmlmap/util/errors.h>

namespace xmlmap {

    namespace {
        std::string render_message(const std::string &detail, const std::string &location) {
            if (location.empty()) { return detail; }
            return fmt::format("{}: {}", detail, location);
        }
    } // namespace

    XmlError::XmlError(std::string detail, std::string location)
        : std::runtime_error{render_message(detail, location)}, _detail{std::move(detail)},
          _location{std::move(location)} {}

    InvalidPrimitiveValue::InvalidPrimitiveValue(std::string detail, std::string location, std::string raw_text)
        : XmlError{std::move(detail), std::move(location)}, _raw_text{std::move(raw_text)} {}

} // namespace xmlmap
