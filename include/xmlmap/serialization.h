#pragma once

/**
 * @file serialization.h
 * @brief Public entry points: decode / encode against documents, strings and files.
 *
 * Usage:
 * @code
 * auto author = dictionary("author", {string("name"), integer("birth-year")});
 *
 * Value value = parse_from_string(*author, "<author><name>Frank Herbert</name><birth-year>1920</birth-year></author>");
 * std::string xml = serialize_to_string(*author, value, {.indent = "    "});
 * @endcode
 *
 * Every call owns its own ProcessorState, so one processor tree may be used by any number of threads at once.
 */

#include <xmlmap/xmlmap_export.h>
#include <xmlmap/document/xml_document.h>
#include <xmlmap/runtime/processing_observer.h>
#include <xmlmap/types/processor.h>
#include <xmlmap/types/value.h>

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace xmlmap {

struct ProcessingOptions {
    /// Receives every decode / encode step, not owned
    processing_observer_ptr observer{nullptr};
};

struct ParseOptions {
    TextEncoding encoding{TextEncoding::Auto};
    ProcessingOptions processing;
};

struct SerializeOptions {
    /// Indentation unit for pretty printing, compact output when not set
    std::optional<std::string> indent;
    bool xml_declaration{false};
    /// File output only, strings are always UTF-8
    TextEncoding encoding{TextEncoding::Utf8};
    ProcessingOptions processing;
};

/// Decodes the document with a root processor (dictionary, record or nested array)
[[nodiscard]] XMLMAP_EXPORT Value decode(const Processor &processor, const XmlDocument &document,
                                         const ProcessingOptions &options = {});

/// Decodes starting at root as if it were the document element
[[nodiscard]] XMLMAP_EXPORT Value decode(const Processor &processor, const Element &root,
                                         const ProcessingOptions &options = {});

[[nodiscard]] XMLMAP_EXPORT XmlDocument encode(const Processor &processor, const Value &value,
                                               const ProcessingOptions &options = {});

[[nodiscard]] XMLMAP_EXPORT Value parse_from_string(const Processor &processor, std::string_view text,
                                                    const ParseOptions &options = {});

[[nodiscard]] XMLMAP_EXPORT Value parse_from_file(const Processor &processor, const std::filesystem::path &path,
                                                  const ParseOptions &options = {});

[[nodiscard]] XMLMAP_EXPORT std::string serialize_to_string(const Processor &processor, const Value &value,
                                                            const SerializeOptions &options = {});

XMLMAP_EXPORT void serialize_to_file(const Processor &processor, const Value &value,
                                     const std::filesystem::path &path, const SerializeOptions &options = {});

} // namespace xmlmap
