#pragma once

/**
 * @file visitor.h
 * @brief Overloaded-callable helper used to dispatch over the closed variants (Value, Processor).
 *
 * Usage:
 * @code
 * std::visit(overloaded{
 *     [](const PrimitiveProcessor &p) { ... },
 *     [](const DictionaryProcessor &d) { ... },
 *     [](const ArrayProcessor &a) { ... },
 *     [](const RecordProcessor &r) { ... }
 * }, processor.kind());
 * @endcode
 */

namespace xmlmap {

/**
 * @brief Combines multiple callables into a single overloaded callable.
 */
template<typename... Fs>
struct overloaded : Fs... {
    using Fs::operator()...;
};

template<typename... Fs>
overloaded(Fs...) -> overloaded<Fs...>;

} // namespace xmlmap
