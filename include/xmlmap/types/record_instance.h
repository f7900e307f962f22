#ifndef XMLMAP_RECORD_INSTANCE_H
#define XMLMAP_RECORD_INSTANCE_H

#include <xmlmap/xmlmap_export.h>
#include <xmlmap/util/errors.h>

#include <fmt/format.h>

#include <concepts>
#include <memory>
#include <string>
#include <typeinfo>

namespace xmlmap {
    /*
     * Type erasure (concept / model) for user record values produced by the user_object and named_tuple processors.
     *
     * The record is owned by value: copying a RecordInstance clones the underlying object, so a decoded record can
     * never alias a default or another decode result.
     *
     * Equality uses the record type's operator== when it has one. A type without operator== compares by identity,
     * so a copy of such a record (and a Value holding that copy) is never equal to its source.
     */
    class RecordInstance;

    namespace detail {
        struct RecordConcept {
            using u_ptr = std::unique_ptr<RecordConcept>;

            virtual ~RecordConcept() = default;

            [[nodiscard]] virtual bool equals(const RecordConcept &other) const = 0;

            [[nodiscard]] virtual u_ptr clone() const = 0;

            [[nodiscard]] virtual const std::type_info &type() const = 0;

            [[nodiscard]] virtual std::string to_string() const = 0;
        };

        template<typename T>
        struct RecordModel final : RecordConcept {
            explicit RecordModel(T value) : object{std::move(value)} {
            }

            [[nodiscard]] bool equals(const RecordConcept &other) const override {
                auto other_model{dynamic_cast<const RecordModel *>(&other)};
                if (other_model == nullptr) { return false; }
                if constexpr (std::equality_comparable<T>) {
                    return object == other_model->object;
                } else {
                    return this == other_model;
                }
            }

            [[nodiscard]] u_ptr clone() const override { return std::make_unique<RecordModel>(*this); }

            [[nodiscard]] const std::type_info &type() const override { return typeid(T); }

            [[nodiscard]] std::string to_string() const override {
                if constexpr (fmt::is_formattable<T>::value) {
                    return fmt::format("{}", object);
                } else {
                    return fmt::format("<{}>", typeid(T).name());
                }
            }

            T object;
        };
    } // namespace detail

    class XMLMAP_EXPORT RecordInstance {
        std::unique_ptr<detail::RecordConcept> m_pimpl;

    public:
        RecordInstance() = default;

        explicit RecordInstance(std::unique_ptr<detail::RecordConcept> value) : m_pimpl{std::move(value)} {
        }

        RecordInstance(const RecordInstance &other);
        RecordInstance(RecordInstance &&) noexcept = default;
        RecordInstance &operator=(const RecordInstance &other);
        RecordInstance &operator=(RecordInstance &&) noexcept = default;

        template<typename T>
        [[nodiscard]] static RecordInstance make(T value) {
            return RecordInstance{std::make_unique<detail::RecordModel<T> >(std::move(value))};
        }

        [[nodiscard]] bool operator==(const RecordInstance &other) const;

        [[nodiscard]] bool is_un_set() const { return !m_pimpl; }

        template<typename T>
        [[nodiscard]] bool is() const {
            return dynamic_cast<const detail::RecordModel<T> *>(m_pimpl.get()) != nullptr;
        }

        template<typename T>
        [[nodiscard]] const T &as() const {
            auto mdl{dynamic_cast<const detail::RecordModel<T> *>(m_pimpl.get())};
            if (mdl) return mdl->object;
            throw_error<ValueTypeMismatch>("Record of type '{}' does not contain a value of type '{}'", type_name(),
                                           typeid(T).name());
        }

        template<typename T>
        [[nodiscard]] T &as_mutable() {
            auto mdl{dynamic_cast<detail::RecordModel<T> *>(m_pimpl.get())};
            if (mdl) return mdl->object;
            throw_error<ValueTypeMismatch>("Record of type '{}' does not contain a value of type '{}'", type_name(),
                                           typeid(T).name());
        }

        [[nodiscard]] std::string type_name() const;

        [[nodiscard]] std::string to_string() const;
    };
} // namespace xmlmap

#endif  // XMLMAP_RECORD_INSTANCE_H
