#include <xmlmap/types/record.h>

namespace xmlmap {

    RecordInstance::RecordInstance(const RecordInstance &other)
        : m_pimpl{other.m_pimpl ? other.m_pimpl->clone() : nullptr} {
    }

    RecordInstance &RecordInstance::operator=(const RecordInstance &other) {
        if (this != &other) { m_pimpl = other.m_pimpl ? other.m_pimpl->clone() : nullptr; }
        return *this;
    }

    bool RecordInstance::operator==(const RecordInstance &other) const {
        if (!m_pimpl || !other.m_pimpl) { return !m_pimpl && !other.m_pimpl; }
        return m_pimpl->equals(*other.m_pimpl);
    }

    std::string RecordInstance::type_name() const { return m_pimpl ? m_pimpl->type().name() : "<unset>"; }

    std::string RecordInstance::to_string() const { return m_pimpl ? m_pimpl->to_string() : "<unset>"; }

    void RecordAdapter::check_fields(const std::vector<std::string> &field_names) const {
        for (const auto &name : field_names) {
            if (!has_field(name)) {
                throw_error<InvalidRootConfiguration>("Record type '{}' has no field named '{}'", type_name(), name);
            }
        }
    }

} // namespace xmlmap
