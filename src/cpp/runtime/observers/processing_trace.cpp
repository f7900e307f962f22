#include <xmlmap/runtime/observers/processing_trace.h>
#include <xmlmap/types/location.h>
#include <xmlmap/types/processor.h>
#include <fmt/format.h>
#include <cstdio>

namespace xmlmap {

    // Static member initialization
    bool ProcessingTrace::_print_values = false;

    ProcessingTrace::ProcessingTrace(const std::optional<std::string> &filter, bool decode, bool encode)
        : _filter(filter), _decode(decode), _encode(encode) {
    }

    void ProcessingTrace::set_print_values(bool value) {
        _print_values = value;
    }

    void ProcessingTrace::_print(std::string_view phase, const std::string &location, const std::string &msg) const {
        fmt::print(stderr, "[{}] {} {}\n", phase, location.empty() ? std::string{"."} : location, msg);
    }

    bool ProcessingTrace::_should_log(const std::string &location) const {
        if (!_filter.has_value()) {
            return true;
        }
        return location.find(_filter.value()) != std::string::npos;
    }

    void ProcessingTrace::on_before_decode(const Processor &processor, const ProcessorStateView &state) {
        auto location = state.location_string();
        if (_decode && _should_log(location)) {
            _print("decode", location, fmt::format(">> {}", processor.describe()));
        }
    }

    void ProcessingTrace::on_after_decode(const Processor &processor, const ProcessorStateView &state,
                                          const Value &value) {
        auto location = state.location_string();
        if (_decode && _should_log(location)) {
            if (_print_values) {
                _print("decode", location, fmt::format("<< {} -> {}", processor.describe(), value));
            } else {
                _print("decode", location, fmt::format("<< {}", processor.describe()));
            }
        }
    }

    void ProcessingTrace::on_before_encode(const Processor &processor, const ProcessorStateView &state,
                                           const Value &value) {
        auto location = state.location_string();
        if (_encode && _should_log(location)) {
            if (_print_values) {
                _print("encode", location, fmt::format(">> {} <- {}", processor.describe(), value));
            } else {
                _print("encode", location, fmt::format(">> {}", processor.describe()));
            }
        }
    }

    void ProcessingTrace::on_after_encode(const Processor &processor, const ProcessorStateView &state) {
        auto location = state.location_string();
        if (_encode && _should_log(location)) {
            _print("encode", location, fmt::format("<< {}", processor.describe()));
        }
    }

} // namespace xmlmap
