#include <pulsegraph/nodes/envelope_extractor.h>

#include <algorithm>
#include <cmath>

namespace pulsegraph {
    namespace {
        void check_factor(double factor) {
            if (!(factor > 0.0 && factor < 1.0)) {
                throw_error<ValidationError>("Factor must be a number between 0 and 1, got {}", factor);
            }
        }
    } // namespace

    EnvelopeExtractor::EnvelopeExtractor(double factor) : ProcessorNode("EnvelopeExtractor"), _factor{factor} {
        check_factor(factor);
    }

    double EnvelopeExtractor::factor() const { return _factor; }

    void EnvelopeExtractor::set_factor(double factor) {
        check_factor(factor);
        _factor = factor;
        mark_reset_needed();
    }

    const std::string &EnvelopeExtractor::method() const { return _method; }

    void EnvelopeExtractor::set_method(std::string method) {
        const auto &supported{supported_methods()};
        if (std::ranges::find(supported, method) == supported.end()) {
            throw_error<ValidationError>("Method {} is not supported. Use one of: {}", method,
                                         fmt::join(supported, ", "));
        }
        _method = std::move(method);
        mark_reset_needed();
    }

    const std::vector<std::string> &EnvelopeExtractor::supported_methods() {
        static const std::vector<std::string> methods{std::string{EXPONENTIAL_SMOOTHING}};
        return methods;
    }

    const attribute_names_t &EnvelopeExtractor::reset_attributes() const {
        static const attribute_names_t names{"method", "factor"};
        return names;
    }

    const upstream_dependencies_t &EnvelopeExtractor::reinitialization_dependencies() const {
        static const upstream_dependencies_t dependencies{
            {std::string{CHANNEL_INFO_ATTRIBUTE}, reduce_to_channel_count}
        };
        return dependencies;
    }

    void EnvelopeExtractor::do_initialize() {
        _state.assign(upstream_channel_info().channel_count(), 0.0);
    }

    void EnvelopeExtractor::do_update() {
        const auto &input_buffer{*input()};
        if (input_buffer.channel_count() != _state.size()) {
            throw_error<ValidationError>("The {} node was initialized for {} channels, got {}", str(), _state.size(),
                                         input_buffer.channel_count());
        }

        auto envelope{std::make_shared<SignalBuffer>(input_buffer.channel_count(), input_buffer.sample_count())};
        for (size_t c = 0; c < input_buffer.channel_count(); ++c) {
            auto previous{_state[c]};
            for (size_t s = 0; s < input_buffer.sample_count(); ++s) {
                previous = _factor * previous + (1.0 - _factor) * std::abs(input_buffer(c, s));
                (*envelope)(c, s) = previous;
            }
            _state[c] = previous;
        }
        set_output(std::move(envelope));
    }

    bool EnvelopeExtractor::do_reset() {
        request_reinitialize();
        initialize();
        return true;
    }

    void EnvelopeExtractor::do_on_input_history_invalidation() {
        std::ranges::fill(_state, 0.0);
    }
} // namespace pulsegraph
