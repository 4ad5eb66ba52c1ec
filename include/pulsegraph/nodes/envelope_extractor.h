#ifndef PULSEGRAPH_ENVELOPE_EXTRACTOR_H
#define PULSEGRAPH_ENVELOPE_EXTRACTOR_H

#include <pulsegraph/types/node.h>

namespace pulsegraph {
    /**
     * Smooths the rectified signal of every channel: y[t] = factor * y[t - 1] + (1 - factor) * |x[t]|.
     * The smoother starts from zero, its state is carried across chunks and dropped whenever the input history is
     * invalidated.
     */
    struct PULSEGRAPH_EXPORT EnvelopeExtractor : ProcessorNode {
        using ptr = EnvelopeExtractor*;
        using s_ptr = std::shared_ptr<EnvelopeExtractor>;

        static constexpr std::string_view EXPONENTIAL_SMOOTHING = "Exponential smoothing";

        explicit EnvelopeExtractor(double factor = 0.9);

        [[nodiscard]] double factor() const;

        // Must be strictly between 0 and 1
        void set_factor(double factor);

        [[nodiscard]] const std::string &method() const;

        void set_method(std::string method);

        [[nodiscard]] static const std::vector<std::string> &supported_methods();

        [[nodiscard]] const attribute_names_t &reset_attributes() const override;

        [[nodiscard]] const upstream_dependencies_t &reinitialization_dependencies() const override;

    protected:
        void do_initialize() override;

        void do_update() override;

        bool do_reset() override;

        void do_on_input_history_invalidation() override;

    private:
        double _factor;
        std::string _method{EXPONENTIAL_SMOOTHING};
        std::vector<double> _state;
    };
} // namespace pulsegraph

#endif // PULSEGRAPH_ENVELOPE_EXTRACTOR_H
