#ifndef PULSEGRAPH_TESTS_MOCK_NODES_H
#define PULSEGRAPH_TESTS_MOCK_NODES_H

#include <pulsegraph/types/graph.h>
#include <pulsegraph/types/node.h>

#include <stdexcept>
#include <string>

namespace pulsegraph::testing {

    // ============================================================================
    // Hook counters shared by the mocks
    // ============================================================================

    struct HookCounts {
        int initialize{0};
        int update{0};
        int reset{0};
        int history_invalidation{0};
    };

    inline signal_buffer_s_ptr zeros(size_t channels, size_t samples) {
        return std::make_shared<const SignalBuffer>(channels, samples);
    }

    inline signal_buffer_s_ptr filled(size_t channels, size_t samples, double value) {
        return std::make_shared<const SignalBuffer>(channels, samples, value);
    }

    /**
     * A source publishing a fixed chunk on every update. "montage" is an extra attribute descendants can depend on,
     * changing it (or the channel info) resets the source.
     */
    struct MockSource : SourceNode {
        explicit MockSource(std::optional<ChannelInfo> info = ChannelInfo::uniform(2, 100.0))
            : SourceNode("MockSource"), info{std::move(info)} {
        }

        void set_montage(std::string value) {
            montage = std::move(value);
            mark_reset_needed();
        }

        void set_info(std::optional<ChannelInfo> value) {
            info = std::move(value);
            mark_reset_needed();
        }

        [[nodiscard]] std::optional<AttributeValue> attribute(std::string_view name) const override {
            if (name == "montage") { return AttributeValue{montage}; }
            return SourceNode::attribute(name);
        }

        [[nodiscard]] const attribute_names_t &reset_attributes() const override {
            static const attribute_names_t names{"montage", "info"};
            return names;
        }

        // Exposed so tests can drive the hooks directly
        using NodeLifeCycle::invalidate_input_history;
        using NodeLifeCycle::request_reinitialize;

        HookCounts counts;
        std::optional<ChannelInfo> info;
        std::string montage{"standard_1005"};
        signal_buffer_s_ptr next_output;

    protected:
        void do_initialize() override {
            ++counts.initialize;
            if (info.has_value()) { publish_channel_info(*info); }
        }

        void do_update() override {
            ++counts.update;
            set_output(next_output);
        }

        bool do_reset() override {
            ++counts.reset;
            return SourceNode::do_reset();
        }

        void do_on_input_history_invalidation() override { ++counts.history_invalidation; }
    };

    /**
     * Identity processor. ``scale`` is reset sensitive and is re-assigned from inside every hook, which must not
     * schedule another reset.
     */
    struct MockProcessor : ProcessorNode {
        explicit MockProcessor(upstream_dependencies_t dependencies = {}, bool reset_invalidates_history = false)
            : ProcessorNode("MockProcessor"), dependencies{std::move(dependencies)},
              reset_invalidates_history{reset_invalidates_history} {
        }

        void set_scale(double value) {
            if (value < 0.0) { throw ValidationError("scale must not be negative"); }
            scale = value;
            mark_reset_needed();
        }

        [[nodiscard]] const attribute_names_t &reset_attributes() const override {
            static const attribute_names_t names{"scale"};
            return names;
        }

        [[nodiscard]] const upstream_dependencies_t &reinitialization_dependencies() const override {
            return dependencies;
        }

        using NodeLifeCycle::invalidate_input_history;

        HookCounts counts;
        upstream_dependencies_t dependencies;
        bool reset_invalidates_history;
        bool fail_initialize{false};
        bool fail_update{false};
        double scale{1.0};

    protected:
        void do_initialize() override {
            ++counts.initialize;
            if (fail_initialize) { throw ValidationError("initialization failed"); }
            set_scale(scale);
        }

        void do_update() override {
            ++counts.update;
            if (fail_update) { throw std::runtime_error("ill-conditioned"); }
            set_output(input());
        }

        bool do_reset() override {
            ++counts.reset;
            set_scale(scale);
            return reset_invalidates_history;
        }

        void do_on_input_history_invalidation() override {
            ++counts.history_invalidation;
            set_scale(scale);
        }
    };

    struct MockOutput : OutputNode {
        MockOutput() : OutputNode("MockOutput") {
        }

        [[nodiscard]] const attribute_names_t &reset_attributes() const override {
            static const attribute_names_t none{};
            return none;
        }

        [[nodiscard]] const upstream_dependencies_t &reinitialization_dependencies() const override {
            static const upstream_dependencies_t none{};
            return none;
        }

        HookCounts counts;
        signal_buffer_s_ptr received;

    protected:
        void do_initialize() override { ++counts.initialize; }

        void do_update() override {
            ++counts.update;
            received = input();
        }

        bool do_reset() override {
            ++counts.reset;
            return false;
        }

        void do_on_input_history_invalidation() override { ++counts.history_invalidation; }
    };

} // namespace pulsegraph::testing

#endif // PULSEGRAPH_TESTS_MOCK_NODES_H
