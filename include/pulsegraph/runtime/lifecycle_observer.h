#ifndef PULSEGRAPH_LIFECYCLE_OBSERVER_H
#define PULSEGRAPH_LIFECYCLE_OBSERVER_H

#include <pulsegraph/pulsegraph_base.h>

#include <cstdint>

namespace pulsegraph {
    enum class NodeEvent : std::uint8_t {
        INITIALIZE,
        UPDATE,
        RESET,
        HISTORY_INVALIDATION
    };

    [[nodiscard]] PULSEGRAPH_EXPORT std::string_view to_string(NodeEvent event);

    // PipelineLifeCycleObserver - externally managed, the graph only keeps a raw pointer
    struct PipelineLifeCycleObserver {
        using ptr = PipelineLifeCycleObserver*;
        using s_ptr = std::shared_ptr<PipelineLifeCycleObserver>;

        virtual ~PipelineLifeCycleObserver() = default;

        virtual void on_before_initialize_pipeline(Pipeline &) {
        };

        virtual void on_after_initialize_pipeline(Pipeline &) {
        };

        virtual void on_before_tick(Pipeline &) {
        };

        virtual void on_after_tick(Pipeline &) {
        };

        virtual void on_before_node_initialize(Node &) {
        };

        virtual void on_after_node_initialize(Node &) {
        };

        virtual void on_before_node_update(Node &) {
        };

        virtual void on_after_node_update(Node &) {
        };

        virtual void on_before_node_reset(Node &) {
        };

        virtual void on_after_node_reset(Node &) {
        };

        virtual void on_before_node_history_invalidation(Node &) {
        };

        virtual void on_after_node_history_invalidation(Node &) {
        };
    };

    /**
     * Notifies the observers of the node's graph around a single life-cycle hook. The "after" notification is sent
     * from the destructor, so it is delivered whether the hook completed or threw. An observer that throws is
     * reported on stderr and skipped; the other observers are still notified.
     */
    struct PULSEGRAPH_EXPORT NotifyNodeEvent {
        NotifyNodeEvent(Node &node, NodeEvent event);

        ~NotifyNodeEvent() noexcept;

        NotifyNodeEvent(const NotifyNodeEvent &) = delete;

        NotifyNodeEvent &operator=(const NotifyNodeEvent &) = delete;

    private:
        Node &_node;
        NodeEvent _event;
    };

    enum class PipelineEvent : std::uint8_t {
        INITIALIZE,
        TICK
    };

    struct PULSEGRAPH_EXPORT NotifyPipelineEvent {
        NotifyPipelineEvent(Pipeline &pipeline, PipelineEvent event);

        ~NotifyPipelineEvent() noexcept;

        NotifyPipelineEvent(const NotifyPipelineEvent &) = delete;

        NotifyPipelineEvent &operator=(const NotifyPipelineEvent &) = delete;

    private:
        Pipeline &_pipeline;
        PipelineEvent _event;
    };
} // namespace pulsegraph

#endif // PULSEGRAPH_LIFECYCLE_OBSERVER_H
