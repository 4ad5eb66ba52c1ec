#ifndef PULSEGRAPH_NODE_H
#define PULSEGRAPH_NODE_H

#include <pulsegraph/types/attribute.h>
#include <pulsegraph/types/message.h>
#include <pulsegraph/types/signal_buffer.h>
#include <pulsegraph/util/lifecycle.h>

#include <cstdint>
#include <unordered_map>

namespace pulsegraph {
    enum class NodeTypeEnum : std::uint8_t {
        NONE = 0,
        SOURCE_NODE = 1,
        PROCESSOR_NODE = 1 << 1,
        OUTPUT_NODE = 1 << 2
    };

    [[nodiscard]] PULSEGRAPH_EXPORT std::string_view to_string(NodeTypeEnum node_type);

    /**
     * Any processing step (including acquiring and emitting data) is an instance of a Node.
     *
     * A node has at most one upstream node, whose output it consumes, and any number of listeners (the nodes that
     * have it as their upstream). The edges are kept by the Graph the node is registered with, the node only holds
     * its index in that graph.
     *
     * Concrete nodes implement the four hooks (do_initialize, do_update, do_reset and
     * do_on_input_history_invalidation) and declare two fixed sets:
     *
     * * reset_attributes - the node's own attributes whose setters schedule a reset,
     * * reinitialization_dependencies - the upstream attributes whose drift (compared to the value captured at
     *   initialisation) requires the node to be re-initialised.
     */
    struct PULSEGRAPH_EXPORT Node : NodeLifeCycle {
        using ptr = Node*;
        using s_ptr = std::shared_ptr<Node>;
        using snapshot_t = std::unordered_map<std::string, AttributeValue>;

        explicit Node(std::string type_name);

        ~Node() override;

        Node(const Node &) = delete;

        Node &operator=(const Node &) = delete;

        [[nodiscard]] virtual NodeTypeEnum node_type() const = 0;

        [[nodiscard]] const std::string &type_name() const;

        [[nodiscard]] const std::string &label() const;

        void set_label(std::string label);

        [[nodiscard]] graph_ptr graph() const;

        [[nodiscard]] int64_t node_ndx() const;

        [[nodiscard]] node_ptr upstream() const;

        /**
         * Connects this node to a new upstream node (or disconnects it when nullptr). Both nodes must be registered
         * with the same graph. A new upstream invalidates everything: the node receives a
         * ``Message::everything_changed()`` immediately and, if it was initialised, is marked for re-initialisation.
         */
        void set_upstream(node_ptr upstream);

        [[nodiscard]] const std::vector<node_ptr> &listeners() const;

        /**
         * The last computed output, nullptr when there is nothing to emit. Only valid until the next update.
         */
        [[nodiscard]] const signal_buffer_s_ptr &output() const;

        /**
         * The attributes this node exposes to its descendants, nullopt if the node has no attribute of that name.
         */
        [[nodiscard]] virtual std::optional<AttributeValue> attribute(std::string_view name) const;

        /**
         * Walks up the chain (starting with the upstream node) until it finds a node that exposes ``name``.
         * Raises ValidationError when no predecessor does.
         */
        [[nodiscard]] AttributeValue find_upstream_attribute(std::string_view name) const;

        [[nodiscard]] virtual const attribute_names_t &reset_attributes() const = 0;

        [[nodiscard]] virtual const upstream_dependencies_t &reinitialization_dependencies() const = 0;

        [[nodiscard]] const snapshot_t &upstream_snapshot() const;

        /**
         * Resolves any pending life-cycle transition, or if there is none, computes a new output.
         */
        virtual void update();

        /**
         * Prepares everything for the first update, or rebuilds after a re-initialise request.
         * Raises ProtocolViolation if the node is initialised and nothing requested a re-initialisation.
         */
        virtual void initialize();

        /**
         * Raises ProtocolViolation if no reset was requested.
         */
        void reset();

        /**
         * Raises ProtocolViolation if the input history has not been invalidated.
         */
        void on_input_history_invalidation();

        void receive_message(const Message &message);

        [[nodiscard]] std::string str() const;

    protected:
        virtual void do_initialize() = 0;

        virtual void do_update() = 0;

        /**
         * Does what needs to be done when one of the reset attributes has been changed. Returns whether the output
         * history is no longer valid: true if descendants should forget everything that happened before, false if
         * the change is strictly local.
         */
        virtual bool do_reset() = 0;

        /**
         * If the node state depends on previous inputs, reset whatever relies on them.
         */
        virtual void do_on_input_history_invalidation() = 0;

        /**
         * Role specific post-conditions of do_initialize, raising here leaves the node uninitialised.
         */
        virtual void validate_initialization();

        void check_initialize_requested() const;

        /**
         * The upstream node's output, nullptr when there is no upstream.
         */
        [[nodiscard]] const signal_buffer_s_ptr &input() const;

        void set_output(signal_buffer_s_ptr value);

        void clear_output();

        /**
         * The channel info published by the closest source upstream.
         */
        [[nodiscard]] ChannelInfo upstream_channel_info() const;

        [[nodiscard]] bool the_change_requires_reinitialization() const;

        void deliver_message_to_listeners(const Message &message);

        friend struct Graph;

    private:
        [[nodiscard]] snapshot_t capture_upstream_snapshot() const;

        std::string _type_name;
        std::string _label;
        graph_ptr _graph{nullptr};
        int64_t _node_ndx{-1};
        signal_buffer_s_ptr _output;
        snapshot_t _upstream_snapshot;
    };

    /**
     * Objects of this type produce data, they have no upstream.
     *
     * do_initialize must publish the channel info describing the data the source emits, initialisation fails with
     * a ValidationError otherwise.
     */
    struct PULSEGRAPH_EXPORT SourceNode : Node {
        using ptr = SourceNode*;
        using s_ptr = std::shared_ptr<SourceNode>;

        using Node::Node;

        [[nodiscard]] NodeTypeEnum node_type() const override;

        void initialize() override;

        [[nodiscard]] const std::optional<ChannelInfo> &channel_info() const;

        // "channel_info" is only exposed while the source is initialised
        [[nodiscard]] std::optional<AttributeValue> attribute(std::string_view name) const override;

        // There is no upstream for the sources
        [[nodiscard]] const upstream_dependencies_t &reinitialization_dependencies() const override;

    protected:
        void publish_channel_info(ChannelInfo channel_info);

        void validate_initialization() override;

        // There is nothing to reset, just go ahead and initialise
        bool do_reset() override;

        void do_on_input_history_invalidation() override;

    private:
        std::optional<ChannelInfo> _channel_info;
    };

    /**
     * A node that transforms the output of its upstream node. A disabled processor passes its input through,
     * empty input is passed on as empty output without invoking any hook.
     */
    struct PULSEGRAPH_EXPORT ProcessorNode : Node {
        using ptr = ProcessorNode*;
        using s_ptr = std::shared_ptr<ProcessorNode>;

        using Node::Node;

        [[nodiscard]] NodeTypeEnum node_type() const override;

        void update() override;

        [[nodiscard]] bool is_disabled() const;

        void set_disabled(bool disabled);

        [[nodiscard]] std::optional<AttributeValue> attribute(std::string_view name) const override;

    private:
        bool _disabled{false};
    };

    /**
     * Terminal nodes, they hand data over to whatever consumes it outside the graph. A disabled output, or one
     * whose upstream produced nothing, has no effect for that tick.
     */
    struct PULSEGRAPH_EXPORT OutputNode : Node {
        using ptr = OutputNode*;
        using s_ptr = std::shared_ptr<OutputNode>;

        using Node::Node;

        [[nodiscard]] NodeTypeEnum node_type() const override;

        void update() override;

        [[nodiscard]] bool is_disabled() const;

        void set_disabled(bool disabled);

        [[nodiscard]] std::optional<AttributeValue> attribute(std::string_view name) const override;

    private:
        bool _disabled{false};
    };
} // namespace pulsegraph

#endif // PULSEGRAPH_NODE_H
