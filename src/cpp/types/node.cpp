#include <pulsegraph/runtime/lifecycle_observer.h>
#include <pulsegraph/types/graph.h>
#include <pulsegraph/types/node.h>

namespace pulsegraph {
    std::string_view to_string(NodeTypeEnum node_type) {
        switch (node_type) {
            case NodeTypeEnum::NONE: return "None";
            case NodeTypeEnum::SOURCE_NODE: return "Source";
            case NodeTypeEnum::PROCESSOR_NODE: return "Processor";
            case NodeTypeEnum::OUTPUT_NODE: return "Output";
        }
        return "Unknown";
    }

    namespace {
        const signal_buffer_s_ptr &no_signal() {
            static const signal_buffer_s_ptr empty{};
            return empty;
        }

        const std::vector<node_ptr> &no_listeners() {
            static const std::vector<node_ptr> empty{};
            return empty;
        }

        std::optional<AttributeValue> lookup_upstream_attribute(node_ptr node, std::string_view name) {
            for (; node != nullptr; node = node->upstream()) {
                if (auto value{node->attribute(name)}; value.has_value()) { return value; }
            }
            return std::nullopt;
        }
    } // namespace

    Node::Node(std::string type_name) : _type_name{std::move(type_name)} {
    }

    Node::~Node() = default;

    const std::string &Node::type_name() const { return _type_name; }

    const std::string &Node::label() const { return _label; }

    void Node::set_label(std::string label) { _label = std::move(label); }

    graph_ptr Node::graph() const { return _graph; }

    int64_t Node::node_ndx() const { return _node_ndx; }

    node_ptr Node::upstream() const { return _graph == nullptr ? nullptr : _graph->upstream_of(*this); }

    void Node::set_upstream(node_ptr upstream) {
        if (_graph == nullptr) {
            if (upstream == nullptr) { return; }
            throw_error<ProtocolViolation>("The {} node has to be added to a graph before it can be connected to {}",
                                           str(), upstream->str());
        }
        _graph->connect(*this, upstream);
    }

    const std::vector<node_ptr> &Node::listeners() const {
        return _graph == nullptr ? no_listeners() : _graph->listeners_of(*this);
    }

    const signal_buffer_s_ptr &Node::output() const { return _output; }

    std::optional<AttributeValue> Node::attribute(std::string_view) const { return std::nullopt; }

    AttributeValue Node::find_upstream_attribute(std::string_view name) const {
        auto value{lookup_upstream_attribute(upstream(), name)};
        if (!value.has_value()) {
            throw_error<ValidationError>("None of the predecessors of a {} node contains attribute {}", str(), name);
        }
        return std::move(*value);
    }

    const Node::snapshot_t &Node::upstream_snapshot() const { return _upstream_snapshot; }

    void Node::update() {
        NotifyNodeEvent notify{*this, NodeEvent::UPDATE};
        clear_output();

        if (consume_upstream_change() && is_initialized() && the_change_requires_reinitialization()) {
            request_reinitialize();
        }

        if (!is_initialized() || reinitialize_requested()) {
            initialize();
            return;
        }

        if (!has_pending_changes()) {
            do_update();
            return;
        }

        if (reset_requested()) { reset(); }
        if (input_history_invalid()) { on_input_history_invalidation(); }
    }

    void Node::initialize() {
        check_initialize_requested();
        NotifyNodeEvent notify{*this, NodeEvent::INITIALIZE};

        set_initialized(false);
        {
            ResetSuppressionGuard guard{*this};
            do_initialize();
            validate_initialization();
        }
        _upstream_snapshot = capture_upstream_snapshot();

        clear_pending_changes();
        set_initialized(true);
        deliver_message_to_listeners(Message::everything_changed());
    }

    void Node::reset() {
        if (!reset_requested()) {
            throw_error<ProtocolViolation>("Reset was called on the {} node without a pending reset request", str());
        }
        bool output_history_invalid;
        {
            NotifyNodeEvent notify{*this, NodeEvent::RESET};
            ResetSuppressionGuard guard{*this};
            output_history_invalid = do_reset();
        }
        clear_reset_request();
        deliver_message_to_listeners(Message{true, output_history_invalid});
    }

    void Node::on_input_history_invalidation() {
        if (!input_history_invalid()) {
            throw_error<ProtocolViolation>(
                "History invalidation was called on the {} node while its input history is still valid", str());
        }
        {
            NotifyNodeEvent notify{*this, NodeEvent::HISTORY_INVALIDATION};
            ResetSuppressionGuard guard{*this};
            do_on_input_history_invalidation();
        }
        clear_input_history_invalid();
        deliver_message_to_listeners(Message::everything_changed());
    }

    void Node::receive_message(const Message &message) {
        if (message.changed()) { mark_upstream_changed(); }
        if (message.history_invalid()) { invalidate_input_history(); }
    }

    std::string Node::str() const {
        if (_label.empty()) { return fmt::format("{}<{}>", _type_name, _node_ndx); }
        return fmt::format("{}:{}<{}>", _label, _type_name, _node_ndx);
    }

    void Node::validate_initialization() {
    }

    void Node::check_initialize_requested() const {
        if (is_initialized() && !reinitialize_requested()) {
            throw_error<ProtocolViolation>("The {} node is already initialized and no reinitialization was requested",
                                           str());
        }
    }

    const signal_buffer_s_ptr &Node::input() const {
        auto upstream_node{upstream()};
        return upstream_node == nullptr ? no_signal() : upstream_node->output();
    }

    void Node::set_output(signal_buffer_s_ptr value) { _output = std::move(value); }

    void Node::clear_output() { _output.reset(); }

    ChannelInfo Node::upstream_channel_info() const {
        return as_channel_info(find_upstream_attribute(CHANNEL_INFO_ATTRIBUTE), str());
    }

    bool Node::the_change_requires_reinitialization() const {
        for (const auto &dependency: reinitialization_dependencies()) {
            auto current{lookup_upstream_attribute(upstream(), dependency.attribute)};
            if (!current.has_value()) { return true; }

            auto it{_upstream_snapshot.find(dependency.attribute)};
            if (it == _upstream_snapshot.end() || it->second != dependency.snapshot_of(*current)) { return true; }
        }
        return false;
    }

    void Node::deliver_message_to_listeners(const Message &message) {
        if (_graph != nullptr) { _graph->deliver_message(*this, message); }
    }

    Node::snapshot_t Node::capture_upstream_snapshot() const {
        snapshot_t snapshot;
        for (const auto &dependency: reinitialization_dependencies()) {
            snapshot.insert_or_assign(dependency.attribute,
                                      dependency.snapshot_of(find_upstream_attribute(dependency.attribute)));
        }
        return snapshot;
    }

    // SourceNode

    NodeTypeEnum SourceNode::node_type() const { return NodeTypeEnum::SOURCE_NODE; }

    void SourceNode::initialize() {
        check_initialize_requested();
        _channel_info.reset();
        try {
            Node::initialize();
        } catch (...) {
            // A rejected descriptor must not be visible to the nodes downstream
            _channel_info.reset();
            throw;
        }
    }

    const std::optional<ChannelInfo> &SourceNode::channel_info() const { return _channel_info; }

    std::optional<AttributeValue> SourceNode::attribute(std::string_view name) const {
        if (name == CHANNEL_INFO_ATTRIBUTE && is_initialized() && _channel_info.has_value()) {
            return AttributeValue{*_channel_info};
        }
        return Node::attribute(name);
    }

    const upstream_dependencies_t &SourceNode::reinitialization_dependencies() const {
        static const upstream_dependencies_t none{};
        return none;
    }

    void SourceNode::publish_channel_info(ChannelInfo channel_info) { _channel_info = std::move(channel_info); }

    void SourceNode::validate_initialization() {
        if (!_channel_info.has_value()) {
            throw_error<ValidationError>("The {} node did not publish its channel info during initialization", str());
        }
        _channel_info->validate(str());
    }

    bool SourceNode::do_reset() {
        request_reinitialize();
        initialize();
        return true;
    }

    void SourceNode::do_on_input_history_invalidation() {
    }

    // ProcessorNode

    NodeTypeEnum ProcessorNode::node_type() const { return NodeTypeEnum::PROCESSOR_NODE; }

    void ProcessorNode::update() {
        if (_disabled) {
            set_output(input());
        } else if (is_empty(input())) {
            clear_output();
        } else {
            Node::update();
        }
    }

    bool ProcessorNode::is_disabled() const { return _disabled; }

    void ProcessorNode::set_disabled(bool disabled) { _disabled = disabled; }

    std::optional<AttributeValue> ProcessorNode::attribute(std::string_view name) const {
        if (name == DISABLED_ATTRIBUTE) { return AttributeValue{_disabled}; }
        return Node::attribute(name);
    }

    // OutputNode

    NodeTypeEnum OutputNode::node_type() const { return NodeTypeEnum::OUTPUT_NODE; }

    void OutputNode::update() {
        if (_disabled || is_empty(input())) {
            clear_output();
            return;
        }
        Node::update();
    }

    bool OutputNode::is_disabled() const { return _disabled; }

    void OutputNode::set_disabled(bool disabled) { _disabled = disabled; }

    std::optional<AttributeValue> OutputNode::attribute(std::string_view name) const {
        if (name == DISABLED_ATTRIBUTE) { return AttributeValue{_disabled}; }
        return Node::attribute(name);
    }
} // namespace pulsegraph
