#include <pulsegraph/runtime/pipeline.h>

#include <algorithm>
#include <utility>

namespace pulsegraph {
    Pipeline::Pipeline(PipelineConfiguration configuration) : _configuration{std::move(configuration)} {
        if (_configuration.trace) {
            _trace = std::make_unique<EvaluationTrace>(_configuration.trace_filter, true, true,
                                                       _configuration.trace_updates, true);
            _graph.add_life_cycle_observer(_trace.get());
        }
        if (_configuration.profile) {
            _profiler = std::make_unique<EvaluationProfiler>(_configuration.profile_print);
            _graph.add_life_cycle_observer(_profiler.get());
        }
    }

    Pipeline::~Pipeline() {
        if (_trace) { _graph.remove_life_cycle_observer(_trace.get()); }
        if (_profiler) { _graph.remove_life_cycle_observer(_profiler.get()); }
    }

    Graph &Pipeline::graph() { return _graph; }

    const Graph &Pipeline::graph() const { return _graph; }

    const PipelineConfiguration &Pipeline::configuration() const { return _configuration; }

    const source_node_s_ptr &Pipeline::source() const { return _source; }

    void Pipeline::set_source(source_node_s_ptr source) {
        if (source == nullptr) { throw_error<ProtocolViolation>("The pipeline source cannot be empty"); }
        if (source == _source) { return; }

        ensure_registered(source);
        auto old_source{std::exchange(_source, std::move(source))};

        if (old_source != nullptr) {
            // Copy, connecting a listener to the new source removes it from this list
            auto listeners{old_source->listeners()};
            for (auto listener: listeners) { listener->set_upstream(_source.get()); }
            std::ranges::replace(_parents_of_outputs, node_ptr{old_source.get()}, node_ptr{_source.get()});
            _graph.remove_node(*old_source);
        }
        if (!_processors.empty() && _processors.front()->upstream() == nullptr) {
            _processors.front()->set_upstream(_source.get());
        }
        reconnect_floating_outputs();
    }

    void Pipeline::add_processor(processor_node_s_ptr processor) {
        if (processor == nullptr) { throw_error<ProtocolViolation>("Cannot add an empty processor to the pipeline"); }
        if (std::ranges::find(_processors, processor) != _processors.end()) {
            throw_error<DuplicateNodeError>("The {} processor is already part of the pipeline", processor->str());
        }

        ensure_registered(processor);
        if (processor->upstream() == nullptr) {
            if (auto tail{last_node_before_outputs()}; tail != nullptr) { processor->set_upstream(tail); }
        }
        _processors.push_back(std::move(processor));
        reconnect_floating_outputs();
    }

    void Pipeline::add_output(output_node_s_ptr output, node_ptr parent) {
        if (output == nullptr) { throw_error<ProtocolViolation>("Cannot add an empty output to the pipeline"); }
        if (std::ranges::find(_outputs, output) != _outputs.end()) {
            throw_error<DuplicateNodeError>("The {} output is already part of the pipeline", output->str());
        }

        auto registered{ensure_registered(output)};
        if (auto upstream{parent != nullptr ? parent : last_node_before_outputs()}; upstream != nullptr) {
            try {
                output->set_upstream(upstream);
            } catch (...) {
                if (registered) { _graph.remove_node(*output); }
                throw;
            }
        }
        _outputs.push_back(std::move(output));
        _parents_of_outputs.push_back(parent);
    }

    const std::vector<processor_node_s_ptr> &Pipeline::processors() const { return _processors; }

    const std::vector<output_node_s_ptr> &Pipeline::outputs() const { return _outputs; }

    std::vector<node_ptr> Pipeline::all_nodes() const {
        std::vector<node_ptr> nodes;
        nodes.reserve(1 + _processors.size() + _outputs.size());
        if (_source != nullptr) { nodes.push_back(_source.get()); }
        for (const auto &processor: _processors) { nodes.push_back(processor.get()); }
        for (const auto &output: _outputs) { nodes.push_back(output.get()); }
        return nodes;
    }

    double Pipeline::frequency() const {
        if (_source == nullptr) { throw_error<ProtocolViolation>("The pipeline has no source"); }
        const auto &channel_info{_source->channel_info()};
        if (!_source->is_initialized() || !channel_info.has_value()) {
            throw_error<ProtocolViolation>("The {} source has not been initialized", _source->str());
        }
        return channel_info->sampling_frequency;
    }

    void Pipeline::initialize_all() {
        if (_source == nullptr) { throw_error<ProtocolViolation>("Cannot initialize a pipeline without a source"); }

        NotifyPipelineEvent notify{*this, PipelineEvent::INITIALIZE};
        _graph.validate();
        for (auto node: evaluation_order()) {
            if (!node->is_initialized() || node->reinitialize_requested()) { node->initialize(); }
        }
    }

    void Pipeline::tick() {
        NotifyPipelineEvent notify{*this, PipelineEvent::TICK};
        for (auto node: evaluation_order()) { node->update(); }
        ++_tick_count;
    }

    int64_t Pipeline::tick_count() const { return _tick_count; }

    const EvaluationProfiler *Pipeline::profiler() const { return _profiler.get(); }

    const EvaluationTrace *Pipeline::trace() const { return _trace.get(); }

    // Nodes registered with the graph directly are not part of the pipeline and are not evaluated by it
    std::vector<node_ptr> Pipeline::evaluation_order() const {
        auto members{all_nodes()};
        std::vector<node_ptr> order;
        order.reserve(members.size());
        for (auto node: _graph.topological_order()) {
            if (std::ranges::find(members, node) != members.end()) { order.push_back(node); }
        }
        return order;
    }

    node_ptr Pipeline::last_node_before_outputs() const {
        if (!_processors.empty()) { return _processors.back().get(); }
        return _source.get();
    }

    bool Pipeline::ensure_registered(const node_s_ptr &node) {
        if (_graph.contains(*node)) { return false; }
        _graph.add_node(node);
        return true;
    }

    void Pipeline::reconnect_floating_outputs() {
        auto tail{last_node_before_outputs()};
        if (tail == nullptr) { return; }
        for (size_t i = 0; i < _outputs.size(); ++i) {
            if (_parents_of_outputs[i] == nullptr) { _outputs[i]->set_upstream(tail); }
        }
    }
} // namespace pulsegraph
