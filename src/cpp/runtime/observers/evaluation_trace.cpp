#include <pulsegraph/runtime/observers/evaluation_trace.h>
#include <pulsegraph/types/node.h>

#include <fmt/format.h>
#include <iostream>

namespace pulsegraph {

    // Static member initialization
    bool EvaluationTrace::_use_logger = true;

    EvaluationTrace::EvaluationTrace(std::optional<std::string> filter, bool initialize, bool reset, bool update,
                                     bool tick, std::ostream *out)
        : _filter(std::move(filter)), _initialize(initialize), _reset(reset), _update(update), _tick(tick),
          _out(out) {
    }

    void EvaluationTrace::set_use_logger(bool value) {
        _use_logger = value;
    }

    void EvaluationTrace::_print(const std::string &msg) const {
        std::string formatted = fmt::format("[tick {}] {}", _tick_count, msg);
        if (_out != nullptr) {
            *_out << formatted << std::endl;
        } else if (_use_logger) {
            std::cerr << formatted << std::endl;
        } else {
            std::cout << formatted << std::endl;
        }
    }

    void EvaluationTrace::_print_node(const Node &node, const std::string &msg) const {
        _print(fmt::format("[{}] {}", node.str(), msg));
    }

    bool EvaluationTrace::_should_log_node(const Node &node) const {
        if (!_filter.has_value()) {
            return true;
        }
        return node.str().find(_filter.value()) != std::string::npos;
    }

    void EvaluationTrace::on_before_initialize_pipeline(Pipeline &) {
        if (_initialize) {
            _print(fmt::format(">> {} Initializing Pipeline {}", std::string(15, '.'), std::string(15, '.')));
        }
    }

    void EvaluationTrace::on_after_initialize_pipeline(Pipeline &) {
        if (_initialize) {
            _print(fmt::format("<< {} Initialized Pipeline {}", std::string(15, '.'), std::string(15, '.')));
        }
    }

    void EvaluationTrace::on_before_tick(Pipeline &) {
        ++_tick_count;
        if (_tick) {
            _print(fmt::format("{} Tick Start {}", std::string(20, '>'), std::string(20, '>')));
        }
    }

    void EvaluationTrace::on_after_tick(Pipeline &) {
        if (_tick) {
            _print(fmt::format("{} Tick Done {}", std::string(20, '<'), std::string(20, '<')));
        }
    }

    void EvaluationTrace::on_before_node_initialize(Node &node) {
        if (_initialize && _should_log_node(node)) {
            _print_node(node, "Initializing");
        }
    }

    void EvaluationTrace::on_after_node_initialize(Node &node) {
        if (_initialize && _should_log_node(node)) {
            _print_node(node, node.is_initialized() ? "Initialized" : "Initialization failed");
        }
    }

    void EvaluationTrace::on_before_node_update(Node &node) {
        if (_update && _should_log_node(node)) {
            _print_node(node, fmt::format("[IN] {}", to_string(node.state())));
        }
    }

    void EvaluationTrace::on_after_node_update(Node &node) {
        if (_update && _should_log_node(node)) {
            const auto &output = node.output();
            if (is_empty(output)) {
                _print_node(node, "[OUT] <empty>");
            } else {
                _print_node(node, fmt::format("[OUT] {}x{}", output->channel_count(), output->sample_count()));
            }
        }
    }

    void EvaluationTrace::on_before_node_reset(Node &node) {
        if (_reset && _should_log_node(node)) {
            _print_node(node, "Resetting because of attribute changes");
        }
    }

    void EvaluationTrace::on_before_node_history_invalidation(Node &node) {
        if (_reset && _should_log_node(node)) {
            _print_node(node, "Resetting because history is no longer valid");
        }
    }

} // namespace pulsegraph
