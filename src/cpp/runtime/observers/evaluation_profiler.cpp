#include <pulsegraph/runtime/observers/evaluation_profiler.h>
#include <pulsegraph/types/node.h>

#include <fmt/format.h>
#include <algorithm>
#include <iostream>

namespace pulsegraph {

    EvaluationProfiler::EvaluationProfiler(bool print, std::ostream *out) : _print_enabled(print), _out(out) {
    }

    void EvaluationProfiler::_print(const std::string &msg) const {
        if (!_print_enabled) {
            return;
        }
        auto &out = _out != nullptr ? *_out : std::cout;
        out << msg << std::endl;
    }

    // Events nest (an update may run an initialise), so the start times are kept as a stack.
    void EvaluationProfiler::_start() {
        _start_times.push_back(engine_now());
    }

    engine_time_delta_t EvaluationProfiler::_stop() {
        if (_start_times.empty()) {
            return engine_time_delta_t{0};
        }
        auto elapsed = elapsed_since(_start_times.back());
        _start_times.pop_back();
        return elapsed;
    }

    void EvaluationProfiler::on_before_initialize_pipeline(Pipeline &) {
        _start();
    }

    void EvaluationProfiler::on_after_initialize_pipeline(Pipeline &) {
        _initialization_time = _stop();
        _print(fmt::format("Finish initialization in {:.1f} ms", to_milliseconds(_initialization_time)));
    }

    void EvaluationProfiler::on_before_tick(Pipeline &) {
        _start();
    }

    void EvaluationProfiler::on_after_tick(Pipeline &) {
        auto elapsed = _stop();
        ++_tick_count;
        _total_tick_time += elapsed;
        _max_tick_time = std::max(_max_tick_time, elapsed);
        _print(fmt::format("Tick {} done in {:.3f} ms", _tick_count, to_milliseconds(elapsed)));
    }

    void EvaluationProfiler::on_before_node_initialize(Node &) {
        _start();
    }

    void EvaluationProfiler::on_after_node_initialize(Node &node) {
        auto &profile = _profiles[node.str()];
        ++profile.initialize_count;
        profile.initialize_time += _stop();
    }

    void EvaluationProfiler::on_before_node_update(Node &) {
        _start();
    }

    void EvaluationProfiler::on_after_node_update(Node &node) {
        auto elapsed = _stop();
        auto &profile = _profiles[node.str()];
        ++profile.update_count;
        profile.update_time += elapsed;
        profile.max_update_time = std::max(profile.max_update_time, elapsed);
    }

    void EvaluationProfiler::on_before_node_reset(Node &) {
        _start();
    }

    void EvaluationProfiler::on_after_node_reset(Node &node) {
        auto &profile = _profiles[node.str()];
        ++profile.reset_count;
        profile.reset_time += _stop();
    }

    void EvaluationProfiler::on_before_node_history_invalidation(Node &) {
        _start();
    }

    void EvaluationProfiler::on_after_node_history_invalidation(Node &node) {
        auto &profile = _profiles[node.str()];
        ++profile.history_invalidation_count;
        profile.history_invalidation_time += _stop();
    }

    const std::map<std::string, NodeProfile> &EvaluationProfiler::profiles() const {
        return _profiles;
    }

    const NodeProfile *EvaluationProfiler::profile(const std::string &node_name) const {
        auto it = _profiles.find(node_name);
        return it == _profiles.end() ? nullptr : &it->second;
    }

    int64_t EvaluationProfiler::tick_count() const {
        return _tick_count;
    }

    engine_time_delta_t EvaluationProfiler::total_tick_time() const {
        return _total_tick_time;
    }

    engine_time_delta_t EvaluationProfiler::max_tick_time() const {
        return _max_tick_time;
    }

    engine_time_delta_t EvaluationProfiler::initialization_time() const {
        return _initialization_time;
    }

} // namespace pulsegraph
