#include <pulsegraph/nodes/preprocessing.h>

#include <cmath>

namespace pulsegraph {
    Preprocessing::Preprocessing(double collect_for_seconds)
        : ProcessorNode("Preprocessing"), _collect_for_seconds{collect_for_seconds} {
        if (!(std::isfinite(collect_for_seconds) && collect_for_seconds > 0.0)) {
            throw_error<ValidationError>("collect_for_seconds must be a positive number, got {}", collect_for_seconds);
        }
    }

    double Preprocessing::collect_for_seconds() const { return _collect_for_seconds; }

    void Preprocessing::set_collect_for_seconds(double value) {
        if (!(std::isfinite(value) && value > 0.0)) {
            throw_error<ValidationError>("collect_for_seconds of the {} node must be a positive number, got {}", str(),
                                         value);
        }
        _collect_for_seconds = value;
        mark_reset_needed();
    }

    int64_t Preprocessing::samples_collected() const { return _samples_collected; }

    int64_t Preprocessing::samples_to_be_collected() const { return _samples_to_be_collected; }

    bool Preprocessing::enough_collected() const { return _enough_collected; }

    const std::vector<size_t> &Preprocessing::bad_channel_indices() const { return _bad_channel_indices; }

    const attribute_names_t &Preprocessing::reset_attributes() const {
        static const attribute_names_t names{"collect_for_seconds"};
        return names;
    }

    const upstream_dependencies_t &Preprocessing::reinitialization_dependencies() const {
        static const upstream_dependencies_t dependencies{
            {std::string{CHANNEL_INFO_ATTRIBUTE}, reduce_to_channel_labels}
        };
        return dependencies;
    }

    void Preprocessing::do_initialize() {
        auto channel_info{upstream_channel_info()};
        _sampling_frequency = channel_info.sampling_frequency;
        _channel_count = channel_info.channel_count();
        reset_statistics();
    }

    void Preprocessing::do_update() {
        const auto &input_buffer{*input()};
        if (input_buffer.channel_count() != _channel_count) {
            throw_error<ValidationError>("The {} node was initialized for {} channels, got {}", str(), _channel_count,
                                         input_buffer.channel_count());
        }

        // Have we collected enough samples without the new input?
        if (_samples_collected < _samples_to_be_collected) {
            update_statistics(input_buffer);
        } else if (!_enough_collected) {
            _enough_collected = true;
            _bad_channel_indices = find_outliers(standard_deviations());
        }
        set_output(input());
    }

    bool Preprocessing::do_reset() {
        reset_statistics();
        return true;
    }

    // The labels are unchanged, the sampling frequency may not be
    void Preprocessing::do_on_input_history_invalidation() {
        _sampling_frequency = upstream_channel_info().sampling_frequency;
        reset_statistics();
    }

    void Preprocessing::reset_statistics() {
        _samples_to_be_collected = static_cast<int64_t>(std::ceil(_collect_for_seconds * _sampling_frequency));
        _samples_collected = 0;
        _enough_collected = false;
        _means.assign(_channel_count, 0.0);
        _mean_sums_of_squares.assign(_channel_count, 0.0);
        _bad_channel_indices.clear();
    }

    void Preprocessing::update_statistics(const SignalBuffer &input) {
        auto n{static_cast<double>(_samples_collected)};
        auto m{static_cast<double>(input.sample_count())};
        if (input.sample_count() == 0) { return; }

        for (size_t c = 0; c < _channel_count; ++c) {
            double sum{0.0};
            double sum_of_squares{0.0};
            for (auto value: input.channel(c)) {
                sum += value;
                sum_of_squares += value * value;
            }
            _means[c] = (_means[c] * n + sum) / (n + m);
            _mean_sums_of_squares[c] = (_mean_sums_of_squares[c] * n + sum_of_squares) / (n + m);
        }
        _samples_collected += static_cast<int64_t>(input.sample_count());
    }

    std::vector<double> Preprocessing::standard_deviations() const {
        std::vector<double> result(_channel_count, 0.0);
        auto n{static_cast<double>(_samples_collected)};
        if (_samples_collected < 2) { return result; }

        for (size_t c = 0; c < _channel_count; ++c) {
            auto variance{n / (n - 1.0) * (_mean_sums_of_squares[c] - _means[c] * _means[c])};
            result[c] = variance > 0.0 ? std::sqrt(variance) : 0.0;
        }
        return result;
    }

    std::vector<size_t> find_outliers(const std::vector<double> &values, double threshold, int max_iterations) {
        std::vector<bool> is_outlier(values.size(), false);

        for (int iteration = 0; iteration < max_iterations; ++iteration) {
            double sum{0.0};
            size_t count{0};
            for (size_t i = 0; i < values.size(); ++i) {
                if (!is_outlier[i]) {
                    sum += values[i];
                    ++count;
                }
            }
            if (count < 2) { break; }

            auto mean{sum / static_cast<double>(count)};
            double squares{0.0};
            for (size_t i = 0; i < values.size(); ++i) {
                if (!is_outlier[i]) { squares += (values[i] - mean) * (values[i] - mean); }
            }
            auto deviation{std::sqrt(squares / static_cast<double>(count))};
            if (deviation == 0.0) { break; }

            bool found{false};
            for (size_t i = 0; i < values.size(); ++i) {
                if (!is_outlier[i] && std::abs(values[i] - mean) > threshold * deviation) {
                    is_outlier[i] = true;
                    found = true;
                }
            }
            if (!found) { break; }
        }

        std::vector<size_t> outliers;
        for (size_t i = 0; i < values.size(); ++i) {
            if (is_outlier[i]) { outliers.push_back(i); }
        }
        return outliers;
    }
} // namespace pulsegraph
