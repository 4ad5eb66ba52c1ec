#ifndef PULSEGRAPH_PREPROCESSING_H
#define PULSEGRAPH_PREPROCESSING_H

#include <pulsegraph/types/node.h>

namespace pulsegraph {
    /**
     * Passes the data through unchanged while it learns which channels are broken.
     *
     * For the first ``collect_for_seconds`` of data it accumulates per channel means and mean squares, once enough
     * samples are collected the channels whose standard deviation is an outlier are reported by
     * ``bad_channel_indices``. Only the channel labels of the upstream channel info matter, marking channels as bad
     * upstream does not restart the collection.
     */
    struct PULSEGRAPH_EXPORT Preprocessing : ProcessorNode {
        using ptr = Preprocessing*;
        using s_ptr = std::shared_ptr<Preprocessing>;

        static constexpr double OUTLIER_THRESHOLD = 3.0;
        static constexpr int OUTLIER_MAX_ITERATIONS = 2;

        explicit Preprocessing(double collect_for_seconds = 60.0);

        [[nodiscard]] double collect_for_seconds() const;

        void set_collect_for_seconds(double value);

        [[nodiscard]] int64_t samples_collected() const;

        [[nodiscard]] int64_t samples_to_be_collected() const;

        [[nodiscard]] bool enough_collected() const;

        [[nodiscard]] const std::vector<size_t> &bad_channel_indices() const;

        [[nodiscard]] const attribute_names_t &reset_attributes() const override;

        [[nodiscard]] const upstream_dependencies_t &reinitialization_dependencies() const override;

    protected:
        void do_initialize() override;

        void do_update() override;

        bool do_reset() override;

        void do_on_input_history_invalidation() override;

    private:
        void reset_statistics();

        void update_statistics(const SignalBuffer &input);

        [[nodiscard]] std::vector<double> standard_deviations() const;

        double _collect_for_seconds;
        double _sampling_frequency{0.0};
        size_t _channel_count{0};
        int64_t _samples_collected{0};
        int64_t _samples_to_be_collected{0};
        bool _enough_collected{false};
        std::vector<double> _means;
        std::vector<double> _mean_sums_of_squares;
        std::vector<size_t> _bad_channel_indices;
    };

    /**
     * Iterative z-score outlier detection: values further than ``threshold`` standard deviations from the mean of
     * the remaining values are flagged, repeated up to ``max_iterations`` times. Returns the flagged indices in
     * ascending order.
     */
    [[nodiscard]] PULSEGRAPH_EXPORT std::vector<size_t> find_outliers(const std::vector<double> &values,
                                                                      double threshold = Preprocessing::OUTLIER_THRESHOLD,
                                                                      int max_iterations =
                                                                          Preprocessing::OUTLIER_MAX_ITERATIONS);
} // namespace pulsegraph

#endif // PULSEGRAPH_PREPROCESSING_H
