#ifndef PULSEGRAPH_CHANNEL_INFO_H
#define PULSEGRAPH_CHANNEL_INFO_H

#include <pulsegraph/pulsegraph_base.h>

#include <cstdint>

namespace pulsegraph {
    enum class ChannelType : std::uint8_t {
        EEG,
        MAG,
        GRAD,
        EOG,
        ECG,
        STIM,
        MISC
    };

    [[nodiscard]] PULSEGRAPH_EXPORT std::string_view to_string(ChannelType type);

    struct ChannelDescriptor {
        std::string name;
        ChannelType type{ChannelType::EEG};

        bool operator==(const ChannelDescriptor &) const = default;
    };

    /**
     * The sampling metadata produced by a source: the channels (in row order of the buffers it emits), the
     * sampling frequency and the channels currently marked as bad.
     *
     * This is the one structural precondition every node downstream of a source may rely on, the source refuses
     * to complete initialisation unless ``validate`` passes.
     */
    struct PULSEGRAPH_EXPORT ChannelInfo {
        ChannelInfo() = default;

        ChannelInfo(std::vector<ChannelDescriptor> channels_, double sampling_frequency_,
                    std::vector<std::string> bads_ = {});

        // All channels of one type, named <prefix>1 .. <prefix>N
        static ChannelInfo uniform(std::size_t channel_count, double sampling_frequency,
                                   ChannelType type = ChannelType::EEG, std::string_view prefix = "ch");

        std::vector<ChannelDescriptor> channels;
        double sampling_frequency{0.0};
        std::vector<std::string> bads;

        [[nodiscard]] std::size_t channel_count() const noexcept { return channels.size(); }

        [[nodiscard]] std::vector<std::string> channel_names() const;

        [[nodiscard]] std::optional<std::size_t> index_of(std::string_view name) const;

        [[nodiscard]] bool is_bad(std::string_view name) const;

        /**
         * Raises ValidationError if the descriptor is empty of channels, has no EEG or MEG channel, has empty or
         * duplicated channel names, marks unknown channels as bad, or has a non-positive sampling frequency.
         * ``owner`` is used to say which node produced the broken descriptor.
         */
        void validate(std::string_view owner) const;

        bool operator==(const ChannelInfo &) const = default;
    };
} // namespace pulsegraph

#endif // PULSEGRAPH_CHANNEL_INFO_H
