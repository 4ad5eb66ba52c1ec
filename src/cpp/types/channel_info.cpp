#include <pulsegraph/types/channel_info.h>

#include <algorithm>
#include <cmath>
#include <iterator>
#include <unordered_set>

namespace pulsegraph {
    std::string_view to_string(ChannelType type) {
        switch (type) {
            case ChannelType::EEG: return "eeg";
            case ChannelType::MAG: return "mag";
            case ChannelType::GRAD: return "grad";
            case ChannelType::EOG: return "eog";
            case ChannelType::ECG: return "ecg";
            case ChannelType::STIM: return "stim";
            case ChannelType::MISC: return "misc";
        }
        return "unknown";
    }

    ChannelInfo::ChannelInfo(std::vector<ChannelDescriptor> channels_, double sampling_frequency_,
                             std::vector<std::string> bads_)
        : channels{std::move(channels_)}, sampling_frequency{sampling_frequency_}, bads{std::move(bads_)} {
    }

    ChannelInfo ChannelInfo::uniform(std::size_t channel_count, double sampling_frequency, ChannelType type,
                                     std::string_view prefix) {
        std::vector<ChannelDescriptor> channels;
        channels.reserve(channel_count);
        for (std::size_t i = 0; i < channel_count; ++i) {
            channels.push_back({fmt::format("{}{}", prefix, i + 1), type});
        }
        return {std::move(channels), sampling_frequency};
    }

    std::vector<std::string> ChannelInfo::channel_names() const {
        std::vector<std::string> names;
        names.reserve(channels.size());
        std::ranges::transform(channels, std::back_inserter(names), &ChannelDescriptor::name);
        return names;
    }

    std::optional<std::size_t> ChannelInfo::index_of(std::string_view name) const {
        auto it = std::ranges::find(channels, name, &ChannelDescriptor::name);
        if (it == channels.end()) { return std::nullopt; }
        return static_cast<std::size_t>(std::distance(channels.begin(), it));
    }

    bool ChannelInfo::is_bad(std::string_view name) const { return std::ranges::find(bads, name) != bads.end(); }

    void ChannelInfo::validate(std::string_view owner) const {
        constexpr std::string_view hint{" Check the do_initialize() method"};

        if (channels.empty()) {
            throw_error<ValidationError>("{} node has 0 channels in its channel info.{}", owner, hint);
        }

        bool has_data_channel = std::ranges::any_of(channels, [](const ChannelDescriptor &c) {
            return c.type == ChannelType::EEG || c.type == ChannelType::MAG || c.type == ChannelType::GRAD;
        });
        if (!has_data_channel) {
            throw_error<ValidationError>("{} node has no channels of types {{grad, mag, eeg}}.{}", owner, hint);
        }

        if (!std::isfinite(sampling_frequency) || sampling_frequency <= 0.0) {
            throw_error<ValidationError>("The channel info of {} node is not self-consistent: sampling frequency {}",
                                         owner, sampling_frequency);
        }

        std::unordered_set<std::string_view> names;
        for (const auto &channel : channels) {
            if (channel.name.empty()) {
                throw_error<ValidationError>("The channel info of {} node is not self-consistent: empty channel name",
                                             owner);
            }
            if (!names.insert(channel.name).second) {
                throw_error<ValidationError>(
                    "The channel info of {} node is not self-consistent: duplicate channel name '{}'", owner,
                    channel.name);
            }
        }

        for (const auto &bad : bads) {
            if (!names.contains(bad)) {
                throw_error<ValidationError>(
                    "The channel info of {} node is not self-consistent: bad channel '{}' is not a channel", owner,
                    bad);
            }
        }
    }
} // namespace pulsegraph
