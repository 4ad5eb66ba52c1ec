#include <pulsegraph/nodes/buffer_source.h>

namespace pulsegraph {
    BufferSource::BufferSource(ChannelInfo channel_info)
        : SourceNode("BufferSource"), _configured_channel_info{std::move(channel_info)} {
    }

    const ChannelInfo &BufferSource::configured_channel_info() const { return _configured_channel_info; }

    void BufferSource::set_channel_info(ChannelInfo channel_info) {
        channel_info.validate(str());
        _configured_channel_info = std::move(channel_info);
        mark_reset_needed();
    }

    void BufferSource::set_bad_channels(std::vector<std::string> bad_channels) {
        for (const auto &name: bad_channels) {
            if (!_configured_channel_info.index_of(name).has_value()) {
                throw_error<ValidationError>("Cannot mark {} as bad on the {} node, there is no such channel", name,
                                             str());
            }
        }
        _configured_channel_info.bads = std::move(bad_channels);
        mark_reset_needed();
    }

    void BufferSource::push_chunk(SignalBuffer chunk) {
        if (chunk.channel_count() != _configured_channel_info.channel_count()) {
            throw_error<ValidationError>("The {} node expects chunks with {} channels, got {}", str(),
                                         _configured_channel_info.channel_count(), chunk.channel_count());
        }
        _chunks.push_back(std::move(chunk));
    }

    size_t BufferSource::pending_chunks() const { return _chunks.size(); }

    void BufferSource::clear_pending_chunks() { _chunks.clear(); }

    const attribute_names_t &BufferSource::reset_attributes() const {
        static const attribute_names_t names{"channel_info", "bad_channels"};
        return names;
    }

    void BufferSource::do_initialize() { publish_channel_info(_configured_channel_info); }

    void BufferSource::do_update() {
        if (_chunks.empty()) { return; }

        auto chunk{std::move(_chunks.front())};
        _chunks.pop_front();
        // The channel info may have changed after the chunk was queued
        if (auto expected{channel_info()->channel_count()}; chunk.channel_count() != expected) {
            throw_error<ValidationError>("The {} node dropped a chunk with {} channels, the channel info has {}",
                                         str(), chunk.channel_count(), expected);
        }
        set_output(std::make_shared<const SignalBuffer>(std::move(chunk)));
    }
} // namespace pulsegraph
