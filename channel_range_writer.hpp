#ifndef __CHANNEL_RANGE_WRITER_HPP__
#define __CHANNEL_RANGE_WRITER_HPP__

#include <functional>
#include <memory>
#include <vector>

#include "channel.hpp"
#include "range_writer.hpp"

namespace rangeio
{

// Ranges of a seekable channel.
//
// The channel is positioned natively until it first reports
// errors::positioning_unsupported. From then on the writer skips forward by
// reading and discarding, and reopens the channel through the supplier
// whenever a range starts before the current position.
class channel_range_writer final : public range_writer
{
public:
	using channel_supplier = std::function<std::unique_ptr<seekable_channel>()>;

	explicit channel_range_writer(channel_supplier supplier,
		std::size_t buffer_size = default_buffer_size);

	// initial must be positioned at the start of the resource
	channel_range_writer(std::unique_ptr<seekable_channel> initial,
		channel_supplier supplier,
		std::size_t buffer_size = default_buffer_size);

	void write_to(byte_sink &sink, std::int64_t offset, std::int64_t length) override;
	void close() override;

	bool native_seek() const
	{
		return native_seek_;
	}

	std::int64_t position() const
	{
		return pos_;
	}

private:
	void open_channel();
	void skip_to(std::int64_t target);
	void fallback_skip_to(std::int64_t target);

	channel_supplier supplier_;
	std::unique_ptr<seekable_channel> channel_;
	std::vector<char> buffer_;
	std::int64_t pos_{0};
	bool native_seek_{true};
	bool closed_{false};
};

}  // namespace rangeio

#endif
