#ifndef __STREAM_RANGE_WRITER_HPP__
#define __STREAM_RANGE_WRITER_HPP__

#include <functional>
#include <memory>
#include <vector>

#include "channel.hpp"
#include "range_writer.hpp"

namespace rangeio
{

// Ranges of a forward-only stream. A range starting before the current
// position reopens the stream through the supplier.
class stream_range_writer final : public range_writer
{
public:
	using stream_supplier = std::function<std::unique_ptr<input_stream>()>;

	explicit stream_range_writer(stream_supplier supplier,
		std::size_t buffer_size = default_buffer_size);

	// initial must be positioned at the start of the resource
	stream_range_writer(std::unique_ptr<input_stream> initial,
		stream_supplier supplier,
		std::size_t buffer_size = default_buffer_size);

	void write_to(byte_sink &sink, std::int64_t offset, std::int64_t length) override;
	void close() override;

	std::int64_t position() const
	{
		return pos_;
	}

private:
	void open_stream();

	stream_supplier supplier_;
	std::unique_ptr<input_stream> stream_;
	std::vector<char> buffer_;
	std::int64_t pos_{0};
	bool closed_{false};
};

}  // namespace rangeio

#endif
