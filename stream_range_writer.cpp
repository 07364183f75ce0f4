#include <algorithm>

#include <spdlog/spdlog.h>

#include "error_code.hpp"
#include "stream_range_writer.hpp"

namespace rangeio
{

stream_range_writer::stream_range_writer(stream_supplier supplier, std::size_t buffer_size) :
	supplier_(std::move(supplier)),
	buffer_(std::max<std::size_t>(buffer_size, 1))
{
}

stream_range_writer::stream_range_writer(std::unique_ptr<input_stream> initial,
	stream_supplier supplier, std::size_t buffer_size) :
	supplier_(std::move(supplier)),
	stream_(std::move(initial)),
	buffer_(std::max<std::size_t>(buffer_size, 1))
{
}

void stream_range_writer::write_to(byte_sink &sink, std::int64_t offset, std::int64_t length)
{
	detail::check_range(offset, length);
	if (closed_) {
		errors::throw_error(errors::writer_closed, "stream_range_writer");
	}

	if (!stream_) {
		open_stream();
	} else if (offset < pos_) {
		spdlog::debug("rewind from {} to {}, reopening stream", pos_, offset);
		open_stream();
	}

	detail::skip_forward(*stream_, buffer_, pos_, offset);
	detail::copy_range(*stream_, buffer_, pos_, sink, length);
}

void stream_range_writer::close()
{
	stream_.reset();
	closed_ = true;
}

void stream_range_writer::open_stream()
{
	stream_.reset();
	if (!supplier_) {
		errors::throw_error(errors::failed_to_open, "no stream supplier");
	}
	stream_ = supplier_();
	if (!stream_) {
		errors::throw_error(errors::failed_to_open, "stream supplier returned no stream");
	}
	pos_ = 0;
}

}  // namespace rangeio
