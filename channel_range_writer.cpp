#include <algorithm>

#include <spdlog/spdlog.h>

#include "channel_range_writer.hpp"
#include "error_code.hpp"

namespace rangeio
{

channel_range_writer::channel_range_writer(channel_supplier supplier, std::size_t buffer_size) :
	supplier_(std::move(supplier)),
	buffer_(std::max<std::size_t>(buffer_size, 1))
{
}

channel_range_writer::channel_range_writer(std::unique_ptr<seekable_channel> initial,
	channel_supplier supplier, std::size_t buffer_size) :
	supplier_(std::move(supplier)),
	channel_(std::move(initial)),
	buffer_(std::max<std::size_t>(buffer_size, 1))
{
}

void channel_range_writer::write_to(byte_sink &sink, std::int64_t offset, std::int64_t length)
{
	detail::check_range(offset, length);
	if (closed_) {
		errors::throw_error(errors::writer_closed, "channel_range_writer");
	}

	if (!channel_) {
		open_channel();
	}

	skip_to(offset);
	detail::copy_range(*channel_, buffer_, pos_, sink, length);
}

void channel_range_writer::close()
{
	channel_.reset();
	closed_ = true;
}

void channel_range_writer::open_channel()
{
	// the previous channel is released before the supplier runs
	channel_.reset();
	if (!supplier_) {
		errors::throw_error(errors::failed_to_open, "no channel supplier");
	}
	channel_ = supplier_();
	if (!channel_) {
		errors::throw_error(errors::failed_to_open, "channel supplier returned no channel");
	}
	pos_ = 0;
}

void channel_range_writer::skip_to(std::int64_t target)
{
	if (native_seek_) {
		boost::system::error_code ec;
		std::int64_t current = channel_->position(ec);
		if (!ec && current != target) {
			channel_->seek(target, ec);
		}

		if (!ec) {
			pos_ = target;
			return;
		}

		if (ec != errors::positioning_unsupported) {
			errors::throw_error(ec, "seek");
		}

		spdlog::debug("channel positioning unsupported, skipping by read from now on");
		native_seek_ = false;
	}

	fallback_skip_to(target);
}

void channel_range_writer::fallback_skip_to(std::int64_t target)
{
	if (target < pos_) {
		spdlog::debug("rewind from {} to {}, reopening channel", pos_, target);
		open_channel();
	}

	detail::skip_forward(*channel_, buffer_, pos_, target);
}

}  // namespace rangeio
