#include <boost/assert.hpp>
#include <spdlog/fmt/fmt.h>

#include "buffer_range_writer.hpp"
#include "error_code.hpp"

namespace rangeio
{

buffer_range_writer::buffer_range_writer(std::shared_ptr<std::vector<char> const> buffer) :
	buffer_(std::move(buffer))
{
	BOOST_ASSERT(buffer_ != nullptr);
}

void buffer_range_writer::write_to(byte_sink &sink, std::int64_t offset, std::int64_t length)
{
	detail::check_range(offset, length);

	auto const size = static_cast<std::int64_t>(buffer_->size());
	if (offset > size || length > size - offset) {
		errors::throw_error(errors::range_out_of_bounds,
			fmt::format("range {}+{} exceeds buffer of {} bytes", offset, length, size));
	}

	if (length > 0) {
		sink.write(buffer_->data() + offset, static_cast<std::size_t>(length));
	}
}

}  // namespace rangeio
