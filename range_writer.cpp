#include <algorithm>

#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

#include "channel.hpp"
#include "error_code.hpp"
#include "range_writer.hpp"

namespace rangeio
{
namespace detail
{

void check_range(std::int64_t offset, std::int64_t length)
{
	if (offset < 0 || length < 0) {
		errors::throw_error(errors::invalid_range,
			fmt::format("offset {} length {}", offset, length));
	}
}

void skip_forward(input_stream &in, std::vector<char> &scratch,
	std::int64_t &pos, std::int64_t target)
{
	int no_progress = no_progress_limit;
	while (pos < target) {
		auto len = static_cast<std::size_t>(
			std::min<std::int64_t>(scratch.size(), target - pos));

		boost::system::error_code ec;
		std::int64_t skipped = in.read(scratch.data(), len, ec);
		if (ec) {
			errors::throw_error(ec, fmt::format("read while skipping to {}", target));
		}

		if (skipped < 0) {
			errors::throw_error(errors::end_of_data,
				fmt::format("end of data at {} while skipping to {}", pos, target));
		}

		if (skipped == 0) {
			if (--no_progress <= 0) {
				spdlog::warn("no progress skipping to {}, stuck at {}", target, pos);
				errors::throw_error(errors::no_progress,
					fmt::format("no progress made to reach seek position {} (got to {})", target, pos));
			}
			continue;
		}

		pos += skipped;
		no_progress = no_progress_limit;
	}
}

void copy_range(input_stream &in, std::vector<char> &scratch,
	std::int64_t &pos, byte_sink &sink, std::int64_t length)
{
	std::int64_t remaining = length;
	while (remaining > 0) {
		auto len = static_cast<std::size_t>(
			std::min<std::int64_t>(scratch.size(), remaining));

		boost::system::error_code ec;
		std::int64_t nread = in.read(scratch.data(), len, ec);
		if (ec) {
			errors::throw_error(ec, fmt::format("read at {}", pos));
		}

		if (nread < 0) {
			errors::throw_error(errors::end_of_data,
				fmt::format("end of data at {} with {} of {} bytes left", pos, remaining, length));
		}

		if (nread > 0) {
			// pos tracks the source even when the sink throws
			pos += nread;
			remaining -= nread;
			sink.write(scratch.data(), static_cast<std::size_t>(nread));
		}
	}
}

}  // namespace detail
}  // namespace rangeio
