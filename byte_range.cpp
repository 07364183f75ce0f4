#include <algorithm>
#include <cctype>
#include <stdexcept>

#include <boost/algorithm/string.hpp>
#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

#include "byte_range.hpp"

namespace rangeio
{

namespace
{
// parses a non-negative decimal, throws std::invalid_argument otherwise
std::int64_t parse_position(std::string const &text)
{
	std::string t = boost::algorithm::trim_copy(text);
	if (t.empty() || !std::all_of(t.begin(), t.end(), [](unsigned char c) { return std::isdigit(c); })) {
		throw std::invalid_argument(t);
	}
	return std::stoll(t);
}
}  // namespace

bool inclusive_byte_range::overlaps(inclusive_byte_range const &range) const
{
	return (range.first_ >= first_ && range.first_ <= last_)
		|| (range.last_ >= first_ && range.last_ <= last_)
		|| (range.first_ < first_ && range.last_ > last_);
}

void inclusive_byte_range::coalesce(inclusive_byte_range const &range)
{
	first_ = std::min(first_, range.first_);
	last_ = std::max(last_, range.last_);
}

std::string inclusive_byte_range::to_header_range_string(std::int64_t size) const
{
	return fmt::format("bytes {}-{}/{}", first_, last_, size);
}

std::string inclusive_byte_range::to_416_header_range_string(std::int64_t size)
{
	return fmt::format("bytes */{}", size);
}

std::vector<inclusive_byte_range> inclusive_byte_range::satisfiable_ranges(
	std::vector<std::string> const &headers, std::int64_t size)
{
	std::vector<inclusive_byte_range> ranges;
	std::int64_t const end = size - 1;

	for (auto const &header : headers) {
		std::vector<std::string> tokens;
		boost::algorithm::split(tokens, header, boost::algorithm::is_any_of("=,"),
			boost::algorithm::token_compress_on);

		for (auto const &token : tokens) {
			std::string t = boost::algorithm::trim_copy(token);
			if (t.empty() || t == "bytes") {
				continue;
			}

			std::int64_t first = -1;
			std::int64_t last = -1;
			auto dash = t.find('-');
			if (dash == std::string::npos || t.find('-', dash + 1) != std::string::npos) {
				spdlog::warn("bad range format: {}", t);
				ranges.clear();
				break;
			}

			try {
				if (dash > 0) {
					first = parse_position(t.substr(0, dash));
				}
				if (dash < t.size() - 1) {
					last = parse_position(t.substr(dash + 1));
				}
			} catch (std::exception const &) {
				spdlog::warn("bad range format: {}", t);
				ranges.clear();
				continue;
			}

			if (first == -1) {
				if (last == -1) {
					spdlog::warn("bad range format: {}", t);
					ranges.clear();
					break;
				}
				if (last == 0) {
					continue;
				}
				// suffix range
				first = std::max<std::int64_t>(0, end - last + 1);
				last = end;
			} else {
				// starts past the end
				if (first >= size) {
					continue;
				}
				if (last == -1 || last >= end) {
					last = end;
				}
			}

			if (last < first) {
				spdlog::warn("bad range format: {}", t);
				ranges.clear();
				break;
			}

			inclusive_byte_range range(first, last);
			bool coalesced = false;
			for (auto it = ranges.begin(); it != ranges.end(); ++it) {
				if (!range.overlaps(*it)) {
					continue;
				}
				coalesced = true;
				it->coalesce(range);
				// the grown range may now reach ranges after it
				for (auto next = it + 1; next != ranges.end();) {
					if (next->overlaps(*it)) {
						it->coalesce(*next);
						next = ranges.erase(next);
					} else {
						++next;
					}
				}
				break;
			}

			if (!coalesced) {
				ranges.push_back(range);
			}
		}
	}

	return ranges;
}

}  // namespace rangeio
