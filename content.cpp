#include <cerrno>
#include <sys/stat.h>

#include <boost/algorithm/string/predicate.hpp>
#include <boost/system/system_error.hpp>
#include <spdlog/spdlog.h>

#include "buffer_range_writer.hpp"
#include "channel_range_writer.hpp"
#include "content.hpp"
#include "error_code.hpp"
#include "stream_range_writer.hpp"

namespace rangeio
{

namespace
{
std::unique_ptr<seekable_channel> open_channel(std::string const &path, source_kind kind)
{
	if (kind == source_kind::gzip_archive) {
		return std::make_unique<gzip_channel>(path);
	}
	return std::make_unique<file_channel>(path);
}

// reads in to the end, appending to out when given
std::int64_t drain(input_stream &in, std::vector<char> *out)
{
	std::vector<char> scratch(default_buffer_size);
	std::int64_t total = 0;
	for (;;) {
		boost::system::error_code ec;
		std::int64_t nread = in.read(scratch.data(), scratch.size(), ec);
		if (ec) {
			errors::throw_error(ec, "read");
		}
		if (nread < 0) {
			break;
		}
		if (out) {
			out->insert(out->end(), scratch.begin(), scratch.begin() + nread);
		}
		total += nread;
	}
	return total;
}
}  // namespace

content content::from_file(std::string const &path, bool in_memory, bool force_gzip)
{
	content c;
	c.path = path;
	c.kind = (force_gzip || boost::algorithm::ends_with(path, ".gz"))
		? source_kind::gzip_archive
		: source_kind::regular_file;

	if (c.kind == source_kind::regular_file) {
		struct stat st;
		if (::stat(path.c_str(), &st) < 0) {
			throw boost::system::system_error(errno, boost::system::system_category(), "stat " + path);
		}
		c.length = st.st_size;
	}

	if (in_memory) {
		auto data = std::make_shared<std::vector<char>>();
		auto channel = open_channel(path, c.kind);
		c.length = drain(*channel, data.get());
		c.buffer = data;
	} else if (c.kind == source_kind::gzip_archive) {
		// archive entries do not record their decompressed size reliably
		gzip_channel channel(path);
		c.length = drain(channel, nullptr);
	}

	spdlog::debug("content {} length={} gzip={} in_memory={}",
		path, c.length, c.kind == source_kind::gzip_archive, in_memory);
	return c;
}

std::unique_ptr<range_writer> new_range_writer(content const &c, std::size_t buffer_size)
{
	if (c.buffer) {
		return std::make_unique<buffer_range_writer>(c.buffer);
	}

	if (c.kind != source_kind::none) {
		std::string path = c.path;
		source_kind kind = c.kind;
		return std::make_unique<channel_range_writer>(
			[path, kind]() { return open_channel(path, kind); }, buffer_size);
	}

	if (c.stream_supplier) {
		return std::make_unique<stream_range_writer>(c.stream_supplier, buffer_size);
	}

	errors::throw_error(errors::failed_to_open, "content has no readable source");
}

}  // namespace rangeio
