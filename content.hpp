#ifndef __CONTENT_HPP__
#define __CONTENT_HPP__

#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "channel.hpp"
#include "range_writer.hpp"

namespace rangeio
{

enum class source_kind {
	none,
	regular_file,
	gzip_archive,
};

// A resource that byte ranges are served from, with whatever access paths it
// offers. new_range_writer() picks the cheapest one.
struct content {
	// whole resource already in memory
	std::shared_ptr<std::vector<char> const> buffer;

	std::string path;
	source_kind kind = source_kind::none;

	// any other forward-only origin
	std::function<std::unique_ptr<input_stream>()> stream_supplier;

	std::int64_t length = 0;
	std::string content_type = "application/octet-stream";

	// A ".gz" suffix is served as the decompressed archive entry, otherwise
	// the file itself. in_memory loads the whole resource up front.
	static content from_file(std::string const &path, bool in_memory = false,
		bool force_gzip = false);
};

std::unique_ptr<range_writer> new_range_writer(content const &c,
	std::size_t buffer_size = default_buffer_size);

}  // namespace rangeio

#endif
