#include <spdlog/spdlog.h>

#include "byte_range.hpp"
#include "multipart_sink.hpp"
#include "range_service.hpp"

namespace rangeio
{

namespace
{
// closes the writer on every exit path
class writer_closer
{
public:
	explicit writer_closer(range_writer &writer) :
		writer_(writer)
	{
	}

	~writer_closer()
	{
		writer_.close();
	}

private:
	range_writer &writer_;
};
}  // namespace

std::string range_response::header(std::string const &name) const
{
	for (auto const &h : headers) {
		if (h.first == name) {
			return h.second;
		}
	}
	return std::string();
}

range_response range_service::serve(content const &c,
	std::vector<std::string> const &range_headers,
	bool legacy_request_range,
	byte_sink &body)
{
	return serve(c, range_headers, legacy_request_range, body,
		multipart_sink::generate_boundary());
}

range_response range_service::serve(content const &c,
	std::vector<std::string> const &range_headers,
	bool legacy_request_range,
	byte_sink &body,
	std::string const &boundary)
{
	range_response response;
	response.headers.emplace_back("Accept-Ranges", "bytes");

	if (range_headers.empty()) {
		response.status = 200;
		response.content_length = c.length;
		response.headers.emplace_back("Content-Type", c.content_type);
		response.headers.emplace_back("Content-Length", std::to_string(c.length));

		auto writer = new_range_writer(c, buffer_size_);
		writer_closer closer(*writer);
		writer->write_to(body, 0, c.length);
		return response;
	}

	auto ranges = inclusive_byte_range::satisfiable_ranges(range_headers, c.length);

	if (ranges.empty()) {
		spdlog::debug("no satisfiable range in {} for {} bytes", range_headers.front(), c.length);
		response.status = 416;
		response.content_length = 0;
		response.headers.emplace_back("Content-Range",
			inclusive_byte_range::to_416_header_range_string(c.length));
		response.headers.emplace_back("Content-Length", "0");
		return response;
	}

	if (ranges.size() == 1) {
		auto const &range = ranges.front();
		response.status = 206;
		response.content_length = range.size();
		response.headers.emplace_back("Content-Type", c.content_type);
		response.headers.emplace_back("Content-Length", std::to_string(range.size()));
		response.headers.emplace_back("Content-Range", range.to_header_range_string(c.length));

		auto writer = new_range_writer(c, buffer_size_);
		writer_closer closer(*writer);
		writer->write_to(body, range.first(), range.size());
		return response;
	}

	// several ranges, one multipart body
	std::string const type = legacy_request_range
		? "multipart/x-byteranges; boundary="
		: "multipart/byteranges; boundary=";

	std::vector<std::string> part_headers;
	std::int64_t length = 0;
	for (std::size_t i = 0; i < ranges.size(); ++i) {
		part_headers.push_back("Content-Range: " + ranges[i].to_header_range_string(c.length));
		length += (i > 0 ? 2 : 0)
			+ 2 + boundary.size() + 2
			+ (c.content_type.empty() ? 0 : 14 + c.content_type.size() + 2)
			+ part_headers.back().size() + 2
			+ 2
			+ ranges[i].size();
	}
	length += 2 + 2 + boundary.size() + 2 + 2;

	response.status = 206;
	response.content_length = length;
	response.headers.emplace_back("Content-Type", type + boundary);
	response.headers.emplace_back("Content-Length", std::to_string(length));

	multipart_sink multi(body, boundary);
	auto writer = new_range_writer(c, buffer_size_);
	writer_closer closer(*writer);
	for (std::size_t i = 0; i < ranges.size(); ++i) {
		multi.start_part(c.content_type, {part_headers[i]});
		writer->write_to(multi, ranges[i].first(), ranges[i].size());
	}
	multi.close();

	return response;
}

}  // namespace rangeio
