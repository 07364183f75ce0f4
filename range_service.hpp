#ifndef __RANGE_SERVICE_HPP__
#define __RANGE_SERVICE_HPP__

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

#include "content.hpp"
#include "writer.hpp"

namespace rangeio
{

struct range_response {
	int status = 200;
	std::vector<std::pair<std::string, std::string>> headers;
	std::int64_t content_length = 0;

	// first value of the named header, empty if absent
	std::string header(std::string const &name) const;
};

// Answers a request for content carrying zero or more Range headers, writing
// the response body to the sink.
class range_service
{
public:
	explicit range_service(std::size_t buffer_size = default_buffer_size) :
		buffer_size_(buffer_size)
	{
	}

	// legacy_request_range selects multipart/x-byteranges for clients that
	// sent the old Request-Range header
	range_response serve(content const &c,
		std::vector<std::string> const &range_headers,
		bool legacy_request_range,
		byte_sink &body);

	// also used when a multipart body is given its boundary by the caller
	range_response serve(content const &c,
		std::vector<std::string> const &range_headers,
		bool legacy_request_range,
		byte_sink &body,
		std::string const &boundary);

private:
	std::size_t buffer_size_;
};

}  // namespace rangeio

#endif
