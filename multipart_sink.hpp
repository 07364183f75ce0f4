#ifndef __MULTIPART_SINK_HPP__
#define __MULTIPART_SINK_HPP__

#include <string>
#include <vector>

#include "writer.hpp"

namespace rangeio
{

// Frames the bytes written through it as a multipart body:
//
//   --boundary CRLF
//   Content-Type: type CRLF
//   header CRLF ...
//   CRLF
//   body
//   CRLF --boundary-- CRLF
//
// Parts after the first are preceded by an extra CRLF.
class multipart_sink : public byte_sink
{
public:
	explicit multipart_sink(byte_sink &out);
	multipart_sink(byte_sink &out, std::string boundary);

	std::string const &boundary() const
	{
		return boundary_;
	}

	// headers are complete "Name: value" lines without line ending
	void start_part(std::string const &content_type,
		std::vector<std::string> const &headers = std::vector<std::string>());

	void write(char const *buf, std::size_t count) override;

	// writes the closing delimiter
	void close();

	static std::string generate_boundary();

private:
	void write_string(std::string const &s);

	byte_sink &out_;
	std::string boundary_;
	bool in_part_{false};
	bool closed_{false};
};

}  // namespace rangeio

#endif
