#include <chrono>
#include <random>

#include <spdlog/fmt/fmt.h>

#include "multipart_sink.hpp"

namespace rangeio
{

namespace
{
char const crlf[] = "\r\n";

std::string to_base36(unsigned long long v)
{
	static char const digits[] = "0123456789abcdefghijklmnopqrstuvwxyz";
	std::string ret;
	do {
		ret.insert(ret.begin(), digits[v % 36]);
		v /= 36;
	} while (v != 0);
	return ret;
}
}  // namespace

multipart_sink::multipart_sink(byte_sink &out) :
	out_(out), boundary_(generate_boundary())
{
}

multipart_sink::multipart_sink(byte_sink &out, std::string boundary) :
	out_(out), boundary_(std::move(boundary))
{
}

std::string multipart_sink::generate_boundary()
{
	std::random_device rd;
	auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
		std::chrono::system_clock::now().time_since_epoch()).count();
	return fmt::format("rangeio{:08x}{}", rd(), to_base36(static_cast<unsigned long long>(millis)));
}

void multipart_sink::start_part(std::string const &content_type,
	std::vector<std::string> const &headers)
{
	if (in_part_) {
		write_string(crlf);
	}
	in_part_ = true;

	write_string("--" + boundary_ + crlf);
	if (!content_type.empty()) {
		write_string("Content-Type: " + content_type + crlf);
	}
	for (auto const &header : headers) {
		write_string(header + crlf);
	}
	write_string(crlf);
}

void multipart_sink::write(char const *buf, std::size_t count)
{
	out_.write(buf, count);
}

void multipart_sink::write_string(std::string const &s)
{
	out_.write(s.data(), s.size());
}

void multipart_sink::close()
{
	if (closed_) {
		return;
	}
	closed_ = true;

	if (in_part_) {
		write_string(crlf);
	}
	write_string("--" + boundary_ + "--" + crlf);
}

}  // namespace rangeio
