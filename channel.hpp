#ifndef __CHANNEL_HPP__
#define __CHANNEL_HPP__

#include <cstdint>
#include <istream>
#include <memory>
#include <string>

#include <boost/core/noncopyable.hpp>
#include <boost/system/error_code.hpp>
#include <zlib.h>

namespace rangeio
{

// forward-only byte source.
//
// read() returns the number of bytes placed in buf, which may be 0 when the
// source made no progress, or -1 once the source is exhausted. On failure ec
// is set and the return value is meaningless.
class input_stream : boost::noncopyable
{
public:
	virtual ~input_stream() = default;

	virtual std::int64_t read(char *buf, std::size_t count, boost::system::error_code &ec) = 0;
};

// byte source with an explicit position. Implementations that cannot be
// positioned report errors::positioning_unsupported from position() or seek().
class seekable_channel : public input_stream
{
public:
	virtual std::int64_t position(boost::system::error_code &ec) = 0;
	virtual void seek(std::int64_t pos, boost::system::error_code &ec) = 0;
};

// regular file, read through a POSIX fd
class file_channel final : public seekable_channel
{
public:
	explicit file_channel(std::string const &path);
	~file_channel();

	std::int64_t read(char *buf, std::size_t count, boost::system::error_code &ec) override;
	std::int64_t position(boost::system::error_code &ec) override;
	void seek(std::int64_t pos, boost::system::error_code &ec) override;

private:
	int fd_{-1};
	std::string path_;
};

// decompressed content of a gzip archive. The position can be queried but
// never assigned.
class gzip_channel final : public seekable_channel
{
public:
	explicit gzip_channel(std::string const &path);
	~gzip_channel();

	std::int64_t read(char *buf, std::size_t count, boost::system::error_code &ec) override;
	std::int64_t position(boost::system::error_code &ec) override;
	void seek(std::int64_t pos, boost::system::error_code &ec) override;

private:
	gzFile file_{nullptr};
	std::string path_;
};

class istream_input final : public input_stream
{
public:
	explicit istream_input(std::unique_ptr<std::istream> is);

	std::int64_t read(char *buf, std::size_t count, boost::system::error_code &ec) override;

private:
	std::unique_ptr<std::istream> is_;
};

}  // namespace rangeio

#endif
