#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <unistd.h>

#include <boost/system/system_error.hpp>
#include <spdlog/spdlog.h>

#include "channel.hpp"
#include "error_code.hpp"

namespace rangeio
{

file_channel::file_channel(std::string const &path) :
	path_(path)
{
	fd_ = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
	if (fd_ < 0) {
		boost::system::error_code ec(errno, boost::system::system_category());
		spdlog::error("failed to open ({}) = {}", path, ec.message());
		throw boost::system::system_error(ec, "open " + path);
	}
	spdlog::debug("file_channel opened {} fd={}", path_, fd_);
}

file_channel::~file_channel()
{
	int ret = ::close(fd_);
	if (ret) {
		spdlog::error("close({}): {}", path_, strerror(errno));
	}
}

std::int64_t file_channel::read(char *buf, std::size_t count, boost::system::error_code &ec)
{
	ec.clear();
	if (count == 0) {
		return 0;
	}

	ssize_t ret;
	do {
		ret = ::read(fd_, buf, count);
	} while (ret < 0 && errno == EINTR);

	if (ret < 0) {
		ec.assign(errno, boost::system::system_category());
		return 0;
	}
	return ret == 0 ? -1 : ret;
}

std::int64_t file_channel::position(boost::system::error_code &ec)
{
	ec.clear();
	off_t ret = ::lseek(fd_, 0, SEEK_CUR);
	if (ret < 0) {
		// pipes and sockets cannot be positioned
		if (errno == ESPIPE) {
			ec = errors::positioning_unsupported;
		} else {
			ec.assign(errno, boost::system::system_category());
		}
		return 0;
	}
	return ret;
}

void file_channel::seek(std::int64_t pos, boost::system::error_code &ec)
{
	ec.clear();
	if (::lseek(fd_, pos, SEEK_SET) < 0) {
		if (errno == ESPIPE) {
			ec = errors::positioning_unsupported;
		} else {
			ec.assign(errno, boost::system::system_category());
		}
	}
}

gzip_channel::gzip_channel(std::string const &path) :
	path_(path)
{
	file_ = gzopen(path.c_str(), "rb");
	if (file_ == nullptr) {
		spdlog::error("failed to gzopen ({})", path);
		errors::throw_error(errors::failed_to_open, "gzopen " + path);
	}
	spdlog::debug("gzip_channel opened {}", path_);
}

gzip_channel::~gzip_channel()
{
	int zrv = gzclose(file_);
	if (zrv != Z_OK) {
		spdlog::error("gzclose({}) = {}", path_, zrv);
	}
}

std::int64_t gzip_channel::read(char *buf, std::size_t count, boost::system::error_code &ec)
{
	ec.clear();
	if (count == 0) {
		return 0;
	}

	int zrv = gzread(file_, buf, static_cast<unsigned>(count));
	if (zrv < 0) {
		int errnum = Z_OK;
		char const *msg = gzerror(file_, &errnum);
		spdlog::error("gzread({}): {} ({})", path_, msg, errnum);
		ec = boost::system::errc::make_error_code(boost::system::errc::io_error);
		return 0;
	}
	return zrv == 0 ? -1 : zrv;
}

std::int64_t gzip_channel::position(boost::system::error_code &ec)
{
	ec.clear();
	z_off_t ret = gztell(file_);
	if (ret < 0) {
		ec = errors::positioning_unsupported;
		return 0;
	}
	return ret;
}

void gzip_channel::seek(std::int64_t, boost::system::error_code &ec)
{
	ec = errors::positioning_unsupported;
}

istream_input::istream_input(std::unique_ptr<std::istream> is) :
	is_(std::move(is))
{
}

std::int64_t istream_input::read(char *buf, std::size_t count, boost::system::error_code &ec)
{
	ec.clear();
	if (count == 0) {
		return 0;
	}

	is_->read(buf, count);
	std::streamsize n = is_->gcount();
	if (is_->bad()) {
		ec = boost::system::errc::make_error_code(boost::system::errc::io_error);
		return 0;
	}
	if (n == 0 && is_->eof()) {
		return -1;
	}
	return n;
}

}  // namespace rangeio
