#include <cerrno>
#include <unistd.h>

#include <boost/system/system_error.hpp>

#include "writer.hpp"

namespace rangeio
{

void fd_sink::write(char const *buf, std::size_t count)
{
	while (count > 0) {
		ssize_t ret = ::write(fd_, buf, count);
		if (ret < 0) {
			if (errno == EINTR) {
				continue;
			}
			throw boost::system::system_error(errno, boost::system::system_category(), "write");
		}
		buf += ret;
		count -= ret;
	}
}

}  // namespace rangeio
