#ifndef __WRITER_HPP__
#define __WRITER_HPP__

#include <cstddef>

namespace rangeio
{
// interface that defines where range bytes go
class byte_sink
{
public:
	virtual ~byte_sink() = default;

	// writes all of buf or throws boost::system::system_error
	virtual void write(char const *buf, std::size_t count) = 0;
};

// fd is borrowed, never closed here
class fd_sink : public byte_sink
{
public:
	explicit fd_sink(int fd) :
		fd_(fd)
	{
	}

	void write(char const *buf, std::size_t count) override;

private:
	int fd_;
};

}  // namespace rangeio

#endif
