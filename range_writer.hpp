#ifndef __RANGE_WRITER_HPP__
#define __RANGE_WRITER_HPP__

#include <cstdint>
#include <vector>

#include <boost/core/noncopyable.hpp>

#include "core_ext.hpp"
#include "writer.hpp"

namespace rangeio
{

// scratch buffer used for skipping and copying
constexpr std::size_t default_buffer_size = 64_KiB;

// consecutive zero-byte reads tolerated while skipping forward
constexpr int no_progress_limit = 3;

// Writes byte ranges of one underlying resource to a sink.
//
// A writer is not thread safe; all calls on one instance must be serialized.
// Ranges may be requested in any order and may overlap. close() releases the
// underlying handle; the writer cannot be used afterwards.
class range_writer : boost::noncopyable
{
public:
	virtual ~range_writer() = default;

	// Writes exactly length bytes starting at offset, or throws
	// boost::system::system_error.
	virtual void write_to(byte_sink &sink, std::int64_t offset, std::int64_t length) = 0;

	virtual void close() = 0;
};

class input_stream;

namespace detail
{
// throws errors::invalid_range for negative offset or length
void check_range(std::int64_t offset, std::int64_t length);

// reads and discards bytes until pos reaches target
void skip_forward(input_stream &in, std::vector<char> &scratch,
	std::int64_t &pos, std::int64_t target);

// copies length bytes from in to sink, advancing pos
void copy_range(input_stream &in, std::vector<char> &scratch,
	std::int64_t &pos, byte_sink &sink, std::int64_t length);
}  // namespace detail

}  // namespace rangeio

#endif
