#ifndef __BUFFER_RANGE_WRITER_HPP__
#define __BUFFER_RANGE_WRITER_HPP__

#include <memory>
#include <vector>

#include "range_writer.hpp"

namespace rangeio
{

// ranges of an immutable in-memory buffer; every call is independent
class buffer_range_writer final : public range_writer
{
public:
	explicit buffer_range_writer(std::shared_ptr<std::vector<char> const> buffer);

	void write_to(byte_sink &sink, std::int64_t offset, std::int64_t length) override;

	// nothing to release
	void close() override
	{
	}

private:
	std::shared_ptr<std::vector<char> const> buffer_;
};

}  // namespace rangeio

#endif
