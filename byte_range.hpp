#ifndef __BYTE_RANGE_HPP__
#define __BYTE_RANGE_HPP__

#include <cstdint>
#include <string>
#include <vector>

namespace rangeio
{

// [first, last], both inclusive
class inclusive_byte_range
{
public:
	inclusive_byte_range(std::int64_t first, std::int64_t last) :
		first_(first), last_(last)
	{
	}

	std::int64_t first() const
	{
		return first_;
	}

	std::int64_t last() const
	{
		return last_;
	}

	std::int64_t size() const
	{
		return last_ - first_ + 1;
	}

	bool overlaps(inclusive_byte_range const &range) const;
	void coalesce(inclusive_byte_range const &range);

	// "bytes first-last/size"
	std::string to_header_range_string(std::int64_t size) const;

	// "bytes */size", the Content-Range of a 416 response
	static std::string to_416_header_range_string(std::int64_t size);

	// Parses the values of all Range headers of a request ("bytes=0-9,20-")
	// against a resource of size bytes. Unsatisfiable ranges are dropped and
	// overlapping ranges are merged. A malformed range discards everything
	// collected so far. An empty result means nothing is satisfiable.
	static std::vector<inclusive_byte_range> satisfiable_ranges(
		std::vector<std::string> const &headers, std::int64_t size);

	bool operator==(inclusive_byte_range const &rhs) const
	{
		return first_ == rhs.first_ && last_ == rhs.last_;
	}

private:
	std::int64_t first_;
	std::int64_t last_;
};

}  // namespace rangeio

#endif
