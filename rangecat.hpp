#ifndef __RANGECAT_HPP__
#define __RANGECAT_HPP__

#include <ostream>

#include "config.hpp"
#include "writer.hpp"

namespace rangeio
{

// Answers the range request described by cfg, writing the body to body and,
// with cfg.print_headers, the status line and headers to header_out.
// Returns the process exit code: 0 served, 1 unsatisfiable or failed.
int serve_file(config const &cfg, byte_sink &body, std::ostream &header_out);

}  // namespace rangeio

#endif
