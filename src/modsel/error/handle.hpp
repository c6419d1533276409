#pragma once

#include <boost/leaf/handle_errors.hpp>
#include <fmt/ostream.h>

/// Allows verbose LEAF diagnostics to be written to the log
template <>
struct fmt::formatter<boost::leaf::verbose_diagnostic_info> : fmt::ostream_formatter {};
