#pragma once

#include <string>

#include <rscache/span.hpp>

namespace rscache::cli
{

// lower case hex digits without separators
auto to_hex(ro_dynblob bytes) -> std::string;

} // namespace rscache::cli
