#pragma once

#include <status-code/generic_code.hpp>

namespace rscache
{

using errc = SYSTEM_ERROR2_NAMESPACE::errc;

} // namespace rscache
