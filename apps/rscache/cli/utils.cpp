#include "rscache/cli/utils.hpp"

#include <iterator>

#include <fmt/format.h>

namespace rscache::cli
{

auto to_hex(ro_dynblob const bytes) -> std::string
{
    fmt::memory_buffer out;
    out.reserve(bytes.size() * 2);
    for (auto const b : bytes)
    {
        fmt::format_to(std::back_inserter(out), "{:02x}",
                       std::to_integer<unsigned>(b));
    }
    return fmt::to_string(out);
}

} // namespace rscache::cli
