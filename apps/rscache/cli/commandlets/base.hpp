#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

#include <fmt/core.h>
#include <fmt/ostream.h>
#include <lyra/lyra.hpp>

#include <rscache/cache.hpp>

#include "rscache/cli/error.hpp"

// fmt 9.0.0
#if FMT_VERSION >= 9'00'00
template <>
struct fmt::formatter<lyra::parser> : fmt::ostream_formatter
{
};
template <>
struct fmt::formatter<lyra::group> : fmt::ostream_formatter
{
};
#endif

namespace rscache::cli
{

struct cache_location
{
public:
    std::string directory{};
    cache_options options{};

    template <typename Parser>
    explicit cache_location(Parser &cmd)
    {
        using namespace std::string_literals;

        auto directoryHelp
                = "The directory containing the data and index files"s;
        cmd.add_argument(lyra::opt(directory, "cache-dir")["-c"]["--cache"]
                                 .required()
                                 .help(directoryHelp));

        cmd.add_argument(
                lyra::opt(options.data_file_name, "name")["--data-file"]
                        .optional()
                        .help("The file name of the sector data file"s));
        cmd.add_argument(
                lyra::opt(options.index_file_prefix, "prefix")["--index-prefix"]
                        .optional()
                        .help("The file name of the index files without "
                              "their numeric suffix"s));
    }

    auto open() const -> result<cache>;
};

auto to_index_id(unsigned value) noexcept -> result<std::uint8_t>;

template <typename T>
struct commandlet_base
{
protected:
    lyra::command cmd;

    commandlet_base()
        : cmd(std::string(T::name),
              [self = static_cast<T *>(this)](lyra::group const &g)
              {
                  if (result<void> rx = self->exec(g); rx.has_failure())
                  {
                      if (rx.assume_error() != cli_errc::exit_error)
                      {
                          fmt::print(stderr,
                                     "Command execution failed: {}\n{}\n",
                                     rx.assume_error().message().c_str(), g);
                      }

                      cli_code{cli_errc::exit_error}.throw_exception();
                  }
              })
    {
    }
};

} // namespace rscache::cli
