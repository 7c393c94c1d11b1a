// /////////////////////////////////////////////////////////////////////////////
/// @file main.cpp
/// @brief points demo entry-point.
///
/// Builds a few points, combines them and reports the results through the
/// core::Log façade.  Run with --verbose to see every intermediate value.
// /////////////////////////////////////////////////////////////////////////////

#include "DemoConfig.hpp"

#include <pts/core/Expected.hpp>
#include <pts/core/Log.hpp>
#include <pts/core/Types.hpp>
#include <pts/geometry/Point2D.hpp>
#include <pts/geometry/Point3D.hpp>

#include <array>
#include <cstdlib>
#include <string>
#include <tuple>

using namespace pts;

namespace {

/// Renders "<point> |p|^2 = <value>", or the overflow error.
template <typename Point>
core::Expected<std::string> describe(const Point &point)
{
    const auto squared = PTS_TRY(point.hypotSq());
    return geometry::toString(point) + " |p|^2 = " + std::to_string(squared);
}

void run(const apps::DemoConfig &config)
{
    const std::string_view tag = config.tag();

    const geometry::Point2Di a{std::array{3, 4}};
    const geometry::Point2Di b{std::tuple{1, 2}};

    core::Log::debug(tag, "a = " + geometry::toString(a));
    core::Log::debug(tag, "b = " + geometry::toString(b));
    core::Log::info(tag, "a + b = " + geometry::toString(a + b));
    core::Log::info(tag, "a - b = " + geometry::toString(a - b));
    core::Log::info(tag, "-a = " + geometry::toString(-a));

    geometry::Point3Di c{a, 12};
    c.x() -= 3;
    core::Log::info(tag, "c = " + geometry::toString(c));

    for (const auto &line : {describe(a), describe(c)})
    {
        if (line)
            core::Log::info(tag, *line);
        else
            core::Log::error(tag, line.error().message());
    }

    core::Log::debug(tag, "i32 bounds: " + geometry::toString(geometry::Point2Di::minValue())
                          + " .. " + geometry::toString(geometry::Point2Di::maxValue()));

    if (config.showOverflow())
    {
        const auto overflow = describe(geometry::Point3D<core::i16>{200, 1, 1});
        if (!overflow)
            core::Log::warn(tag, std::string(core::toString(overflow.error().code())) + ": "
                                 + overflow.error().message());
    }
}

} // namespace

int main(int argc, char **argv)
{
    const char *const *first = argv + 1;
    const auto config = apps::parseArguments({first, static_cast<core::usize>(argc > 0 ? argc - 1 : 0)});
    if (!config)
    {
        core::Log::error("demo", config.error().message());
        return EXIT_FAILURE;
    }

    core::Log::setMinLevel(config->logLevel());
    run(*config);
    return EXIT_SUCCESS;
}
