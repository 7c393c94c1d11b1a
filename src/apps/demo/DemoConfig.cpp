/**
 * @file DemoConfig.cpp
 * @brief DemoConfig builder and argument parsing.
 *
 * @author siiir
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#include "DemoConfig.hpp"

#include <string_view>
#include <utility>

namespace pts::apps {

DemoConfig::Builder& DemoConfig::Builder::logLevel(core::LogLevel level) noexcept
{
    _logLevel = level;
    return *this;
}

DemoConfig::Builder& DemoConfig::Builder::tag(std::string name)
{
    _tag = std::move(name);
    return *this;
}

DemoConfig::Builder& DemoConfig::Builder::showOverflow(bool enabled) noexcept
{
    _showOverflow = enabled;
    return *this;
}

DemoConfig DemoConfig::Builder::build() const
{
    DemoConfig config;
    config._logLevel = _logLevel;
    config._tag = _tag;
    config._showOverflow = _showOverflow;
    return config;
}

namespace {

/// Applies args[i] to @p builder, advancing @p i past a consumed value.
core::ExpectedVoid applyArgument(DemoConfig::Builder &builder, std::span<const char *const> args, std::size_t &i)
{
    const std::string_view arg{args[i]};

    if (arg == "--verbose")
        builder.logLevel(core::LogLevel::kDebug);
    else if (arg == "--quiet")
        builder.logLevel(core::LogLevel::kWarn);
    else if (arg == "--no-overflow")
        builder.showOverflow(false);
    else if (arg == "--tag")
    {
        if (i + 1 >= args.size())
            return core::makeError(core::ErrorCode::kInvalidArgument, "--tag expects a value");
        builder.tag(args[++i]);
    }
    else
        return core::makeError(core::ErrorCode::kInvalidArgument, "unknown argument: " + std::string(arg));

    return {};
}

} // namespace

core::Expected<DemoConfig> parseArguments(std::span<const char *const> args)
{
    DemoConfig::Builder builder;

    for (std::size_t i = 0; i < args.size(); ++i)
        PTS_TRY_VOID(applyArgument(builder, args, i));

    return builder.build();
}

} // namespace pts::apps
