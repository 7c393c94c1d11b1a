/**
 * @file DemoConfig.hpp
 * @brief Demo configuration (Builder pattern) and command-line parsing.
 *
 * @author siiir
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#pragma once

#ifndef PTS_APPS_DEMO_CONFIG_HPP
    #define PTS_APPS_DEMO_CONFIG_HPP

#include <pts/core/Expected.hpp>
#include <pts/core/Log.hpp>

#include <span>
#include <string>

namespace pts::apps {

/** @brief Immutable demo configuration. */
class DemoConfig
{
public:
    /** @brief Fluent builder for DemoConfig. */
    class Builder
    {
    public:
        Builder& logLevel(core::LogLevel level) noexcept;
        Builder& tag(std::string name);
        Builder& showOverflow(bool enabled) noexcept;

        [[nodiscard]] DemoConfig build() const;

    private:
        core::LogLevel _logLevel{core::LogLevel::kInfo};
        std::string _tag{"demo"};
        bool _showOverflow{true};
    };

    [[nodiscard]] core::LogLevel     logLevel()     const noexcept { return _logLevel; }
    [[nodiscard]] const std::string &tag()          const noexcept { return _tag; }
    [[nodiscard]] bool               showOverflow() const noexcept { return _showOverflow; }

private:
    friend class Builder;

    core::LogLevel _logLevel{core::LogLevel::kInfo};
    std::string    _tag{"demo"};
    bool           _showOverflow{true};
};

/**
 * @brief Build a DemoConfig from command-line arguments (program name
 *        excluded).
 *
 * Recognised flags: --verbose, --quiet, --tag <name>, --no-overflow.
 * Unknown flags and a missing --tag value yield kInvalidArgument.
 */
[[nodiscard]] core::Expected<DemoConfig> parseArguments(std::span<const char *const> args);

} // namespace pts::apps

#endif // PTS_APPS_DEMO_CONFIG_HPP
