#pragma once

#include "converter.settings.hh"

#include <string>

namespace volzarr {
struct CommandLine
{
    ConverterSettings settings;
    bool verbose{ false };
    bool show_help{ false };
    std::string usage; /* option summary, for --help and errors */
};

/**
 * @brief Parse `volzarr-convert` arguments.
 * @details A settings file given with --config is loaded first; --raw,
 * --converted and --reconstructed override it.
 * @throw SettingsError on unknown options or missing values.
 * @throw IOError if the settings file cannot be read.
 */
CommandLine
parse_command_line(int argc, const char* const argv[]);
} // namespace volzarr
