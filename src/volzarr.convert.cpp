#include "command.line.hh"
#include "itk/itk.series.source.hh"
#include "itk/itk.slice.writer.hh"
#include "macros.hh"
#include "series.converter.hh"

#include <iostream>

namespace {
const char*
status_to_string(VolzarrSeriesStatus status)
{
    switch (status) {
        case VolzarrSeriesStatus_Ok:
            return "ok";
        case VolzarrSeriesStatus_Skipped:
            return "skipped";
        default:
            return "failed";
    }
}
} // namespace

int
main(int argc, char* argv[])
{
    using namespace volzarr;

    CommandLine command_line;
    try {
        command_line = parse_command_line(argc, argv);
    } catch (const Error& exc) {
        std::cerr << exc.what() << std::endl;
        return 2;
    }

    if (command_line.show_help) {
        std::cout << command_line.usage << std::endl;
        return 0;
    }

    const auto& settings = command_line.settings;
    Logger::set_log_level(command_line.verbose ? VolzarrLogLevel_Debug
                                               : settings.log_level);

    std::vector<SeriesResult> results;
    try {
        SeriesConverter converter(settings,
                                  std::make_shared<ItkSeriesSource>(),
                                  std::make_shared<ItkSliceWriter>());
        results = converter.run();
    } catch (const SettingsError& exc) {
        LOG_ERROR("Invalid settings: ", exc.what());
        return 2;
    } catch (const std::exception& exc) {
        LOG_ERROR("Conversion aborted: ", exc.what());
        return 1;
    }

    int retval = 0;
    for (const auto& result : results) {
        LOG_INFO(result.series_id,
                 ": ",
                 status_to_string(result.status),
                 result.reason.empty() ? "" : " (" + result.reason + ")");
        if (result.status == VolzarrSeriesStatus_Failed ||
            result.reconstruction.slices_failed() > 0) {
            retval = 1;
        }
    }

    return retval;
}
