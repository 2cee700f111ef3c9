#include "command.line.hh"
#include "macros.hh"

#include <boost/program_options.hpp>

#include <sstream>

namespace po = boost::program_options;

volzarr::CommandLine
volzarr::parse_command_line(int argc, const char* const argv[])
{
    po::options_description desc("Allowed options");
    desc.add_options()
      ("help,h", "produce help message")
      ("config,c", po::value<std::string>(), "JSON settings file")
      ("raw", po::value<std::string>(), "directory holding one folder per series")
      ("converted", po::value<std::string>(), "directory for stores and sidecars")
      ("reconstructed", po::value<std::string>(), "directory for rebuilt series")
      ("verbose,v", po::bool_switch(), "log at debug level");

    CommandLine command_line;

    std::ostringstream usage;
    usage << "usage: " << (argc > 0 ? argv[0] : "volzarr-convert")
          << " [options]\n"
          << desc;
    command_line.usage = usage.str();

    po::variables_map vm;
    try {
        po::store(po::parse_command_line(argc, argv, desc), vm);
        po::notify(vm);
    } catch (const po::error& e) {
        const std::string err = LOG_ERROR("Invalid arguments: ", e.what());
        throw SettingsError(err);
    }

    if (vm.count("help")) {
        command_line.show_help = true;
        return command_line;
    }

    auto& settings = command_line.settings;
    if (vm.count("config")) {
        settings =
          ConverterSettings::from_json_file(vm["config"].as<std::string>());
    }
    if (vm.count("raw")) {
        settings.raw_dir = vm["raw"].as<std::string>();
    }
    if (vm.count("converted")) {
        settings.converted_dir = vm["converted"].as<std::string>();
    }
    if (vm.count("reconstructed")) {
        settings.reconstructed_dir = vm["reconstructed"].as<std::string>();
    }
    command_line.verbose = vm["verbose"].as<bool>();

    return command_line;
}
