#include "macros.hh"
#include "sink.creator.hh"

#include <filesystem>

namespace fs = std::filesystem;

std::unique_ptr<volzarr::FileSink>
volzarr::SinkCreator::make_sink(std::string_view file_path)
{
    EXPECT(!file_path.empty(), "File path must not be empty.");

    fs::path path(file_path);
    EXPECT(!path.empty(), "Invalid file path: ", file_path);

    fs::path parent_path = path.parent_path();

    if (!parent_path.empty() && !fs::is_directory(parent_path)) {
        std::error_code ec;
        // another writer may have created it in the meantime
        if (!fs::create_directories(parent_path, ec) &&
            !fs::is_directory(parent_path)) {
            LOG_ERROR("Failed to create directory '",
                      parent_path,
                      "': ",
                      ec.message());
            return nullptr;
        }
    }

    try {
        return std::make_unique<FileSink>(file_path);
    } catch (const IOError& exc) {
        LOG_ERROR("Failed to create sink: ", exc.what());
    }

    return nullptr;
}

std::string
volzarr::SinkCreator::chunk_path(std::string_view base_path,
                                 size_t chunk_index)
{
    return (fs::path(base_path) / "c" / std::to_string(chunk_index) / "0" /
            "0")
      .string();
}
