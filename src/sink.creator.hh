#pragma once

#include "file.sink.hh"

#include <memory>
#include <string>
#include <string_view>

namespace volzarr {
class SinkCreator
{
  public:
    /**
     * @brief Create a sink from a file path, creating any missing parent
     * directories.
     * @param file_path The path to the file.
     * @return Pointer to the sink created, or nullptr if the parent directory
     * could not be created or the file could not be opened.
     * @throw std::runtime_error if the file path is empty.
     */
    static std::unique_ptr<FileSink> make_sink(std::string_view file_path);

    /**
     * @brief Path of the chunk at slice index @p chunk_index relative to
     * @p base_path.
     * @details Chunk @c i of a (depth, 1, 1) chunk grid is written to
     * <tt>base_path/c/i/0/0</tt>.
     */
    static std::string chunk_path(std::string_view base_path,
                                  size_t chunk_index);
};
} // namespace volzarr
