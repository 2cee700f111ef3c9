#pragma once

#include <cstddef>
#include <fstream>
#include <span>
#include <string_view>

namespace volzarr {
/**
 * @brief A file opened for writing, truncated on construction.
 */
class FileSink
{
  public:
    /**
     * @throw IOError if the file cannot be opened.
     */
    explicit FileSink(std::string_view filename);

    /**
     * @brief Write @p data at byte @p offset of the file.
     * @return True if the write was successful, false otherwise.
     */
    [[nodiscard]] bool write(size_t offset, std::span<const std::byte> data);

    /**
     * @brief Flush and close the file. Further writes fail.
     * @return True if every byte written reached the file.
     */
    [[nodiscard]] bool close();

  private:
    std::ofstream file_;
};
} // namespace volzarr
