#include "file.sink.hh"
#include "macros.hh"

#include <string>

volzarr::FileSink::FileSink(std::string_view filename)
  : file_(std::string(filename), std::ios::binary | std::ios::trunc)
{
    EXPECT_OR_THROW(
      IOError, file_.is_open(), "Failed to open file '", filename, "'");
}

bool
volzarr::FileSink::write(size_t offset, std::span<const std::byte> data)
{
    const auto bytes_of_buf = data.size();
    if (data.data() == nullptr || bytes_of_buf == 0) {
        return file_.is_open();
    }

    file_.seekp(static_cast<std::streamoff>(offset));
    file_.write(reinterpret_cast<const char*>(data.data()),
                static_cast<std::streamsize>(bytes_of_buf));
    return file_.good();
}

bool
volzarr::FileSink::close()
{
    if (!file_.is_open()) {
        return false;
    }

    file_.flush();
    if (!file_.good()) {
        return false;
    }

    file_.close();
    return !file_.fail();
}
