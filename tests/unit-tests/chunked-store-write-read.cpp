#include "blosc.compressor.hh"
#include "chunked.store.reader.hh"
#include "chunked.store.writer.hh"
#include "test.fakes.hh"
#include "unit.test.macros.hh"

#include <nlohmann/json.hpp>

#include <filesystem>
#include <fstream>
#include <iterator>

namespace fs = std::filesystem;

namespace {
const VolzarrByteOrder foreign_byte_order =
  volzarr::native_byte_order() == VolzarrByteOrder_Little
    ? VolzarrByteOrder_Big
    : VolzarrByteOrder_Little;

std::vector<std::byte>
read_bytes(const fs::path& path)
{
    std::ifstream file(path, std::ios::binary);
    CHECK(file.is_open());
    std::vector<char> chars((std::istreambuf_iterator<char>(file)),
                            std::istreambuf_iterator<char>());
    std::vector<std::byte> bytes(chars.size());
    std::memcpy(bytes.data(), chars.data(), chars.size());
    return bytes;
}

void
check_round_trip(const volzarr::Volume& volume,
                 VolzarrByteOrder endian,
                 const fs::path& store_path,
                 std::shared_ptr<volzarr::ThreadPool> thread_pool)
{
    volzarr::ChunkedStoreConfig config;
    config.endian = endian;

    volzarr::Geometry geometry;
    geometry.origin = { 1.0, -2.0, 3.5 };

    volzarr::ChunkedStoreWriter writer(config, thread_pool);
    const auto written = writer.write(volume, geometry, store_path);
    EXPECT_EQ(int, written.endian, endian);

    CHECK(fs::is_regular_file(store_path / "zarr.json"));
    for (auto i = 0; i < volume.depth(); ++i) {
        CHECK(fs::is_regular_file(store_path / "c" / std::to_string(i) /
                                  "0" / "0"));
    }

    volzarr::ChunkedStoreReader reader(store_path);
    EXPECT_EQ(int, reader.metadata().dtype, volume.dtype);
    EXPECT_EQ(int, reader.metadata().endian, endian);
    EXPECT_EQ(double,
              reader.metadata().attributes["origin"][2].get<double>(),
              3.5);

    const auto decoded = reader.read();
    CHECK(decoded.shape == volume.shape);
    EXPECT_EQ(int, decoded.dtype, volume.dtype);
    EXPECT_EQ(int, decoded.byte_order, volzarr::native_byte_order());
    CHECK(decoded.data == volume.data);
}
} // namespace

int
main()
{
    int retval = 0;
    const fs::path base_dir = fs::temp_directory_path() / TEST;

    try {
        auto thread_pool = std::make_shared<volzarr::ThreadPool>(4);

        const auto u8 = volzarr::test::make_volume<uint8_t>(
          3, 16, 9, VolzarrDataType_uint8);
        const auto i16 = volzarr::test::make_volume<int16_t>(
          7, 32, 24, VolzarrDataType_int16);
        const auto f32 = volzarr::test::make_volume<float>(
          2, 5, 11, VolzarrDataType_float32);
        const auto u64 = volzarr::test::make_volume<uint64_t>(
          4, 3, 3, VolzarrDataType_uint64);

        for (auto endian : { volzarr::native_byte_order(), foreign_byte_order }) {
            const auto dir =
              base_dir / volzarr::byte_order_to_string(endian);
            check_round_trip(u8, endian, dir / "u8.zarr", thread_pool);
            check_round_trip(i16, endian, dir / "i16.zarr", thread_pool);
            check_round_trip(f32, endian, dir / "f32.zarr", thread_pool);
            check_round_trip(u64, endian, dir / "u64.zarr", thread_pool);
        }

        // chunks of a foreign-order store hold byte-swapped samples
        {
            const auto chunk =
              read_bytes(base_dir / volzarr::byte_order_to_string(
                                      foreign_byte_order) /
                         "i16.zarr" / "c" / "1" / "0" / "0");
            const auto plane = i16.plane(1);
            std::vector<std::byte> decoded(plane.size());
            volzarr::blosc_decompress(chunk, decoded);

            std::vector<std::byte> expected(plane.begin(), plane.end());
            volzarr::swap_byte_order(expected, sizeof(int16_t));
            CHECK(decoded == expected);
        }

        // a volume held in foreign order is stored in the configured order
        {
            auto swapped = i16;
            volzarr::swap_byte_order(swapped.data, sizeof(int16_t));
            swapped.byte_order = foreign_byte_order;

            volzarr::ChunkedStoreConfig config;
            volzarr::ChunkedStoreWriter writer(config, thread_pool);
            const auto path = base_dir / "from-foreign.zarr";
            writer.write(swapped, volzarr::Geometry{}, path);

            const auto decoded = volzarr::ChunkedStoreReader(path).read();
            CHECK(decoded.data == i16.data);
        }

        // missing chunks decode to the fill value
        {
            const auto path = base_dir / "sparse.zarr";
            volzarr::ChunkedStoreWriter writer(volzarr::ChunkedStoreConfig{},
                                               thread_pool);
            writer.write(u8, volzarr::Geometry{}, path);
            fs::remove(path / "c" / "2" / "0" / "0");

            const auto decoded = volzarr::ChunkedStoreReader(path).read();
            const auto plane_size = u8.bytes_of_plane();
            CHECK(std::equal(decoded.data.begin(),
                             decoded.data.begin() + 2 * plane_size,
                             u8.data.begin()));
            CHECK(std::all_of(decoded.data.begin() + 2 * plane_size,
                              decoded.data.end(),
                              [](std::byte b) { return b == std::byte{ 0 }; }));
        }

        thread_pool->await_stop();
    } catch (const std::exception& e) {
        LOG_ERROR("Caught exception: ", e.what());
        retval = 1;
    }

    std::error_code ec;
    fs::remove_all(base_dir, ec);

    return retval;
}
