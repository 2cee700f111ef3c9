#include "volzarr.common.hh"
#include "unit.test.macros.hh"

#include <cstring>
#include <vector>

int
main()
{
    int retval = 1;

    try {
        std::vector<uint16_t> values{ 0x0102, 0xA0B0, 0x00FF };
        std::vector<std::byte> buf(values.size() * sizeof(uint16_t));
        std::memcpy(buf.data(), values.data(), buf.size());

        volzarr::swap_byte_order(buf, sizeof(uint16_t));

        std::vector<uint16_t> swapped(values.size());
        std::memcpy(swapped.data(), buf.data(), buf.size());
        EXPECT_EQ(int, swapped[0], 0x0201);
        EXPECT_EQ(int, swapped[1], 0xB0A0);
        EXPECT_EQ(int, swapped[2], 0xFF00);

        // swapping twice restores the original
        volzarr::swap_byte_order(buf, sizeof(uint16_t));
        std::memcpy(swapped.data(), buf.data(), buf.size());
        CHECK(swapped == values);

        // single-byte elements are left alone
        std::vector<std::byte> bytes{ std::byte{ 1 }, std::byte{ 2 } };
        volzarr::swap_byte_order(bytes, 1);
        CHECK(bytes[0] == std::byte{ 1 });

        std::vector<std::byte> ragged(5);
        EXPECT_THROW(std::invalid_argument,
                     volzarr::swap_byte_order(ragged, 4));

        retval = 0;
    } catch (const std::exception& exc) {
        LOG_ERROR("Exception: ", exc.what());
    }

    return retval;
}
