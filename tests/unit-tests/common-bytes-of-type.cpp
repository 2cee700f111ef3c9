#include "volzarr.common.hh"
#include "unit.test.macros.hh"

int
main()
{
    int retval = 1;

    try {
        EXPECT_EQ(int, volzarr::bytes_of_type(VolzarrDataType_uint8), 1);
        EXPECT_EQ(int, volzarr::bytes_of_type(VolzarrDataType_int8), 1);
        EXPECT_EQ(int, volzarr::bytes_of_type(VolzarrDataType_uint16), 2);
        EXPECT_EQ(int, volzarr::bytes_of_type(VolzarrDataType_int16), 2);
        EXPECT_EQ(int, volzarr::bytes_of_type(VolzarrDataType_uint32), 4);
        EXPECT_EQ(int, volzarr::bytes_of_type(VolzarrDataType_int32), 4);
        EXPECT_EQ(int, volzarr::bytes_of_type(VolzarrDataType_float32), 4);
        EXPECT_EQ(int, volzarr::bytes_of_type(VolzarrDataType_uint64), 8);
        EXPECT_EQ(int, volzarr::bytes_of_type(VolzarrDataType_int64), 8);
        EXPECT_EQ(int, volzarr::bytes_of_type(VolzarrDataType_float64), 8);

        EXPECT_THROW(std::invalid_argument,
                     volzarr::bytes_of_type(VolzarrDataTypeCount));

        volzarr::Volume volume;
        volume.shape = { 3, 4, 5 };
        volume.dtype = VolzarrDataType_uint16;
        EXPECT_EQ(size_t, volume.bytes_of_plane(), 40);
        EXPECT_EQ(size_t, volume.bytes_of_volume(), 120);

        retval = 0;
    } catch (const std::exception& exc) {
        LOG_ERROR("Exception: ", exc.what());
    }

    return retval;
}
