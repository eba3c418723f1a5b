#include <gtest/gtest.h>
#include <idpick/colour_codec.hpp>

using namespace idpick;

TEST(ColourCodec, RoundTripsEveryIdentifier) {
    for (object_id id = 0; id <= max_object_id; id++) {
        if (decode_colour(encode_colour(id)) != id) {
            FAIL() << "id " << id << " did not survive encoding";
        }
    }
}

TEST(ColourCodec, PacksIdentifierAsRgb) {
    EXPECT_EQ(encode_colour(0x123456), (glm::u8vec3{0x12, 0x34, 0x56}));
    EXPECT_EQ(encode_colour(0), (glm::u8vec3{0, 0, 0}));
    EXPECT_EQ(encode_colour(max_object_id), (glm::u8vec3{255, 255, 255}));
    EXPECT_EQ(decode_colour(glm::u8vec3{0, 1, 0}), 256u);
}

TEST(ColourCodec, DumpModeEncodesEverythingRed) {
    const colour_codec dumping {true};
    EXPECT_EQ(dumping.encode(1), dump_colour);
    EXPECT_EQ(dumping.encode(0xABCDEF), dump_colour);
    // Decoding is unaffected
    EXPECT_EQ(dumping.decode(glm::u8vec3{0, 0, 7}), 7u);
}

TEST(ColourCodec, NormalModeMatchesFreeFunctions) {
    const colour_codec codec {};
    EXPECT_EQ(codec.encode(0x00FF10), encode_colour(0x00FF10));
    EXPECT_EQ(codec.decode(codec.encode(4242)), 4242u);
}

TEST(ColourCodec, NormalizedColourScalesChannels) {
    const glm::vec3 colour = normalized_colour(glm::u8vec3{255, 0, 51});
    EXPECT_FLOAT_EQ(colour.r, 1.0f);
    EXPECT_FLOAT_EQ(colour.g, 0.0f);
    EXPECT_FLOAT_EQ(colour.b, 0.2f);
}
