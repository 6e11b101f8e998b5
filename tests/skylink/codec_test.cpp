#include "skyup/skylink/codec.hpp"

#include <gtest/gtest.h>

namespace skylink = skyup::skylink;
using skyup::ErrorCode;

namespace {

skylink::RawSkylink sample_raw() {
    skylink::RawSkylink raw{};
    for (std::size_t i = 0; i < raw.size(); ++i) {
        raw[i] = static_cast<std::uint8_t>(i * 7 + 250);  // wraps, exercises '+' and '/'
    }
    return raw;
}

} // namespace

TEST(SkylinkCodecTest, EncodeProducesUrlSafeUnpaddedText) {
    const std::string encoded = skylink::encode(sample_raw());

    EXPECT_EQ(encoded.size(), skylink::kEncodedSize);
    EXPECT_EQ(encoded.find('='), std::string::npos);
    EXPECT_EQ(encoded.find('+'), std::string::npos);
    EXPECT_EQ(encoded.find('/'), std::string::npos);
}

TEST(SkylinkCodecTest, DecodeReversesEncode) {
    const auto raw = sample_raw();
    auto decoded = skylink::decode(skylink::encode(raw));
    ASSERT_TRUE(decoded.is_ok());
    EXPECT_EQ(decoded.value(), raw);
}

TEST(SkylinkCodecTest, DecodeRejectsWrongLength) {
    const std::string encoded = skylink::encode(sample_raw());

    for (const std::string& input : {std::string(), encoded.substr(1), encoded + "A", encoded + "=="}) {
        auto decoded = skylink::decode(input);
        ASSERT_TRUE(decoded.is_error()) << input;
        EXPECT_EQ(decoded.error().code, ErrorCode::MalformedSkylink);
    }
}

TEST(SkylinkCodecTest, DecodeRejectsCharactersOutsideAlphabet) {
    std::string encoded = skylink::encode(sample_raw());
    encoded[10] = '*';

    auto decoded = skylink::decode(encoded);
    ASSERT_TRUE(decoded.is_error());
    EXPECT_EQ(decoded.error().code, ErrorCode::MalformedSkylink);
}

TEST(SkylinkCodecTest, FormatStripsKnownPrefixes) {
    const std::string bare = skylink::encode(sample_raw());

    EXPECT_EQ(skylink::format("sia://" + bare), bare);
    EXPECT_EQ(skylink::format("sia:" + bare), bare);
    EXPECT_EQ(skylink::format(bare), bare);
    EXPECT_EQ(skylink::format(skylink::format("sia://" + bare)), bare);
}

TEST(SkylinkCodecTest, UriRoundTrip) {
    const std::string bare = skylink::encode(sample_raw());
    const std::string uri = skylink::to_uri(bare);

    EXPECT_EQ(uri, "sia://" + bare);
    auto via_uri = skylink::decode(skylink::format(uri));
    auto direct = skylink::decode(bare);
    ASSERT_TRUE(via_uri.is_ok());
    ASSERT_TRUE(direct.is_ok());
    EXPECT_EQ(via_uri.value(), direct.value());

    // Prefixing an already-prefixed link stacks prefixes; format() strips them all.
    for (const std::string& prefixed : {"sia://" + bare, "sia:" + bare, "sia://sia:" + bare}) {
        const std::string stacked = skylink::to_uri(prefixed);
        EXPECT_EQ(skylink::format(stacked), bare) << stacked;
        auto decoded = skylink::decode(skylink::format(stacked));
        ASSERT_TRUE(decoded.is_ok()) << stacked;
        EXPECT_EQ(decoded.value(), direct.value());
    }
}

TEST(SkylinkCodecTest, NormalizeValidatesAfterFormatting) {
    const std::string bare = skylink::encode(sample_raw());

    auto normalized = skylink::normalize("sia://" + bare);
    ASSERT_TRUE(normalized.is_ok());
    EXPECT_EQ(normalized.value(), bare);

    auto bad = skylink::normalize("sia://not-a-skylink");
    ASSERT_TRUE(bad.is_error());
    EXPECT_EQ(bad.error().code, ErrorCode::MalformedSkylink);
}
