#include "geo_overlay/core/errors.hpp"
#include "geo_overlay/core/utils.hpp"

#include <filesystem>
#include <string>
#include <vector>

#include <catch2/catch_test_macros.hpp>

using namespace geo_overlay;

namespace {

std::vector<uint8_t> bytes_of(const std::string& s) {
    return std::vector<uint8_t>(s.begin(), s.end());
}

} // namespace

TEST_CASE("sha256_matches_known_digest") {
    REQUIRE(core::sha256_bytes(bytes_of("abc")) ==
            "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST_CASE("base64_encodes_and_decodes_padding") {
    REQUIRE(core::base64_encode(bytes_of("hello")) == "aGVsbG8=");
    REQUIRE(core::base64_decode("aGVsbG8=") == bytes_of("hello"));
    REQUIRE(core::base64_decode("aGVs\nbG8=") == bytes_of("hello"));
    REQUIRE(core::base64_decode("YQ==") == bytes_of("a"));
    REQUIRE(core::base64_decode("").empty());
}

TEST_CASE("base64_decode_rejects_bad_length") {
    REQUIRE_THROWS_AS(core::base64_decode("abc"), ValidationError);
}

TEST_CASE("data_uri_has_png_prefix") {
    std::string uri = core::to_data_uri(bytes_of("hello"));
    REQUIRE(uri == "data:image/png;base64,aGVsbG8=");
}

TEST_CASE("parse_hex_color_accepts_short_long_and_alpha_forms") {
    Rgba green = core::parse_hex_color("#5db815");
    REQUIRE(green.r == 0x5d);
    REQUIRE(green.g == 0xb8);
    REQUIRE(green.b == 0x15);
    REQUIRE(green.a == 255);

    Rgba white = core::parse_hex_color("fff");
    REQUIRE(white.r == 255);
    REQUIRE(white.g == 255);
    REQUIRE(white.b == 255);

    Rgba translucent = core::parse_hex_color("#00000080");
    REQUIRE(translucent.a == 0x80);

    REQUIRE_THROWS_AS(core::parse_hex_color("green"), ValidationError);
    REQUIRE_THROWS_AS(core::parse_hex_color("#12345"), ValidationError);
    REQUIRE_THROWS_AS(core::parse_hex_color("#gg0000"), ValidationError);
}

TEST_CASE("string_helpers") {
    REQUIRE(core::trim("  key \n") == "key");
    REQUIRE(core::trim("   ").empty());
    REQUIRE(core::to_lower("PNG") == "png");
    REQUIRE(core::starts_with("https://a", "https://"));
    REQUIRE(core::ends_with("tile.png", ".png"));
    REQUIRE_FALSE(core::ends_with("png", "tile.png"));
    REQUIRE(core::replace_all("{x}/{x}", "{x}", "7") == "7/7");
}

TEST_CASE("write_and_read_bytes_round_trip_through_nested_dir") {
    auto dir = std::filesystem::temp_directory_path() / ("geo_overlay_utils_" + core::get_run_id());
    auto file = dir / "nested" / "blob.bin";

    std::vector<uint8_t> data = {0, 1, 2, 255};
    core::write_bytes(file, data);
    REQUIRE(core::read_bytes(file) == data);

    std::filesystem::remove_all(dir);
    REQUIRE_THROWS_AS(core::read_bytes(file), IOError);
}

TEST_CASE("iso_timestamp_is_utc_with_millis") {
    std::string ts = core::get_iso_timestamp();
    REQUIRE(ts.size() == 24);
    REQUIRE(ts[10] == 'T');
    REQUIRE(ts.back() == 'Z');
}
