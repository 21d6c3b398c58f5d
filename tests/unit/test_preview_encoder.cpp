// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "preview_encoder.h"

#include <catch2/catch_all.hpp>

#include <cstring>

using namespace lanprint;

namespace {

PreviewImage solid_image(int w, int h, uint8_t r, uint8_t g, uint8_t b) {
    PreviewImage img;
    img.width = w;
    img.height = h;
    img.rgba.resize(static_cast<size_t>(w) * h * 4);
    for (size_t i = 0; i < img.rgba.size(); i += 4) {
        img.rgba[i] = r;
        img.rgba[i + 1] = g;
        img.rgba[i + 2] = b;
        img.rgba[i + 3] = 255;
    }
    return img;
}

const uint8_t* pixel(const PreviewImage& img, int x, int y) {
    return img.rgba.data() + (static_cast<size_t>(y) * img.width + x) * 4;
}

std::string b64(const char* text) {
    return base64_encode(reinterpret_cast<const uint8_t*>(text), std::strlen(text));
}

} // namespace

// ============================================================================
// base64
// ============================================================================

TEST_CASE("base64_encode: RFC 4648 test vectors", "[encoder][base64]") {
    REQUIRE(b64("") == "");
    REQUIRE(b64("f") == "Zg==");
    REQUIRE(b64("fo") == "Zm8=");
    REQUIRE(b64("foo") == "Zm9v");
    REQUIRE(b64("foob") == "Zm9vYg==");
    REQUIRE(b64("fooba") == "Zm9vYmE=");
    REQUIRE(b64("foobar") == "Zm9vYmFy");
}

TEST_CASE("base64_encode: high bytes use + and /", "[encoder][base64]") {
    std::vector<uint8_t> data = {0xfb, 0xff, 0xbf};
    REQUIRE(base64_encode(data) == "+/+/");
}

// ============================================================================
// PNG encode / decode
// ============================================================================

TEST_CASE("encode_png: produces a PNG that decodes to the same pixels", "[encoder][png]") {
    PreviewImage img = solid_image(4, 3, 10, 20, 30);
    img.rgba[0] = 200; // one distinct pixel

    std::vector<uint8_t> png = encode_png(img);
    REQUIRE(png.size() > 8);
    const uint8_t signature[8] = {0x89, 'P', 'N', 'G', '\r', '\n', 0x1a, '\n'};
    REQUIRE(std::memcmp(png.data(), signature, 8) == 0);

    std::string error;
    auto decoded = decode_preview(png, &error);
    REQUIRE(decoded.has_value());
    REQUIRE(decoded->width == 4);
    REQUIRE(decoded->height == 3);
    REQUIRE(decoded->rgba == img.rgba);
}

TEST_CASE("encode_png: identical pixels give identical bytes", "[encoder][png]") {
    PreviewImage img = solid_image(16, 16, 1, 2, 3);
    REQUIRE(encode_png(img) == encode_png(img));
}

TEST_CASE("encode_png: invalid image gives no bytes", "[encoder][png][edge]") {
    PreviewImage img;
    img.width = 10;
    img.height = 10;
    img.rgba.resize(7);
    REQUIRE(encode_png(img).empty());
}

TEST_CASE("decode_preview: rejects garbage", "[encoder][png][edge]") {
    std::string error;

    SECTION("empty input") {
        REQUIRE_FALSE(decode_preview({}, &error).has_value());
        REQUIRE_FALSE(error.empty());
    }

    SECTION("not an image") {
        std::vector<uint8_t> junk = {'h', 'e', 'l', 'l', 'o', 0, 1, 2, 3};
        REQUIRE_FALSE(decode_preview(junk, &error).has_value());
        REQUIRE_FALSE(error.empty());
    }
}

// ============================================================================
// fit_preview
// ============================================================================

TEST_CASE("fit_preview: covers the target and crops the centre", "[encoder][fit]") {
    SECTION("wide source keeps its middle") {
        // 480x160: left third red, middle green, right third blue
        PreviewImage src = solid_image(480, 160, 0, 255, 0);
        for (int y = 0; y < 160; ++y) {
            for (int x = 0; x < 480; ++x) {
                uint8_t* p = src.rgba.data() + (static_cast<size_t>(y) * 480 + x) * 4;
                if (x < 120) {
                    p[0] = 255;
                    p[1] = 0;
                } else if (x >= 360) {
                    p[1] = 0;
                    p[2] = 255;
                }
            }
        }

        auto fitted = fit_preview(src, 240, 160);
        REQUIRE(fitted.has_value());
        REQUIRE(fitted->width == 240);
        REQUIRE(fitted->height == 160);
        REQUIRE(fitted->is_valid());

        const uint8_t* centre = pixel(*fitted, 120, 80);
        REQUIRE(centre[0] < 10);
        REQUIRE(centre[1] > 245);
        REQUIRE(centre[2] < 10);
    }

    SECTION("tall source is scaled and cropped") {
        auto fitted = fit_preview(solid_image(100, 300, 50, 60, 70), 240, 160);
        REQUIRE(fitted.has_value());
        REQUIRE(fitted->width == 240);
        REQUIRE(fitted->height == 160);
        const uint8_t* p = pixel(*fitted, 10, 10);
        REQUIRE(p[0] == Catch::Approx(50).margin(2));
        REQUIRE(p[3] == 255);
    }

    SECTION("exact size is returned unchanged") {
        PreviewImage src = solid_image(240, 160, 9, 9, 9);
        auto fitted = fit_preview(src, 240, 160);
        REQUIRE(fitted.has_value());
        REQUIRE(fitted->rgba == src.rgba);
    }

    SECTION("invalid input") {
        REQUIRE_FALSE(fit_preview(PreviewImage{}, 240, 160).has_value());
        REQUIRE_FALSE(fit_preview(solid_image(2, 2, 0, 0, 0), 0, 160).has_value());
    }
}

TEST_CASE("encode_preview_base64: empty preview gives empty text", "[encoder]") {
    REQUIRE(encode_preview_base64(PreviewImage{}, 240, 160).empty());
}

TEST_CASE("encode_preview_base64: base64 of a 240x160 PNG", "[encoder]") {
    std::string text = encode_preview_base64(solid_image(300, 200, 1, 2, 3), 240, 160);
    REQUIRE_FALSE(text.empty());
    REQUIRE(text.size() % 4 == 0);
    // "\x89PNG" base64-encodes to "iVBORw0KGgo"
    REQUIRE(text.rfind("iVBORw0KGgo", 0) == 0);
}
