// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

// Define STB implementations in this compilation unit only
#define STB_IMAGE_IMPLEMENTATION
#define STB_IMAGE_RESIZE_IMPLEMENTATION

#include "preview_encoder.h"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>
#include <cstring>

#include <png.h>

// stb headers - single-file libraries for image processing
#include "stb_image.h"
#include "stb_image_resize.h"

namespace lanprint {

namespace {

// Reject absurd inputs before allocating for them
constexpr size_t MAX_ENCODED_INPUT_SIZE = 16 * 1024 * 1024;
constexpr int MAX_SOURCE_DIMENSION = 8192;

void png_write_to_vector(png_structp png_ptr, png_bytep data, png_size_t length) {
    auto* out = static_cast<std::vector<uint8_t>*>(png_get_io_ptr(png_ptr));
    out->insert(out->end(), data, data + length);
}

void png_flush_noop(png_structp) {}

const char BASE64_ALPHABET[] = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

} // namespace

std::optional<PreviewImage> decode_preview(const std::vector<uint8_t>& encoded,
                                           std::string* error) {
    auto fail = [error](const std::string& reason) -> std::optional<PreviewImage> {
        if (error) {
            *error = reason;
        }
        spdlog::debug("[PreviewEncoder] {}", reason);
        return std::nullopt;
    };

    if (encoded.empty()) {
        return fail("Empty preview image");
    }
    if (encoded.size() > MAX_ENCODED_INPUT_SIZE) {
        return fail("Preview image too large (" + std::to_string(encoded.size() / 1024 / 1024) +
                    " MB)");
    }

    int width = 0, height = 0, channels = 0;
    // Request RGBA output regardless of source format
    unsigned char* pixels = stbi_load_from_memory(encoded.data(), static_cast<int>(encoded.size()),
                                                  &width, &height, &channels, 4);
    if (!pixels) {
        return fail(std::string("Failed to decode preview: ") + stbi_failure_reason());
    }

    if (width > MAX_SOURCE_DIMENSION || height > MAX_SOURCE_DIMENSION) {
        stbi_image_free(pixels);
        return fail("Preview too large (" + std::to_string(width) + "x" + std::to_string(height) +
                    ")");
    }

    PreviewImage image;
    image.width = width;
    image.height = height;
    image.rgba.assign(pixels, pixels + static_cast<size_t>(width) * height * 4);
    stbi_image_free(pixels);

    spdlog::trace("[PreviewEncoder] Decoded {}x{} ({} channels)", width, height, channels);
    return image;
}

std::optional<PreviewImage> fit_preview(const PreviewImage& source, int width, int height) {
    if (!source.is_valid() || width <= 0 || height <= 0) {
        return std::nullopt;
    }

    if (source.width == width && source.height == height) {
        return source;
    }

    // Cover: the larger scale factor makes both dimensions at least the target
    double scale = std::max(static_cast<double>(width) / source.width,
                            static_cast<double>(height) / source.height);
    int scaled_w = std::max(width, static_cast<int>(std::ceil(source.width * scale)));
    int scaled_h = std::max(height, static_cast<int>(std::ceil(source.height * scale)));

    spdlog::trace("[PreviewEncoder] Scaling {}x{} -> {}x{} then cropping to {}x{}", source.width,
                  source.height, scaled_w, scaled_h, width, height);

    std::vector<uint8_t> scaled(static_cast<size_t>(scaled_w) * scaled_h * 4);
    int ok = stbir_resize_uint8(source.rgba.data(), source.width, source.height, 0, // input
                                scaled.data(), scaled_w, scaled_h, 0,               // output
                                4                                                   // RGBA
    );
    if (!ok) {
        spdlog::warn("[PreviewEncoder] Failed to resize preview");
        return std::nullopt;
    }

    int off_x = (scaled_w - width) / 2;
    int off_y = (scaled_h - height) / 2;

    PreviewImage result;
    result.width = width;
    result.height = height;
    result.rgba.resize(static_cast<size_t>(width) * height * 4);
    for (int y = 0; y < height; ++y) {
        const uint8_t* src_row =
            scaled.data() + (static_cast<size_t>(y + off_y) * scaled_w + off_x) * 4;
        std::memcpy(result.rgba.data() + static_cast<size_t>(y) * width * 4, src_row,
                    static_cast<size_t>(width) * 4);
    }
    return result;
}

std::vector<uint8_t> encode_png(const PreviewImage& image) {
    std::vector<uint8_t> out;
    if (!image.is_valid()) {
        return out;
    }

    // Everything the error path touches is created before setjmp
    std::vector<png_bytep> rows(static_cast<size_t>(image.height));
    for (int y = 0; y < image.height; ++y) {
        rows[y] = const_cast<png_bytep>(image.rgba.data() + static_cast<size_t>(y) * image.width * 4);
    }

    png_structp png_ptr = png_create_write_struct(PNG_LIBPNG_VER_STRING, nullptr, nullptr, nullptr);
    if (!png_ptr) {
        spdlog::error("[PreviewEncoder] png_create_write_struct() failed");
        return out;
    }

    png_infop info_ptr = png_create_info_struct(png_ptr);
    if (!info_ptr) {
        spdlog::error("[PreviewEncoder] png_create_info_struct() failed");
        png_destroy_write_struct(&png_ptr, nullptr);
        return out;
    }

    if (setjmp(png_jmpbuf(png_ptr))) {
        spdlog::error("[PreviewEncoder] libpng error while encoding preview");
        png_destroy_write_struct(&png_ptr, &info_ptr);
        out.clear();
        return out;
    }

    png_set_write_fn(png_ptr, &out, png_write_to_vector, png_flush_noop);
    png_set_IHDR(png_ptr, info_ptr, static_cast<png_uint_32>(image.width),
                 static_cast<png_uint_32>(image.height),
                 8, // depth
                 PNG_COLOR_TYPE_RGB_ALPHA, PNG_INTERLACE_NONE, PNG_COMPRESSION_TYPE_DEFAULT,
                 PNG_FILTER_TYPE_DEFAULT);
    png_set_rows(png_ptr, info_ptr, rows.data());
    png_write_png(png_ptr, info_ptr, PNG_TRANSFORM_IDENTITY, nullptr);

    png_destroy_write_struct(&png_ptr, &info_ptr);
    return out;
}

std::string base64_encode(const uint8_t* data, size_t size) {
    std::string result;
    result.reserve(((size + 2) / 3) * 4);

    size_t i = 0;
    for (; i + 2 < size; i += 3) {
        uint32_t n = (uint32_t(data[i]) << 16) | (uint32_t(data[i + 1]) << 8) | data[i + 2];
        result.push_back(BASE64_ALPHABET[(n >> 18) & 0x3F]);
        result.push_back(BASE64_ALPHABET[(n >> 12) & 0x3F]);
        result.push_back(BASE64_ALPHABET[(n >> 6) & 0x3F]);
        result.push_back(BASE64_ALPHABET[n & 0x3F]);
    }

    size_t rest = size - i;
    if (rest == 1) {
        uint32_t n = uint32_t(data[i]) << 16;
        result.push_back(BASE64_ALPHABET[(n >> 18) & 0x3F]);
        result.push_back(BASE64_ALPHABET[(n >> 12) & 0x3F]);
        result.append("==");
    } else if (rest == 2) {
        uint32_t n = (uint32_t(data[i]) << 16) | (uint32_t(data[i + 1]) << 8);
        result.push_back(BASE64_ALPHABET[(n >> 18) & 0x3F]);
        result.push_back(BASE64_ALPHABET[(n >> 12) & 0x3F]);
        result.push_back(BASE64_ALPHABET[(n >> 6) & 0x3F]);
        result.push_back('=');
    }

    return result;
}

std::string encode_preview_base64(const PreviewImage& source, int width, int height) {
    if (source.empty()) {
        return "";
    }

    auto fitted = fit_preview(source, width, height);
    if (!fitted) {
        spdlog::warn("[PreviewEncoder] Preview {}x{} could not be fitted to {}x{}, omitting it",
                     source.width, source.height, width, height);
        return "";
    }

    auto png = encode_png(*fitted);
    if (png.empty()) {
        return "";
    }

    spdlog::debug("[PreviewEncoder] Preview {}x{} encoded to {} PNG bytes", width, height,
                  png.size());
    return base64_encode(png);
}

} // namespace lanprint
