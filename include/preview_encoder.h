// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace lanprint {

/**
 * @brief RGBA8888 raster as rendered by the slicer
 */
struct PreviewImage {
    int width = 0;
    int height = 0;
    std::vector<uint8_t> rgba; ///< width * height * 4 bytes, row-major, no padding

    bool empty() const {
        return width <= 0 || height <= 0 || rgba.empty();
    }

    bool is_valid() const {
        return width > 0 && height > 0 &&
               rgba.size() == static_cast<size_t>(width) * static_cast<size_t>(height) * 4;
    }
};

/**
 * @brief Decode PNG (or any format stb_image reads) into RGBA
 *
 * @param error Receives a reason on failure (may be null)
 */
std::optional<PreviewImage> decode_preview(const std::vector<uint8_t>& encoded,
                                           std::string* error = nullptr);

/**
 * @brief Scale to cover width x height, preserving aspect ratio, then centre-crop
 *
 * @return std::nullopt if the source is invalid or resizing fails
 */
std::optional<PreviewImage> fit_preview(const PreviewImage& source, int width, int height);

/**
 * @brief Encode RGBA to PNG in memory
 *
 * No time or text chunks are written, so identical pixels give identical bytes.
 *
 * @return PNG bytes, empty on failure
 */
std::vector<uint8_t> encode_png(const PreviewImage& image);

/**
 * @brief Standard base64 (RFC 4648) with '=' padding
 */
std::string base64_encode(const uint8_t* data, size_t size);

inline std::string base64_encode(const std::vector<uint8_t>& data) {
    return base64_encode(data.data(), data.size());
}

/**
 * @brief Fit, PNG-encode and base64 a preview for the device touchscreen
 *
 * @return Base64 text, empty if there is no usable preview
 */
std::string encode_preview_base64(const PreviewImage& source, int width, int height);

} // namespace lanprint
