// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "preview_encoder.h"

#include <cstddef>
#include <optional>
#include <string>

namespace lanprint {

class Config;

/**
 * @brief Encoder tuning for the Snapmaker 2 touchscreen header
 */
struct EncoderSettings {
    int thumbnail_width = 240;
    int thumbnail_height = 160;
    double time_factor = 1.07; ///< Firmware under-reports without it
    std::string processed_identity = "Processed by LanPrint";

    static EncoderSettings from_config(Config& config);
};

/**
 * @brief Print parameters computed by the slicer
 *
 * Anything left unset is taken from the slicer's own header comments, and
 * failing that written as 0.
 */
struct PrintParameters {
    std::optional<std::string> flavor;
    std::optional<double> estimated_time_s;
    std::optional<double> filament_length_m;
    std::optional<double> filament_weight_g;
    std::optional<double> layer_height_mm;
    std::optional<int> layer_count;
    std::optional<double> nozzle_temperature;
    std::optional<double> bed_temperature;
    std::optional<double> work_speed_mm_s;
    std::optional<double> min_x, min_y, min_z;
    std::optional<double> max_x, max_y, max_z;

    /// Fill every unset field from other, keeping the ones already set
    void merge_missing(const PrintParameters& other);
};

/**
 * @brief Header and G-code body, sent back to back
 */
struct TransferPayload {
    std::string header; ///< Empty when the body was already processed
    std::string body;

    size_t size() const {
        return header.size() + body.size();
    }
};

/**
 * @brief Read Cura-style header comments (;FLAVOR:, ;TIME:, ;MINX: ...)
 *
 * Only the first 100 lines are inspected.
 */
PrintParameters parse_slicer_header(const std::string& gcode);

/**
 * @brief true if the identity line is within the first 100 lines
 */
bool is_already_processed(const std::string& gcode, const std::string& identity);

/**
 * @brief Build the device header for a G-code body
 *
 * Pure function: the same inputs always produce byte-identical output.
 * Already processed bodies come back unchanged with an empty header.
 */
TransferPayload encode_payload(const std::string& gcode, const PreviewImage& preview,
                               const PrintParameters& params, const EncoderSettings& settings);

/**
 * @brief "<job>_<material>_<H>h<M>m<S>s.gcode" with unsafe characters replaced by '_'
 */
std::string make_upload_filename(const std::string& job_name, const std::string& material,
                                 double print_time_s);

/**
 * @brief Write header then body to path (temp file + rename)
 *
 * @param error Receives a reason on failure (may be null)
 */
bool write_payload_file(const TransferPayload& payload, const std::string& path,
                        std::string* error = nullptr);

} // namespace lanprint
