// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "gcode_header_encoder.h"

#include "config.h"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cerrno>
#include <climits>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <fstream>

namespace lanprint {

namespace {

// Slicer comments and our identity line are only looked for near the top
constexpr int HEADER_SCAN_LINES = 100;

std::string format_fixed(const char* fmt, double value) {
    // Room for any finite double in fixed notation
    char buf[512];
    std::snprintf(buf, sizeof(buf), fmt, value);
    return buf;
}

std::string fmt_int(double value) {
    return format_fixed("%.0f", value);
}

/// Fixed notation, at most 4 decimals, trailing zeros dropped ("1.5", "12345.678", "0")
std::string fmt_len(double value) {
    std::string s = format_fixed("%.4f", value);
    size_t last = s.find_last_not_of('0');
    if (s.find('.') != std::string::npos && last != std::string::npos) {
        s.erase(last + 1);
        if (s.back() == '.') {
            s.pop_back();
        }
    }
    if (s == "-0") {
        s = "0";
    }
    return s;
}

bool starts_with(const std::string& s, const char* prefix) {
    return s.compare(0, std::strlen(prefix), prefix) == 0;
}

std::optional<double> parse_number(const std::string& text) {
    const char* begin = text.c_str();
    while (*begin == ' ' || *begin == '\t') {
        ++begin;
    }
    char* end = nullptr;
    double value = std::strtod(begin, &end);
    if (end == begin || !std::isfinite(value)) {
        return std::nullopt;
    }
    return value;
}

/// Call fn(line) for each of the first max_lines lines, without the line ending
template <typename Fn> void for_each_leading_line(const std::string& text, int max_lines, Fn fn) {
    size_t pos = 0;
    for (int i = 0; i < max_lines && pos < text.size(); ++i) {
        size_t eol = text.find('\n', pos);
        size_t len = (eol == std::string::npos ? text.size() : eol) - pos;
        std::string line = text.substr(pos, len);
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (!fn(line)) {
            return;
        }
        if (eol == std::string::npos) {
            return;
        }
        pos = eol + 1;
    }
}

size_t count_lines(const std::string& text) {
    if (text.empty()) {
        return 0;
    }
    size_t lines = 0;
    for (char c : text) {
        if (c == '\n') {
            ++lines;
        }
    }
    if (text.back() != '\n') {
        ++lines;
    }
    return lines;
}

template <typename T> void take_if_unset(std::optional<T>& mine, const std::optional<T>& theirs) {
    if (!mine && theirs) {
        mine = theirs;
    }
}

} // namespace

EncoderSettings EncoderSettings::from_config(Config& config) {
    EncoderSettings s;
    s.thumbnail_width = config.get<int>("/encoder/thumbnail_width", s.thumbnail_width);
    s.thumbnail_height = config.get<int>("/encoder/thumbnail_height", s.thumbnail_height);
    s.time_factor = config.get<double>("/encoder/time_factor", s.time_factor);
    s.processed_identity =
        config.get<std::string>("/encoder/processed_identity", s.processed_identity);

    if (s.thumbnail_width <= 0 || s.thumbnail_height <= 0) {
        spdlog::warn("[Encoder] Invalid thumbnail size {}x{}, using 240x160", s.thumbnail_width,
                     s.thumbnail_height);
        s.thumbnail_width = 240;
        s.thumbnail_height = 160;
    }
    if (s.processed_identity.empty()) {
        s.processed_identity = "Processed by LanPrint";
    }
    return s;
}

void PrintParameters::merge_missing(const PrintParameters& other) {
    take_if_unset(flavor, other.flavor);
    take_if_unset(estimated_time_s, other.estimated_time_s);
    take_if_unset(filament_length_m, other.filament_length_m);
    take_if_unset(filament_weight_g, other.filament_weight_g);
    take_if_unset(layer_height_mm, other.layer_height_mm);
    take_if_unset(layer_count, other.layer_count);
    take_if_unset(nozzle_temperature, other.nozzle_temperature);
    take_if_unset(bed_temperature, other.bed_temperature);
    take_if_unset(work_speed_mm_s, other.work_speed_mm_s);
    take_if_unset(min_x, other.min_x);
    take_if_unset(min_y, other.min_y);
    take_if_unset(min_z, other.min_z);
    take_if_unset(max_x, other.max_x);
    take_if_unset(max_y, other.max_y);
    take_if_unset(max_z, other.max_z);
}

PrintParameters parse_slicer_header(const std::string& gcode) {
    PrintParameters p;

    for_each_leading_line(gcode, HEADER_SCAN_LINES, [&p](const std::string& line) {
        if (line.empty() || line[0] != ';') {
            return true;
        }
        std::string c = line.substr(1);

        if (starts_with(c, "FLAVOR:")) {
            std::string flavor = c.substr(7);
            size_t start = flavor.find_first_not_of(' ');
            if (start != std::string::npos) {
                p.flavor = flavor.substr(start);
            }
        } else if (starts_with(c, "TIME:")) {
            p.estimated_time_s = parse_number(c.substr(5));
        } else if (starts_with(c, "Filament used:")) {
            // "1.23456m", or "1.2m, 0.4m" for several extruders
            std::string rest = c.substr(14);
            double total = 0;
            bool any = false;
            size_t pos = 0;
            while (pos <= rest.size()) {
                size_t comma = rest.find(',', pos);
                std::string part =
                    rest.substr(pos, comma == std::string::npos ? std::string::npos : comma - pos);
                if (auto v = parse_number(part)) {
                    total += *v;
                    any = true;
                }
                if (comma == std::string::npos) {
                    break;
                }
                pos = comma + 1;
            }
            if (any) {
                p.filament_length_m = total;
            }
        } else if (starts_with(c, "Layer height:")) {
            p.layer_height_mm = parse_number(c.substr(13));
        } else if (starts_with(c, "LAYER_COUNT:")) {
            if (auto v = parse_number(c.substr(12))) {
                p.layer_count = static_cast<int>(
                    std::min(std::max(*v, 0.0), static_cast<double>(INT_MAX)));
            }
        } else if (starts_with(c, "MINX:")) {
            p.min_x = parse_number(c.substr(5));
        } else if (starts_with(c, "MINY:")) {
            p.min_y = parse_number(c.substr(5));
        } else if (starts_with(c, "MINZ:")) {
            p.min_z = parse_number(c.substr(5));
        } else if (starts_with(c, "MAXX:")) {
            p.max_x = parse_number(c.substr(5));
        } else if (starts_with(c, "MAXY:")) {
            p.max_y = parse_number(c.substr(5));
        } else if (starts_with(c, "MAXZ:")) {
            p.max_z = parse_number(c.substr(5));
        }
        return true;
    });

    return p;
}

bool is_already_processed(const std::string& gcode, const std::string& identity) {
    if (identity.empty()) {
        return false;
    }
    bool found = false;
    for_each_leading_line(gcode, HEADER_SCAN_LINES, [&](const std::string& line) {
        if (line.find(identity) != std::string::npos) {
            found = true;
            return false;
        }
        return true;
    });
    return found;
}

TransferPayload encode_payload(const std::string& gcode, const PreviewImage& preview,
                               const PrintParameters& params, const EncoderSettings& settings) {
    TransferPayload payload;
    payload.body = gcode;

    if (is_already_processed(gcode, settings.processed_identity)) {
        spdlog::debug("[Encoder] Body already carries a device header, sending it unchanged");
        return payload;
    }

    PrintParameters p = params;
    p.merge_missing(parse_slicer_header(gcode));

    double time_s = p.estimated_time_s.value_or(0.0);

    std::string h;
    h.reserve(512);
    h += ";" + settings.processed_identity + "\n";
    h += ";Header Start\n";
    h += ";FLAVOR:" + p.flavor.value_or("Marlin") + "\n";
    h += ";TIME:" + fmt_int(time_s) + "\n";
    h += ";Filament used: " + fmt_len(p.filament_length_m.value_or(0.0)) + "m\n";
    h += ";Layer height: " + fmt_len(p.layer_height_mm.value_or(0.0)) + "\n";
    h += ";header_type: 3dp\n";

    std::string thumbnail =
        encode_preview_base64(preview, settings.thumbnail_width, settings.thumbnail_height);
    if (!thumbnail.empty()) {
        h += ";thumbnail: data:image/png;base64," + thumbnail + "\n";
    }

    h += ";file_total_lines: " + std::to_string(count_lines(gcode)) + "\n";
    h += ";estimated_time(s): " + fmt_int(time_s * settings.time_factor) + "\n";
    h += ";nozzle_temperature(°C): " + fmt_int(p.nozzle_temperature.value_or(0.0)) + "\n";
    h += ";build_plate_temperature(°C): " + fmt_int(p.bed_temperature.value_or(0.0)) + "\n";
    h += ";work_speed(mm/minute): " + fmt_int(p.work_speed_mm_s.value_or(0.0) * 60.0) + "\n";
    h += ";max_x(mm): " + fmt_len(p.max_x.value_or(0.0)) + "\n";
    h += ";max_y(mm): " + fmt_len(p.max_y.value_or(0.0)) + "\n";
    h += ";max_z(mm): " + fmt_len(p.max_z.value_or(0.0)) + "\n";
    h += ";min_x(mm): " + fmt_len(p.min_x.value_or(0.0)) + "\n";
    h += ";min_y(mm): " + fmt_len(p.min_y.value_or(0.0)) + "\n";
    h += ";min_z(mm): " + fmt_len(p.min_z.value_or(0.0)) + "\n";
    h += ";layer_number: " + std::to_string(p.layer_count.value_or(0)) + "\n";
    h += ";filament_weight(g): " + fmt_len(p.filament_weight_g.value_or(0.0)) + "\n";
    h += ";Header End\n";

    payload.header = std::move(h);

    spdlog::debug("[Encoder] Header {} bytes (thumbnail {}), body {} bytes", payload.header.size(),
                  thumbnail.empty() ? "none" : std::to_string(thumbnail.size()) + " b64",
                  payload.body.size());
    return payload;
}

std::string make_upload_filename(const std::string& job_name, const std::string& material,
                                 double print_time_s) {
    auto sanitize = [](const std::string& in) {
        std::string out;
        out.reserve(in.size());
        for (unsigned char c : in) {
            if (c < 0x20 || c == 0x7f || c == '/' || c == '\\' || c == '"') {
                out.push_back('_');
            } else {
                out.push_back(static_cast<char>(c));
            }
        }
        size_t start = out.find_first_not_of(' ');
        size_t end = out.find_last_not_of(' ');
        return start == std::string::npos ? std::string() : out.substr(start, end - start + 1);
    };

    long total = print_time_s > 0 ? static_cast<long>(print_time_s) : 0;
    long hours = total / 3600;
    long minutes = (total % 3600) / 60;
    long seconds = total % 60;

    std::string job = sanitize(job_name);
    if (job.empty()) {
        job = "untitled";
    }

    return job + "_" + sanitize(material) + "_" + std::to_string(hours) + "h" +
           std::to_string(minutes) + "m" + std::to_string(seconds) + "s.gcode";
}

bool write_payload_file(const TransferPayload& payload, const std::string& path,
                        std::string* error) {
    auto fail = [&](const std::string& reason) {
        spdlog::error("[Encoder] Cannot write {}: {}", path, reason);
        if (error) {
            *error = reason;
        }
        return false;
    };

    if (path.empty()) {
        return fail("empty output path");
    }

    std::string tmp = path + ".tmp";
    {
        std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
        if (!out.is_open()) {
            return fail(std::strerror(errno));
        }
        out.write(payload.header.data(), static_cast<std::streamsize>(payload.header.size()));
        out.write(payload.body.data(), static_cast<std::streamsize>(payload.body.size()));
        out.flush();
        if (!out.good()) {
            out.close();
            std::remove(tmp.c_str());
            return fail("write failed");
        }
    }

    if (std::rename(tmp.c_str(), path.c_str()) != 0) {
        std::string reason = std::strerror(errno);
        std::remove(tmp.c_str());
        return fail(reason);
    }

    spdlog::info("[Encoder] Wrote {} bytes to {}", payload.size(), path);
    return true;
}

} // namespace lanprint
