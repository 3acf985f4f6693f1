/**
 * MediaInspector.cpp
 */

#include "MediaInspector.hpp"
#include "../Logger.hpp"
#include "../../utils/StringUtils.hpp"
#include "../../utils/Subprocess.hpp"

#include <nlohmann/json.hpp>

namespace homestream::core::server {

using json = nlohmann::json;
using utils::StringUtils;

namespace {

// ffprobe reports most numbers as strings
int64_t numberField(const json& object, const char* key) {
    auto it = object.find(key);
    if (it == object.end()) return 0;
    if (it->is_number()) return it->get<int64_t>();
    if (it->is_string()) {
        const std::string& value = it->get_ref<const std::string&>();
        auto parsed = StringUtils::parseLong(value);
        if (parsed) return *parsed;
        // "1234.567" durations
        auto dot = value.find('.');
        if (dot != std::string::npos) {
            return StringUtils::parseLong(value.substr(0, dot)).value_or(0);
        }
    }
    return 0;
}

double parseAspect(const std::string& ratio) {
    auto parts = StringUtils::split(ratio, ':');
    if (parts.size() != 2) return 0.0;
    auto num = StringUtils::parseLong(parts[0]);
    auto den = StringUtils::parseLong(parts[1]);
    if (!num || !den || *den == 0) return 0.0;
    return static_cast<double>(*num) / static_cast<double>(*den);
}

} // namespace

FfprobeInspector::FfprobeInspector(std::string ffprobePath)
    : m_ffprobePath(std::move(ffprobePath)) {
}

std::optional<MediaInfo> FfprobeInspector::inspect(const std::string& path) {
    auto result = utils::Subprocess::run({
        m_ffprobePath, "-v", "quiet", "-print_format", "json",
        "-show_format", "-show_streams", path
    });

    if (!result) {
        LOG_ERROR("Cannot run {}", m_ffprobePath);
        return std::nullopt;
    }
    if (result->exitCode != 0) {
        LOG_WARN("{} failed on {} (exit {})", m_ffprobePath, path, result->exitCode);
        return std::nullopt;
    }

    auto info = parse(result->output);
    if (!info) {
        LOG_WARN("Unreadable ffprobe output for {}", path);
    }
    return info;
}

std::optional<MediaInfo> FfprobeInspector::parse(const std::string& output) {
    json root = json::parse(output, nullptr, false);
    if (root.is_discarded() || !root.is_object()) {
        return std::nullopt;
    }

    MediaInfo info;

    if (root.contains("format") && root["format"].is_object()) {
        const auto& format = root["format"];
        info.container = format.value("format_name", "");
        if (format.contains("duration") && format["duration"].is_string()) {
            // seconds with a fractional part
            const std::string duration = format["duration"].get<std::string>();
            auto dot = duration.find('.');
            int64_t seconds = StringUtils::parseLong(duration.substr(0, dot)).value_or(0);
            int64_t millis = 0;
            if (dot != std::string::npos) {
                std::string fraction = (duration.substr(dot + 1) + "000").substr(0, 3);
                millis = StringUtils::parseLong(fraction).value_or(0);
            }
            info.durationMs = seconds * 1000 + millis;
        }
        info.bitrate = numberField(format, "bit_rate");
    }

    if (root.contains("streams") && root["streams"].is_array()) {
        for (const auto& stream : root["streams"]) {
            std::string type = stream.value("codec_type", "");

            if (type == "video" && info.videoCodec.empty()) {
                info.videoCodec = stream.value("codec_name", "");
                info.width = static_cast<int>(numberField(stream, "width"));
                info.height = static_cast<int>(numberField(stream, "height"));
                info.videoBitrate = numberField(stream, "bit_rate");
                info.aspectRatio = parseAspect(stream.value("display_aspect_ratio", ""));
                if (info.aspectRatio == 0.0 && info.height > 0) {
                    info.aspectRatio = static_cast<double>(info.width) / info.height;
                }
            } else if (type == "audio" && info.audioCodec.empty()) {
                info.audioCodec = stream.value("codec_name", "");
                info.audioBitrate = numberField(stream, "bit_rate");
                info.audioSampleRate = static_cast<int>(numberField(stream, "sample_rate"));
            }
        }
    }

    if (info.container.empty() && !info.hasVideo()) {
        return std::nullopt;
    }
    return info;
}

} // namespace homestream::core::server
