/**
 * Decoder.cpp
 */

#include "Decoder.hpp"
#include "../Errors.hpp"
#include "../Logger.hpp"
#include "../../utils/FileUtils.hpp"
#include "../../utils/StringUtils.hpp"
#include "../../utils/Subprocess.hpp"

namespace homestream::core {

using utils::StringUtils;

ExternalDecoder::ExternalDecoder(std::string path, std::vector<std::string> args)
    : m_path(std::move(path)), m_args(std::move(args)) {
}

std::unique_ptr<ExternalDecoder> ExternalDecoder::fromConfig(const nlohmann::json& section) {
    std::string path = section.value("path", "");
    if (path.empty()) {
        return nullptr;
    }

    std::vector<std::string> args = {"-m", "{mak}", "-o", "{output}", "{input}"};
    if (section.contains("args")) {
        if (!section.at("args").is_array()) {
            throw ConfigError("togo.decoder.args must be an array of strings");
        }
        args = section.at("args").get<std::vector<std::string>>();
    }
    return std::make_unique<ExternalDecoder>(path, args);
}

std::vector<std::string> ExternalDecoder::buildCommand(const std::string& input, const std::string& output,
                                                       const std::string& mak) const {
    std::vector<std::string> command{m_path};
    for (const auto& arg : m_args) {
        std::string value = StringUtils::replaceAll(arg, "{mak}", mak);
        value = StringUtils::replaceAll(value, "{input}", input);
        value = StringUtils::replaceAll(value, "{output}", output);
        command.push_back(value);
    }
    return command;
}

void ExternalDecoder::decode(const std::string& input, const std::string& output,
                             const std::string& mak) {
    auto command = buildCommand(input, output, mak);
    LOG_DEBUG("Decoding {} -> {}", input, output);

    auto result = utils::Subprocess::run(command);
    if (!result) {
        throw DecodeError("cannot start decoder " + m_path);
    }
    if (result->exitCode != 0) {
        utils::FileUtils::deleteFile(output);
        throw DecodeError("decoder exited with status " + std::to_string(result->exitCode));
    }
    if (!utils::FileUtils::fileExists(output)) {
        throw DecodeError("decoder produced no output");
    }
}

} // namespace homestream::core
