#pragma once

/**
 * Decoder.hpp
 *
 * Removes the receiver's encryption from a pulled recording by running an
 * external decoder executable.
 */

#include <memory>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace homestream::core {

class Decoder {
public:
    virtual ~Decoder() = default;

    /**
     * Decode input into output using the media access key
     * @throws DecodeError
     */
    virtual void decode(const std::string& input, const std::string& output,
                        const std::string& mak) = 0;

    virtual std::string name() const = 0;
};

/**
 * ExternalDecoder - runs "<path> <args...>" with {mak}, {input} and
 * {output} substituted in each argument
 */
class ExternalDecoder : public Decoder {
public:
    ExternalDecoder(std::string path, std::vector<std::string> args);

    /**
     * Build from the "togo.decoder" config section
     * @return nullptr if no decoder path is configured
     */
    static std::unique_ptr<ExternalDecoder> fromConfig(const nlohmann::json& section);

    void decode(const std::string& input, const std::string& output,
                const std::string& mak) override;

    std::string name() const override { return m_path; }

    std::vector<std::string> buildCommand(const std::string& input, const std::string& output,
                                          const std::string& mak) const;

private:
    std::string m_path;
    std::vector<std::string> m_args;
};

} // namespace homestream::core
