#pragma once

#include "fwdiff/core/Types.hpp"
#include "fwdiff/ad/JacobianSparsity.hpp"
#include "fwdiff/io/Logger.hpp"
#include <optional>
#include <string>
#include <yaml-cpp/yaml.h>
#include <json/json.h>

namespace fwdiff::io {

// Settings read from a configuration file
struct DifferentiationSettings {
    ad::JacobianSparsity sparsity;
    std::optional<Logger::Level> logLevel;
    std::string logFile;
};

// Reads differentiation settings from YAML (.yaml, .yml) or JSON (.json).
//
//   jacobian:
//     sparsity: banded        # dense | banded | block_diagonal
//     bandwidth: 3
//   logging:
//     level: debug
//     file: fwdiff.log
//
// Parameters are not checked against a problem size here; that happens when
// work memory is built or a Jacobian is requested.
class ConfigReader {
public:
    explicit ConfigReader(const std::string& filename);

    const std::string& filename() const { return filename_; }

    DifferentiationSettings read() const;
    ad::JacobianSparsity readSparsity() const;

    // Apply the logging section to the global logger
    void configureLogging() const;

    // Section parsers, usable on in-memory documents
    static ad::JacobianSparsity parseSparsity(const YAML::Node& node);
    static ad::JacobianSparsity parseSparsity(const Json::Value& node);

    static DifferentiationSettings parseSettings(const YAML::Node& root);
    static DifferentiationSettings parseSettings(const Json::Value& root);

private:
    std::string filename_;

    enum class Format { YAML, JSON };
    Format detectFormat() const;
};

} // namespace fwdiff::io
