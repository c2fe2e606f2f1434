#include "fwdiff/io/ConfigReader.hpp"
#include "fwdiff/core/Error.hpp"
#include <filesystem>
#include <fstream>
#include <stdexcept>

namespace fwdiff::io {

namespace fs = std::filesystem;

namespace {
    [[noreturn]] void configFileError(const std::string& message) {
        FWDIFF_LOG_DEBUG("Configuration error: {}", message);
        throw ConfigurationError(ErrorCode::CONFIG_FILE, message);
    }

    ad::JacobianSparsity makeSparsity(const std::string& typeName,
                                      std::optional<Index> bandwidth,
                                      std::optional<Index> blocksize) {
        ad::JacobianSparsity::Type type = ad::parseSparsityType(typeName);
        switch (type) {
            case ad::JacobianSparsity::Type::DENSE:
                return ad::JacobianSparsity::dense();
            case ad::JacobianSparsity::Type::BANDED:
                return ad::JacobianSparsity(type, bandwidth, std::nullopt);
            case ad::JacobianSparsity::Type::BLOCK_DIAGONAL:
                return ad::JacobianSparsity(type, std::nullopt, blocksize);
        }
        return ad::JacobianSparsity(type, bandwidth, blocksize);
    }

    // A key that is present must hold a scalar
    std::string scalarString(const YAML::Node& node, const char* key) {
        if (!node.IsScalar()) {
            configFileError(std::string("`") + key + "` must be a string");
        }
        return node.as<std::string>();
    }

    std::string jsonString(const Json::Value& node, const char* key) {
        if (!node.isString()) {
            configFileError(std::string("`") + key + "` must be a string");
        }
        return node.asString();
    }

    Logger::Level makeLevel(const std::string& name) {
        try {
            return Logger::parseLevel(name);
        } catch (const std::invalid_argument& ex) {
            configFileError(ex.what());
        }
    }
}

ConfigReader::ConfigReader(const std::string& filename)
    : filename_(filename) {

    if (!fs::exists(filename_)) {
        configFileError("Configuration file does not exist: " + filename_);
    }
}

ConfigReader::Format ConfigReader::detectFormat() const {
    std::string ext = fs::path(filename_).extension().string();

    if (ext == ".yaml" || ext == ".yml") {
        return Format::YAML;
    } else if (ext == ".json") {
        return Format::JSON;
    }
    configFileError("Unsupported configuration format: " + ext);
}

DifferentiationSettings ConfigReader::read() const {
    FWDIFF_LOG_DEBUG("Reading differentiation settings from {}", filename_);

    if (detectFormat() == Format::YAML) {
        YAML::Node root;
        try {
            root = YAML::LoadFile(filename_);
        } catch (const YAML::Exception& ex) {
            configFileError("Cannot parse " + filename_ + ": " + ex.what());
        }
        return parseSettings(root);
    }

    std::ifstream file(filename_);
    if (!file) {
        configFileError("Cannot open configuration file: " + filename_);
    }

    Json::CharReaderBuilder builder;
    Json::Value root;
    std::string errors;
    if (!Json::parseFromStream(builder, file, &root, &errors)) {
        configFileError("Cannot parse " + filename_ + ": " + errors);
    }
    return parseSettings(root);
}

ad::JacobianSparsity ConfigReader::readSparsity() const {
    return read().sparsity;
}

void ConfigReader::configureLogging() const {
    DifferentiationSettings settings = read();
    Logger* logger = Logger::getInstance();

    if (!settings.logFile.empty()) {
        Logger::Level level = settings.logLevel.value_or(Logger::Level::WARN);
        logger->initialize(settings.logFile, level, level);
    } else if (settings.logLevel) {
        logger->setLevel(*settings.logLevel);
    }
}

ad::JacobianSparsity ConfigReader::parseSparsity(const YAML::Node& node) {
    if (!node || node.IsNull()) {
        return ad::JacobianSparsity::dense();
    }
    if (!node.IsMap()) {
        configFileError("`jacobian` section must be a map");
    }

    try {
        std::string typeName = "dense";
        if (node["sparsity"]) {
            typeName = scalarString(node["sparsity"], "sparsity");
        }

        std::optional<Index> bandwidth;
        if (node["bandwidth"]) {
            bandwidth = node["bandwidth"].as<Index>();
        }

        std::optional<Index> blocksize;
        if (node["blocksize"]) {
            blocksize = node["blocksize"].as<Index>();
        }

        return makeSparsity(typeName, bandwidth, blocksize);
    } catch (const YAML::Exception& ex) {
        configFileError(std::string("Invalid `jacobian` section: ") + ex.what());
    }
}

ad::JacobianSparsity ConfigReader::parseSparsity(const Json::Value& node) {
    if (node.isNull()) {
        return ad::JacobianSparsity::dense();
    }
    if (!node.isObject()) {
        configFileError("`jacobian` section must be an object");
    }

    std::string typeName = "dense";
    if (node.isMember("sparsity")) {
        typeName = jsonString(node["sparsity"], "sparsity");
    }

    std::optional<Index> bandwidth;
    if (node.isMember("bandwidth")) {
        if (!node["bandwidth"].isIntegral()) {
            configFileError("`bandwidth` must be an integer");
        }
        bandwidth = static_cast<Index>(node["bandwidth"].asInt64());
    }

    std::optional<Index> blocksize;
    if (node.isMember("blocksize")) {
        if (!node["blocksize"].isIntegral()) {
            configFileError("`blocksize` must be an integer");
        }
        blocksize = static_cast<Index>(node["blocksize"].asInt64());
    }

    return makeSparsity(typeName, bandwidth, blocksize);
}

DifferentiationSettings ConfigReader::parseSettings(const YAML::Node& root) {
    if (root && !root.IsNull() && !root.IsMap()) {
        configFileError("Configuration root must be a map");
    }

    DifferentiationSettings settings;
    settings.sparsity = parseSparsity(root["jacobian"]);

    YAML::Node logging = root["logging"];
    if (!logging || logging.IsNull()) {
        return settings;
    }
    if (!logging.IsMap()) {
        configFileError("`logging` section must be a map");
    }

    try {
        if (logging["level"]) {
            settings.logLevel = makeLevel(scalarString(logging["level"], "level"));
        }
        if (logging["file"]) {
            settings.logFile = scalarString(logging["file"], "file");
        }
    } catch (const YAML::Exception& ex) {
        configFileError(std::string("Invalid `logging` section: ") + ex.what());
    }

    return settings;
}

DifferentiationSettings ConfigReader::parseSettings(const Json::Value& root) {
    if (!root.isObject()) {
        configFileError("Configuration root must be an object");
    }

    DifferentiationSettings settings;
    settings.sparsity = parseSparsity(root["jacobian"]);

    const Json::Value& logging = root["logging"];
    if (logging.isNull()) {
        return settings;
    }
    if (!logging.isObject()) {
        configFileError("`logging` section must be an object");
    }

    if (logging.isMember("level")) {
        settings.logLevel = makeLevel(jsonString(logging["level"], "level"));
    }
    if (logging.isMember("file")) {
        settings.logFile = jsonString(logging["file"], "file");
    }

    return settings;
}

} // namespace fwdiff::io
