/*
 * Melrose Networks (Melrose Labs Ltd) - https://melrosenetworks.com
 * Date: 2026-10-19
 * Support: support@melrosenetworks.com
 * Disclaimer: Provided "as is" without warranty; use at your own risk.
 * Title: yaml_loader.cc
 * Description: Implementation of the YAML sink configuration loader. Reads the
 *              'sinks' sequence, checks each record's fields, maps the
 *              discard sentinel to an explicit destination kind, and emits
 *              the sample configuration used by --gen-template.
 */

#include "secern/config/yaml_loader.h"
#include "secern/utils/error.h"
#include <yaml-cpp/yaml.h>
#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;

namespace secern {
namespace config {

namespace {

std::string record_label(size_t index, const std::string& name) {
    std::string label = "sink #" + std::to_string(index + 1);
    if (!name.empty()) {
        label += " ('" + name + "')";
    }
    return label;
}

std::string required_string(const YAML::Node& record, const char* key,
                            const std::string& label) {
    const YAML::Node value = record[key];
    if (!value) {
        throw ConfigError(label + ": missing '" + key + "'");
    }
    if (!value.IsScalar()) {
        throw ConfigError(label + ": '" + key + "' must be a string");
    }
    return value.as<std::string>();
}

SinkDeclaration parse_record(const YAML::Node& record, size_t index) {
    if (!record.IsMap()) {
        throw ConfigError(record_label(index, "") + ": expected a mapping");
    }

    SinkDeclaration decl;
    decl.name = required_string(record, "name", record_label(index, ""));
    if (decl.name.empty()) {
        throw ConfigError(record_label(index, "") + ": 'name' must not be empty");
    }
    const std::string label = record_label(index, decl.name);

    // file_name: null (YAML null) and file_name: "null" both select discard
    const YAML::Node file_node = record["file_name"];
    if (!file_node) {
        throw ConfigError(label + ": missing 'file_name'");
    }
    if (file_node.IsNull()) {
        decl.destination = SinkDestination::discard();
    } else if (file_node.IsScalar()) {
        std::string file_name = file_node.as<std::string>();
        if (file_name.empty()) {
            throw ConfigError(label + ": 'file_name' must not be empty");
        }
        decl.destination = SinkDestination::from_file_name(file_name);
    } else {
        throw ConfigError(label + ": 'file_name' must be a string");
    }

    const YAML::Node patterns = record["patterns"];
    if (!patterns) {
        throw ConfigError(label + ": missing 'patterns'");
    }
    if (!patterns.IsSequence()) {
        throw ConfigError(label + ": 'patterns' must be a list of strings");
    }
    for (const auto& pattern : patterns) {
        if (!pattern.IsScalar()) {
            throw ConfigError(label + ": 'patterns' must be a list of strings");
        }
        decl.patterns.push_back(pattern.as<std::string>());
    }
    if (decl.patterns.empty()) {
        throw ConfigError(label + ": 'patterns' must contain at least one pattern");
    }

    // YAML 1.2 booleans only; yaml-cpp's as<bool>() would also take yes/no/on/off
    const YAML::Node invert = record["invert"];
    if (invert && !invert.IsNull()) {
        // Quoted scalars carry the "!" tag and are strings, not booleans
        const bool plain = invert.IsScalar() && invert.Tag() != "!";
        const std::string value = plain ? invert.Scalar() : "";
        if (value == "true" || value == "True" || value == "TRUE") {
            decl.invert = true;
        } else if (value == "false" || value == "False" || value == "FALSE") {
            decl.invert = false;
        } else {
            throw ConfigError(label + ": 'invert' must be true or false");
        }
    }

    return decl;
}

std::vector<SinkDeclaration> parse_root(const YAML::Node& root, const std::string& source) {
    if (!root.IsMap() || !root["sinks"]) {
        throw ConfigError("Missing 'sinks' key in configuration file (" + source + ")");
    }
    const YAML::Node sinks = root["sinks"];
    if (!sinks.IsSequence()) {
        throw ConfigError("'sinks' must be a list in configuration file (" + source + ")");
    }

    std::vector<SinkDeclaration> declarations;
    for (size_t i = 0; i < sinks.size(); ++i) {
        try {
            declarations.push_back(parse_record(sinks[i], i));
        } catch (const ConfigError& e) {
            throw ConfigError("Error parsing configuration file (" + source + ") due to error: " +
                              e.what());
        }
    }
    return declarations;
}

} // namespace

std::vector<SinkDeclaration> load_sinks_from_yaml(const std::string& file_path) {
    YAML::Node root;
    try {
        root = YAML::LoadFile(file_path);
    } catch (const YAML::BadFile&) {
        throw ConfigError("Unable to open specified configuration file (" + file_path + ")");
    } catch (const YAML::Exception& e) {
        throw ConfigError("Error parsing configuration file (" + file_path +
                          ") due to error: " + e.what());
    }
    return parse_root(root, file_path);
}

std::vector<SinkDeclaration> parse_sinks_yaml(const std::string& document,
                                              const std::string& source) {
    YAML::Node root;
    try {
        root = YAML::Load(document);
    } catch (const YAML::Exception& e) {
        throw ConfigError("Error parsing configuration file (" + source +
                          ") due to error: " + e.what());
    }
    return parse_root(root, source);
}

std::string template_yaml() {
    const std::vector<SinkDeclaration> samples = {
        {"first_sink", SinkDestination::file("first_output.txt"), {"^[a-zA-Z0-9]+$"}, false},
        {"second_sink", SinkDestination::file("second_output.txt"), {"😎*"}, false},
    };

    YAML::Emitter out;
    out << YAML::BeginMap;
    out << YAML::Key << "sinks" << YAML::Value << YAML::BeginSeq;
    for (const auto& sample : samples) {
        out << YAML::BeginMap;
        out << YAML::Key << "name" << YAML::Value << sample.name;
        out << YAML::Key << "file_name" << YAML::Value << sample.destination.file_name();
        out << YAML::Key << "patterns" << YAML::Value << YAML::BeginSeq;
        for (const auto& pattern : sample.patterns) {
            out << YAML::SingleQuoted << pattern;
        }
        out << YAML::EndSeq;
        out << YAML::EndMap;
    }
    out << YAML::EndSeq;
    out << YAML::EndMap;

    return std::string(out.c_str()) + "\n";
}

void generate_template(const std::string& file_path) {
    std::error_code ec;
    if (fs::exists(file_path, ec)) {
        throw ConfigError("Template file '" + file_path + "' already exists, refusing to overwrite it");
    }

    std::ofstream file(file_path, std::ios::out | std::ios::trunc);
    if (!file.is_open()) {
        throw ConfigError("Unable to create template file '" + file_path + "'");
    }
    file << template_yaml();
    file.flush();
    if (!file) {
        throw ConfigError("Unable to write template file '" + file_path + "'");
    }
}

} // namespace config
} // namespace secern
