/*
 * Melrose Networks (Melrose Labs Ltd) - https://melrosenetworks.com
 * Date: 2026-10-19
 * Support: support@melrosenetworks.com
 * Disclaimer: Provided "as is" without warranty; use at your own risk.
 * Title: yaml_loader.h
 * Description: Header for the YAML sink configuration loader and the sample
 *              configuration generator.
 */

#pragma once

#include "secern/config/sink_config.h"
#include <string>
#include <vector>

namespace secern {
namespace config {

// Load sink declarations from a YAML file. Throws ConfigError.
std::vector<SinkDeclaration> load_sinks_from_yaml(const std::string& file_path);

// Same, from an in-memory document. source names the document in messages.
std::vector<SinkDeclaration> parse_sinks_yaml(const std::string& document,
                                              const std::string& source = "<string>");

// Sample two-sink configuration document
std::string template_yaml();

// Write template_yaml() to file_path. Refuses to replace an existing file.
// Throws ConfigError.
void generate_template(const std::string& file_path);

} // namespace config
} // namespace secern
