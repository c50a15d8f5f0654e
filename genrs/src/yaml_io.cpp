#include "yaml_io.hpp"
#include "encoding.hpp"
#include "uuid.hpp"
#include <yaml-cpp/yaml.h>
#include <stdexcept>

static std::string finish(YAML::Emitter& out) {
    if (!out.good())
        throw std::runtime_error("YAML emitter error: " + out.GetLastError());
    return std::string(out.c_str()) + "\n";
}

std::string emit_key_yaml(const KeyReport& report) {
    YAML::Emitter out;

    out << YAML::BeginDoc;
    out << YAML::BeginMap;

    out << YAML::Key << "type" << YAML::Value << "key";
    if (report.preset) {
        out << YAML::Key << "preset"      << YAML::Value << report.preset->name;
        out << YAML::Key << "description" << YAML::Value << report.preset->description;
    }
    out << YAML::Key << "format" << YAML::Value << format_name(report.format);
    out << YAML::Key << "bytes"  << YAML::Value << report.bytes;
    // Quoted so a hex key made only of digits stays a string
    out << YAML::Key << "value"  << YAML::Value << YAML::DoubleQuoted << report.value;

    out << YAML::EndMap;
    out << YAML::EndDoc;

    return finish(out);
}

std::string emit_uuid_yaml(const UuidReport& report) {
    YAML::Emitter out;

    out << YAML::BeginDoc;
    out << YAML::BeginMap;

    out << YAML::Key << "type"    << YAML::Value << "uuid";
    out << YAML::Key << "version" << YAML::Value << static_cast<int>(report.version);
    if (report.ns)
        out << YAML::Key << "namespace" << YAML::Value << uuid::to_string(*report.ns);
    if (report.name)
        out << YAML::Key << "name" << YAML::Value << *report.name;
    out << YAML::Key << "value" << YAML::Value << report.value;

    out << YAML::EndMap;
    out << YAML::EndDoc;

    return finish(out);
}
