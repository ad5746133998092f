#include "migration_config.hpp"
#include <yaml-cpp/yaml.h>
#include <fmt/format.h>
#include <cctype>
#include <fstream>
#include <sstream>

static Result<HypervisorAccess> parse_access(const YAML::Node& root, const char* section,
                                             bool destination) {
    YAML::Node node = root[section];
    if (!node || !node.IsMap()) {
        return Result<HypervisorAccess>::Err(fmt::format("'{}' section missing", section));
    }

    HypervisorAccess a;
    a.type = node["type"].as<std::string>("");
    a.host = node["host"].as<std::string>("");
    a.user = node["user"].as<std::string>("");
    a.password = node["password"].as<std::string>("");
    if (destination) {
        a.storage = node["storage"].as<std::string>(DEFAULT_STORAGE_POOL);
    }

    if (a.type.empty()) {
        return Result<HypervisorAccess>::Err(fmt::format("{}.type is required", section));
    }
    for (char c : a.type) {
        if (!std::isalnum(static_cast<unsigned char>(c)) && c != '_') {
            return Result<HypervisorAccess>::Err(
                fmt::format("{}.type '{}' must be alphanumeric", section, a.type));
        }
    }
    return Result<HypervisorAccess>::Ok(a);
}

Result<MigrationProfile> parse_migration_profile(const std::string& yaml_text) {
    try {
        YAML::Node root = YAML::Load(yaml_text);
        if (!root.IsMap()) {
            return Result<MigrationProfile>::Err("Migration profile must be a YAML map");
        }

        MigrationProfile p;
        auto src = parse_access(root, "source", false);
        if (src.is_err()) return Result<MigrationProfile>::Err(src.error);
        auto dst = parse_access(root, "destination", true);
        if (dst.is_err()) return Result<MigrationProfile>::Err(dst.error);
        if (src.value.type == dst.value.type) {
            return Result<MigrationProfile>::Err(
                fmt::format("source and destination are both '{}'", src.value.type));
        }
        p.source = src.value;
        p.destination = dst.value;

        p.export_root = root["export_root"].as<std::string>(DEFAULT_EXPORT_ROOT);

        if (auto vms = root["selected_vms"]) {
            if (!vms.IsSequence()) {
                return Result<MigrationProfile>::Err("selected_vms must be a list");
            }
            for (const auto& vm : vms) {
                p.selected_vms.push_back(vm.as<std::string>());
            }
        }
        return Result<MigrationProfile>::Ok(p);
    } catch (const YAML::Exception& e) {
        return Result<MigrationProfile>::Err(fmt::format("Invalid migration profile: {}", e.what()));
    }
}

Result<MigrationProfile> load_migration_profile(const fs::path& path) {
    std::ifstream f(path);
    if (!f) {
        return Result<MigrationProfile>::Err("Cannot read " + path.string());
    }
    std::stringstream ss;
    ss << f.rdbuf();
    return parse_migration_profile(ss.str());
}

std::string to_payload_json(const MigrationProfile& profile) {
    const auto& s = profile.source;
    const auto& d = profile.destination;

    YAML::Emitter out;
    out.SetMapFormat(YAML::Flow);
    out.SetSeqFormat(YAML::Flow);
    out.SetStringFormat(YAML::DoubleQuoted);
    out.SetOutputCharset(YAML::EscapeAsJson);

    out << YAML::BeginMap;
    out << YAML::Key << s.type + "_host" << YAML::Value << s.host;
    out << YAML::Key << s.type + "_user" << YAML::Value << s.user;
    out << YAML::Key << s.type + "_pass" << YAML::Value << s.password;
    out << YAML::Key << d.type + "_host" << YAML::Value << d.host;
    out << YAML::Key << d.type + "_user" << YAML::Value << d.user;
    out << YAML::Key << d.type + "_pass" << YAML::Value << d.password;
    out << YAML::Key << d.type + "_storage_pool" << YAML::Value << d.storage;
    out << YAML::Key << "export_root" << YAML::Value << profile.export_root;
    out << YAML::Key << "selected_vms" << YAML::Value << YAML::BeginSeq;
    for (const auto& vm : profile.selected_vms) {
        out << vm;
    }
    out << YAML::EndSeq;
    out << YAML::EndMap;

    return out.c_str();
}

Result<void> write_payload_config(const MigrationProfile& profile, const fs::path& path) {
    std::ofstream f(path, std::ios::trunc);
    if (!f) {
        return Result<void>::Err("Cannot write " + path.string());
    }
    f << to_payload_json(profile) << "\n";
    if (!f) {
        return Result<void>::Err("Write failed for " + path.string());
    }
    return Result<void>::Ok();
}
