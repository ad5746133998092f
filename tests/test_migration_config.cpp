#include <gtest/gtest.h>
#include <managers/migration_config.hpp>
#include <platform/platform.hpp>
#include <yaml-cpp/yaml.h>
#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;

static const char* PROFILE = R"(
source:
  type: esxi
  host: 192.168.203.74
  user: root
  password: "p@ss\"word"
destination:
  type: kvm
  host: 10.0.0.20
  user: kvmuser
  password: hunter2
  storage: /data/images
export_root: /var/exports
selected_vms: [web01, db01]
)";

TEST(MigrationConfig, ParseProfile) {
    auto r = parse_migration_profile(PROFILE);
    ASSERT_TRUE(r.is_ok()) << r.error;
    const auto& p = r.value;
    EXPECT_EQ(p.source.type, "esxi");
    EXPECT_EQ(p.source.password, "p@ss\"word");
    EXPECT_EQ(p.destination.type, "kvm");
    EXPECT_EQ(p.destination.storage, "/data/images");
    EXPECT_EQ(p.export_root, "/var/exports");
    ASSERT_EQ(p.selected_vms.size(), 2u);
    EXPECT_EQ(p.selected_vms[1], "db01");
}

TEST(MigrationConfig, Defaults) {
    auto r = parse_migration_profile(R"(
source: {type: esxi, host: a}
destination: {type: kvm, host: b}
)");
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(r.value.export_root, "./exports");
    EXPECT_EQ(r.value.destination.storage, "/var/lib/libvirt/images");
    EXPECT_TRUE(r.value.selected_vms.empty());
}

TEST(MigrationConfig, FlatJsonKeys) {
    auto r = parse_migration_profile(PROFILE);
    ASSERT_TRUE(r.is_ok());
    std::string json = to_payload_json(r.value);

    // JSON is valid YAML, so read it back with the same parser
    YAML::Node doc = YAML::Load(json);
    ASSERT_TRUE(doc.IsMap());
    EXPECT_EQ(doc.size(), 9u);
    EXPECT_EQ(doc["esxi_host"].as<std::string>(), "192.168.203.74");
    EXPECT_EQ(doc["esxi_user"].as<std::string>(), "root");
    EXPECT_EQ(doc["esxi_pass"].as<std::string>(), "p@ss\"word");
    EXPECT_EQ(doc["kvm_host"].as<std::string>(), "10.0.0.20");
    EXPECT_EQ(doc["kvm_user"].as<std::string>(), "kvmuser");
    EXPECT_EQ(doc["kvm_pass"].as<std::string>(), "hunter2");
    EXPECT_EQ(doc["kvm_storage_pool"].as<std::string>(), "/data/images");
    EXPECT_EQ(doc["export_root"].as<std::string>(), "/var/exports");
    ASSERT_TRUE(doc["selected_vms"].IsSequence());
    EXPECT_EQ(doc["selected_vms"][0].as<std::string>(), "web01");

    EXPECT_EQ(json.front(), '{');
    EXPECT_NE(json.find("\"esxi_pass\": \"p@ss\\\"word\""), std::string::npos);
}

TEST(MigrationConfig, EmptyVmListIsArray) {
    auto r = parse_migration_profile(R"(
source: {type: esxi}
destination: {type: proxmox}
)");
    ASSERT_TRUE(r.is_ok());
    std::string json = to_payload_json(r.value);
    EXPECT_NE(json.find("\"selected_vms\": []"), std::string::npos);
    EXPECT_NE(json.find("\"proxmox_storage_pool\""), std::string::npos);
}

TEST(MigrationConfig, Errors) {
    EXPECT_TRUE(parse_migration_profile("- just\n- a list\n").is_err());
    EXPECT_TRUE(parse_migration_profile("destination: {type: kvm}\n").is_err());
    EXPECT_TRUE(parse_migration_profile("source: {host: a}\ndestination: {type: kvm}\n").is_err());
    EXPECT_TRUE(parse_migration_profile(
        "source: {type: kvm}\ndestination: {type: kvm}\n").is_err());
    EXPECT_TRUE(parse_migration_profile(
        "source: {type: \"es xi\"}\ndestination: {type: kvm}\n").is_err());
    EXPECT_TRUE(parse_migration_profile(
        "source: {type: esxi}\ndestination: {type: kvm}\nselected_vms: web01\n").is_err());
    EXPECT_TRUE(parse_migration_profile("source: {type: esxi\n").is_err());
}

TEST(MigrationConfig, WriteFile) {
    fs::path dir = platform::temp_path("vmig_profile_test");
    fs::create_directories(dir);
    std::ofstream(dir / "profile.yaml") << PROFILE;

    auto loaded = load_migration_profile(dir / "profile.yaml");
    ASSERT_TRUE(loaded.is_ok()) << loaded.error;
    auto written = write_payload_config(loaded.value, dir / "config.json");
    ASSERT_TRUE(written.is_ok()) << written.error;

    YAML::Node doc = YAML::LoadFile((dir / "config.json").string());
    EXPECT_EQ(doc["kvm_host"].as<std::string>(), "10.0.0.20");

    EXPECT_TRUE(load_migration_profile(dir / "missing.yaml").is_err());
    fs::remove_all(dir);
}
