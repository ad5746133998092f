#pragma once

#include <filesystem>
#include <string>
#include <vector>
#include <core/types.hpp>

namespace fs = std::filesystem;

// Payload configuration document.
//
// Operators describe a migration as a nested YAML profile (source and
// destination hypervisor plus the VMs to move). The payload scripts read a
// flat JSON object instead, keyed by hypervisor type:
//
//   {"esxi_host": ..., "esxi_user": ..., "esxi_pass": ...,
//    "kvm_host": ..., "kvm_user": ..., "kvm_pass": ..., "kvm_storage_pool": ...,
//    "export_root": ..., "selected_vms": [...]}
//
// The job engine never reads this file back; it only ships it.

inline constexpr const char* DEFAULT_STORAGE_POOL = "/var/lib/libvirt/images";
inline constexpr const char* DEFAULT_EXPORT_ROOT = "./exports";

struct HypervisorAccess {
    std::string type;       // key prefix: esxi, kvm, proxmox, ...
    std::string host;
    std::string user;
    std::string password;
    std::string storage;    // destination only
};

struct MigrationProfile {
    HypervisorAccess source;
    HypervisorAccess destination;
    std::string export_root = DEFAULT_EXPORT_ROOT;
    std::vector<std::string> selected_vms;
};

Result<MigrationProfile> parse_migration_profile(const std::string& yaml_text);
Result<MigrationProfile> load_migration_profile(const fs::path& path);

// Flat JSON document for the payload.
std::string to_payload_json(const MigrationProfile& profile);

Result<void> write_payload_config(const MigrationProfile& profile, const fs::path& path);
