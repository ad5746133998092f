#include <gtest/gtest.h>
#include <managers/migration_service.hpp>
#include <core/errors.hpp>
#include <platform/platform.hpp>
#include "fake_transport.hpp"
#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;

class MigrationServiceTest : public ::testing::Test {
protected:
    fs::path dir;
    std::shared_ptr<FakeRemote> remote = std::make_shared<FakeRemote>();
    Config config;

    void SetUp() override {
        dir = platform::temp_path("vmig_service_test");
        fs::create_directories(dir / "app");
        std::ofstream(dir / "app/kvm_migration.py") << "print('kvm')\n";
        std::ofstream(dir / "app/config.json") << "{}\n";
        std::ofstream(dir / "config.yaml") << R"(
connect_timeout: 9
base_dir: .
targets:
  kvm:
    script: app/kvm_migration.py
    config: app/config.json
    remote_dir: /home/kvmuser
    interpreter: python3 -u
    elevate: true
    port: 2022
)";
        auto loaded = Config::load_file(dir / "config.yaml");
        ASSERT_TRUE(loaded.is_ok()) << loaded.error;
        config = loaded.value;
    }

    void TearDown() override {
        fs::remove_all(dir);
    }
};

TEST_F(MigrationServiceTest, StartsJobForTarget) {
    MigrationService svc(config, fake_factory(remote));
    auto started = svc.start_job("kvm", Endpoint{"10.0.0.20", 22}, Credential{"kvmuser", "pw"});
    ASSERT_TRUE(started.is_ok()) << started.error;
    svc.wait_all();

    JobRecord rec = svc.query().get_job(started.value);
    EXPECT_EQ(rec.status, JobStatus::kFinished);
    EXPECT_EQ(rec.target, "kvm");
    EXPECT_EQ(remote->last_timeout, std::chrono::seconds(9));
    ASSERT_EQ(remote->commands.size(), 1u);
    EXPECT_EQ(remote->commands[0], "sudo -S -p '' python3 -u '/home/kvmuser/kvm_migration.py'");
    EXPECT_EQ(remote->input, "pw\n");
    ASSERT_EQ(remote->uploads.size(), 2u);
    EXPECT_EQ(remote->uploads[1], "/home/kvmuser/config.json|0644");
}

TEST_F(MigrationServiceTest, PortZeroUsesTargetPort) {
    MigrationService svc(config, fake_factory(remote));
    auto started = svc.start_job("kvm", Endpoint{"10.0.0.20", 0}, Credential{"kvmuser", "pw"});
    ASSERT_TRUE(started.is_ok()) << started.error;
    svc.wait_all();
    ASSERT_EQ(remote->connects.size(), 1u);
    EXPECT_EQ(remote->connects[0], "kvmuser@10.0.0.20:2022");
}

TEST_F(MigrationServiceTest, PreconditionFailures) {
    MigrationService svc(config, fake_factory(remote));

    auto unknown = svc.start_job("vmware", Endpoint{"h", 22}, Credential{"u", "p"});
    ASSERT_TRUE(unknown.is_err());
    EXPECT_NE(unknown.error.find("vmware"), std::string::npos);

    EXPECT_TRUE(svc.start_job("kvm", Endpoint{"", 22}, Credential{"u", "p"}).is_err());
    EXPECT_TRUE(svc.start_job("kvm", Endpoint{"h", 22}, Credential{"", "p"}).is_err());
    EXPECT_TRUE(svc.start_job("kvm", Endpoint{"h", 70000}, Credential{"u", "p"}).is_err());

    svc.wait_all();
    EXPECT_TRUE(svc.list_jobs().empty());
    EXPECT_TRUE(remote->connects.empty());
}

TEST_F(MigrationServiceTest, MissingPrerequisites) {
    MigrationService svc(config, fake_factory(remote),
                         [] { return Result<void>::Err("libssh2_init failed (-1)"); });
    auto started = svc.start_job("kvm", Endpoint{"h", 22}, Credential{"u", "p"});
    ASSERT_TRUE(started.is_err());
    EXPECT_NE(started.error.find("libssh2_init failed"), std::string::npos);
    EXPECT_TRUE(svc.list_jobs().empty());
}

TEST_F(MigrationServiceTest, ClearJob) {
    MigrationService svc(config, fake_factory(remote));
    auto started = svc.start_job("kvm", Endpoint{"h", 22}, Credential{"u", "p"});
    ASSERT_TRUE(started.is_ok());
    svc.wait_all();

    EXPECT_TRUE(svc.clear_job(started.value));
    EXPECT_FALSE(svc.clear_job(started.value));
    EXPECT_THROW(svc.query().get_job(started.value), NotFoundError);
    EXPECT_THROW(svc.query().download_log(started.value), NotFoundError);
}

TEST_F(MigrationServiceTest, ListJobs) {
    FakeHost failing;
    failing.exit_code = 2;
    remote->set_host("bad", failing);

    MigrationService svc(config, fake_factory(remote));
    ASSERT_TRUE(svc.start_job("kvm", Endpoint{"good", 22}, Credential{"u", "p"}).is_ok());
    ASSERT_TRUE(svc.start_job("kvm", Endpoint{"bad", 22}, Credential{"u", "p"}).is_ok());
    svc.wait_all();

    auto jobs = svc.list_jobs();
    ASSERT_EQ(jobs.size(), 2u);
    for (const auto& j : jobs) {
        EXPECT_EQ(j.target, "kvm");
        EXPECT_GT(j.log_lines, 0u);
        if (j.host == "good") {
            EXPECT_EQ(j.status, "finished");
        } else {
            EXPECT_EQ(j.status, "failed (exit 2)");
        }
    }
}

TEST_F(MigrationServiceTest, TargetNames) {
    MigrationService svc(Config::defaults(), fake_factory(remote));
    auto names = svc.target_names();
    ASSERT_EQ(names.size(), 2u);
    EXPECT_EQ(names[0], "kvm");
    EXPECT_EQ(names[1], "proxmox");
}
