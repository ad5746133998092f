#include <gtest/gtest.h>
#include <ssh/escalation.hpp>
#include "fake_transport.hpp"

TEST(Escalation, WrapsCommandInSudo) {
    EXPECT_EQ(elevated_command("python3 -u '/home/kvmuser/kvm_migration.py'"),
              "sudo -S -p '' python3 -u '/home/kvmuser/kvm_migration.py'");
}

TEST(Escalation, PasswordGoesToInput) {
    auto remote = std::make_shared<FakeRemote>();
    FakeProcess proc(remote, FakeHost{});
    supply_escalation_password(proc, Credential{"kvmuser", "pa ss'word"});
    EXPECT_EQ(remote->input, "pa ss'word\n");
    EXPECT_FALSE(remote->input_closed);
}
