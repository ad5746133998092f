#include "escalation.hpp"
#include "transport.hpp"

std::string elevated_command(const std::string& command) {
    // -p '' keeps sudo's prompt out of the job's stderr
    return "sudo -S -p '' " + command;
}

void supply_escalation_password(RemoteProcess& process, const Credential& credential) {
    process.send_input(credential.password + "\n");
}
