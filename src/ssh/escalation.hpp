#pragma once

#include <string>
#include <core/types.hpp>

class RemoteProcess;

// Privilege escalation for the remote payload.
//
// Elevated commands run through `sudo -S`, which reads the password from the
// process's standard input instead of a terminal. The password is the same
// credential used for the SSH login. It travels inside the encrypted SSH
// channel but is plaintext within the session, and it sits in the remote
// sudo's stdin. Swapping this for key-based escalation (NOPASSWD rules or a
// dedicated key) only needs these two functions to change.

// Wrap `command` so it runs as root: sudo -S -p '' <command>
std::string elevated_command(const std::string& command);

// Answer sudo's password read by writing the credential to the process input.
void supply_escalation_password(RemoteProcess& process, const Credential& credential);
