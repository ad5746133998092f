#pragma once

// Scripted in-memory Transport for job runner tests.

#include <chrono>
#include <deque>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <vector>
#include <core/errors.hpp>
#include <ssh/transport.hpp>

// What a fake destination host does when a job talks to it.
struct FakeHost {
    // kStream: the channel breaks after `fail_after_lines` output lines.
    // kSignal: the process is killed once its output is drained.
    enum class Fail { kNone, kConnect, kAuth, kUpload, kExecute, kStream, kSignal };

    Fail fail = Fail::kNone;
    std::vector<std::pair<OutputStream, std::string>> output;   // in emission order
    size_t fail_after_lines = 0;
    int exit_code = 0;
    bool fail_remove = false;

    // When set, no output is released until the future is ready
    std::shared_future<void> gate;
};

// Everything the fakes observed, shared with the test.
struct FakeRemote {
    std::mutex mutex;
    std::map<std::string, FakeHost> hosts;     // keyed by Endpoint::host
    std::vector<std::string> connects;         // "user@host:port"
    std::vector<std::string> uploads;          // "remote|mode"
    std::vector<std::string> removed;
    std::vector<std::string> commands;
    std::string input;
    bool input_closed = false;
    int closes = 0;
    std::chrono::seconds last_timeout{0};

    void set_host(const std::string& host, FakeHost behavior) {
        std::lock_guard<std::mutex> lock(mutex);
        hosts[host] = std::move(behavior);
    }
};

class FakeProcess : public RemoteProcess {
public:
    FakeProcess(std::shared_ptr<FakeRemote> remote, const FakeHost& host)
        : remote_(std::move(remote)), fail_(host.fail), fail_after_(host.fail_after_lines),
          exit_code_(host.exit_code), gate_(host.gate) {
        for (const auto& [stream, line] : host.output) {
            (stream == OutputStream::kStdout ? out_ : err_).push_back(line);
        }
    }

    LineRead next_line(OutputStream stream, std::string& line) override {
        if (gate_.valid() &&
            gate_.wait_for(std::chrono::milliseconds(0)) != std::future_status::ready) {
            return LineRead::kPending;
        }
        if (fail_ == FakeHost::Fail::kStream && emitted_ >= fail_after_) {
            throw ExecutionError("Remote output channel failed: connection reset");
        }
        auto& q = stream == OutputStream::kStdout ? out_ : err_;
        if (q.empty()) return LineRead::kEnd;
        line = q.front();
        q.pop_front();
        emitted_++;
        return LineRead::kLine;
    }

    void send_input(const std::string& data) override {
        std::lock_guard<std::mutex> lock(remote_->mutex);
        remote_->input += data;
    }

    void close_input() override {
        std::lock_guard<std::mutex> lock(remote_->mutex);
        remote_->input_closed = true;
    }

    int exit_status() override {
        if (fail_ == FakeHost::Fail::kSignal) {
            throw ExecutionError("Remote script terminated by signal SIGKILL");
        }
        return exit_code_;
    }

private:
    std::shared_ptr<FakeRemote> remote_;
    std::deque<std::string> out_;
    std::deque<std::string> err_;
    FakeHost::Fail fail_;
    size_t fail_after_;
    size_t emitted_ = 0;
    int exit_code_;
    std::shared_future<void> gate_;
};

class FakeTransport : public Transport {
public:
    explicit FakeTransport(std::shared_ptr<FakeRemote> remote) : remote_(std::move(remote)) {}

    void connect(const Endpoint& endpoint, const Credential& credential,
                 std::chrono::seconds timeout) override {
        std::lock_guard<std::mutex> lock(remote_->mutex);
        remote_->connects.push_back(credential.user + "@" + endpoint.host + ":" +
                                    std::to_string(endpoint.port));
        remote_->last_timeout = timeout;
        host_ = remote_->hosts[endpoint.host];
        if (host_.fail == FakeHost::Fail::kConnect) {
            throw ConnectionError("Connection refused");
        }
        if (host_.fail == FakeHost::Fail::kAuth) {
            throw AuthenticationError("Authentication failed for " + credential.user);
        }
    }

    void upload(const fs::path& local, const std::string& remote, bool executable) override {
        if (!fs::exists(local)) {
            throw TransferError("Cannot read local file: " + local.string());
        }
        if (host_.fail == FakeHost::Fail::kUpload) {
            throw TransferError("Cannot write remote file " + remote + ": permission denied");
        }
        std::lock_guard<std::mutex> lock(remote_->mutex);
        remote_->uploads.push_back(remote + (executable ? "|0755" : "|0644"));
    }

    std::unique_ptr<RemoteProcess> execute(const std::string& command) override {
        if (host_.fail == FakeHost::Fail::kExecute) {
            throw ExecutionError("Failed to open exec channel");
        }
        {
            std::lock_guard<std::mutex> lock(remote_->mutex);
            remote_->commands.push_back(command);
        }
        return std::make_unique<FakeProcess>(remote_, host_);
    }

    void remove(const std::string& remote) override {
        if (host_.fail_remove) {
            throw TransferError("Cannot remove remote file " + remote + ": permission denied");
        }
        std::lock_guard<std::mutex> lock(remote_->mutex);
        remote_->removed.push_back(remote);
    }

    void close() override {
        std::lock_guard<std::mutex> lock(remote_->mutex);
        remote_->closes++;
    }

private:
    std::shared_ptr<FakeRemote> remote_;
    FakeHost host_;
};

inline TransportFactory fake_factory(std::shared_ptr<FakeRemote> remote) {
    return [remote] { return std::make_unique<FakeTransport>(remote); };
}
