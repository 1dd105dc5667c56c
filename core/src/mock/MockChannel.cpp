#include "sroscli/MockChannel.hpp"
#include <chrono>
#include <thread>

namespace sroscli {

bool MockChannel::connect(const SessionOptions& opt, std::string& err) {
  if (opt.host.empty() || opt.username.empty()) {
    err = "Host and user are required";
    return false;
  }
  connected_ = true;
  lastOpt_ = opt;
  setTuning(opt.tuning);
  resetBuffer();
  line_.clear();
  pending_ = banner_;
  return true;
}

void MockChannel::disconnect() {
  connected_ = false;
  pending_.clear();
}

void MockChannel::respond(const std::string& command, const std::string& reply) {
  replies_[command].push_back(reply);
}

bool MockChannel::readSome(std::string& chunk, int waitMs, CliError& err) {
  if (!connected_) {
    err = {CliErrorKind::Channel, "Not connected"};
    return false;
  }
  if (pending_.empty()) {
    // Nothing scripted: behave like a silent device until the caller's deadline
    if (waitMs > 0)
      std::this_thread::sleep_for(std::chrono::milliseconds(waitMs));
    return true;
  }
  chunk += pending_;
  pending_.clear();
  return true;
}

bool MockChannel::writeSome(const std::string& data, CliError& err) {
  if (!connected_) {
    err = {CliErrorKind::Channel, "Not connected"};
    return false;
  }
  line_ += data;
  std::size_t nl;
  while ((nl = line_.find('\n')) != std::string::npos) {
    std::string cmd = line_.substr(0, nl);
    line_.erase(0, nl + 1);
    if (!cmd.empty() && cmd.back() == '\r')
      cmd.pop_back();
    writes_.push_back(cmd);

    auto it = replies_.find(cmd);
    if (it == replies_.end() || it->second.empty())
      continue; // unknown command: no answer, the next read times out
    pending_ += it->second.front();
    if (it->second.size() > 1)
      it->second.pop_front();
  }
  return true;
}

} // namespace sroscli
