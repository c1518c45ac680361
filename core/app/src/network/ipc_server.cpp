#include "bracket/network/ipc_server.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <chrono>
#include <exception>
#include <iostream>
#include <utility>

namespace bracket {

namespace {

std::string trim(const std::string& text) {
  const auto first = std::find_if_not(
      text.begin(), text.end(),
      [](unsigned char c) { return std::isspace(c) != 0; });
  const auto last = std::find_if_not(
      text.rbegin(), text.rend(),
      [](unsigned char c) { return std::isspace(c) != 0; });
  if (first == text.end()) {
    return {};
  }
  return std::string(first, last.base());
}

std::string upper(std::string text) {
  std::transform(text.begin(), text.end(), text.begin(),
                 [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
  return text;
}

std::string errorReply(const std::string& message) {
  nlohmann::json reply;
  reply["status"] = "error";
  reply["response"] = message;
  return reply.dump();
}

}  // namespace

IpcServer::IpcServer(zmq::context_t& context, std::string cmd_endpoint,
                     std::string pub_endpoint)
    : context_(context),
      cmd_endpoint_(std::move(cmd_endpoint)),
      pub_endpoint_(std::move(pub_endpoint)) {}

IpcServer::~IpcServer() { stop(); }

// -----------------------------------------------------------------------------
// Command table
// -----------------------------------------------------------------------------
void IpcServer::registerCommand(const std::string& verb,
                                CommandHandler handler) {
  const std::string key = upper(trim(verb));
  if (key.empty() || key == "PING" || key == "HELP") {
    std::cerr << "[IpcServer] refusing to register command '" << verb
              << "'\n";
    return;
  }
  std::lock_guard lock(handlers_mutex_);
  handlers_[key] = std::move(handler);
}

std::vector<std::string> IpcServer::commands() const {
  std::vector<std::string> verbs{"HELP", "PING"};
  std::lock_guard lock(handlers_mutex_);
  for (const auto& [verb, handler] : handlers_) {
    verbs.push_back(verb);
  }
  std::sort(verbs.begin(), verbs.end());
  return verbs;
}

// -----------------------------------------------------------------------------
// dispatch(): request line -> JSON reply
// -----------------------------------------------------------------------------
std::string IpcServer::dispatch(const std::string& request) const {
  const std::string line = trim(request);
  if (line.empty()) {
    return errorReply("Empty command");
  }

  const auto split = line.find_first_of(" \t");
  const std::string verb_text = line.substr(0, split);
  const std::string args =
      split == std::string::npos ? std::string{} : trim(line.substr(split));
  const std::string verb = upper(verb_text);

  if (verb == "PING") {
    nlohmann::json reply;
    reply["status"] = "ok";
    reply["response"] = "PONG";
    return reply.dump();
  }
  if (verb == "HELP") {
    nlohmann::json reply;
    reply["status"] = "ok";
    reply["commands"] = commands();
    return reply.dump();
  }

  CommandHandler handler;
  {
    std::lock_guard lock(handlers_mutex_);
    auto it = handlers_.find(verb);
    if (it != handlers_.end()) {
      handler = it->second;
    }
  }
  if (!handler) {
    return errorReply("Unknown command: " + verb_text);
  }

  nlohmann::json result;
  try {
    result = handler(args);
  } catch (const std::exception& e) {
    std::cerr << "[IpcServer] command " << verb << " failed: " << e.what()
              << "\n";
    return errorReply(e.what());
  }

  if (!result.is_object()) {
    nlohmann::json wrapped;
    wrapped["response"] = std::move(result);
    result = std::move(wrapped);
  }
  if (!result.contains("status")) {
    result["status"] = "ok";
  }
  return result.dump();
}

// -----------------------------------------------------------------------------
// start(): bind both sockets and spawn the worker
// -----------------------------------------------------------------------------
bool IpcServer::start() {
  if (running_.load()) {
    return true;
  }
  if (cmd_endpoint_.empty() || pub_endpoint_.empty()) {
    std::cerr << "[IpcServer] not started: command and telemetry endpoints "
                 "are both required\n";
    return false;
  }

  try {
    cmd_socket_ =
        std::make_unique<zmq::socket_t>(context_, zmq::socket_type::rep);
    pub_socket_ =
        std::make_unique<zmq::socket_t>(context_, zmq::socket_type::pub);
    cmd_socket_->set(zmq::sockopt::linger, 0);
    pub_socket_->set(zmq::sockopt::linger, 0);
    cmd_socket_->bind(cmd_endpoint_);
    pub_socket_->bind(pub_endpoint_);
  } catch (const zmq::error_t& e) {
    std::cerr << "[IpcServer] bind failed: " << e.what() << "\n";
    cmd_socket_.reset();
    pub_socket_.reset();
    return false;
  }

  published_ = 0;
  running_.store(true);
  thread_ = std::thread([this] { run(); });

  std::cout << "[IpcServer] started. CMD=" << cmd_endpoint_
            << " PUB=" << pub_endpoint_ << "\n";
  return true;
}

void IpcServer::stop() {
  const bool was_running = running_.exchange(false);
  if (thread_.joinable()) {
    thread_.join();
  }
  cmd_socket_.reset();
  pub_socket_.reset();
  if (was_running) {
    std::cout << "[IpcServer] stopped after " << published_
              << " telemetry messages.\n";
  }
}

void IpcServer::pushTelemetry(domain::Position position) {
  if (!running_.load()) {
    return;
  }
  if (!telemetry_queue_.push(std::move(position))) {
    std::cerr << "[IpcServer] telemetry queue closed\n";
  }
}

// -----------------------------------------------------------------------------
// Worker
// -----------------------------------------------------------------------------
void IpcServer::run() {
  zmq::pollitem_t items[] = {{cmd_socket_->handle(), 0, ZMQ_POLLIN, 0}};

  while (running_.load()) {
    publishPending();

    try {
      zmq::poll(items, 1, std::chrono::milliseconds(kPollTimeoutMs));
    } catch (const zmq::error_t& e) {
      if (e.num() == EINTR) {
        continue;
      }
      throw;
    }
    if ((items[0].revents & ZMQ_POLLIN) != 0) {
      serveOneRequest();
    }
  }
  publishPending();
}

void IpcServer::publishPending() {
  while (auto position = telemetry_queue_.try_pop()) {
    const std::string payload = formatPosition(*position, ++published_);
    const std::string topic = kTelemetryTopic;
    // PUB never blocks; with no subscribers the message is dropped.
    zmq::message_t topic_frame(topic.data(), topic.size());
    zmq::message_t payload_frame(payload.data(), payload.size());
    if (!pub_socket_->send(topic_frame,
                           zmq::send_flags::sndmore | zmq::send_flags::dontwait) ||
        !pub_socket_->send(payload_frame, zmq::send_flags::dontwait)) {
      std::cerr << "[IpcServer] telemetry #" << published_ << " dropped\n";
    }
  }
}

void IpcServer::serveOneRequest() {
  zmq::message_t request;
  if (!cmd_socket_->recv(request, zmq::recv_flags::dontwait)) {
    return;
  }

  const std::string reply_text = dispatch(request.to_string());
  zmq::message_t reply(reply_text.data(), reply_text.size());
  if (!cmd_socket_->send(reply, zmq::send_flags::none)) {
    std::cerr << "[IpcServer] reply not sent for: " << request.to_string()
              << "\n";
  }
}

// -----------------------------------------------------------------------------
// formatPosition()
// -----------------------------------------------------------------------------
std::string IpcServer::formatPosition(const domain::Position& position,
                                      std::uint64_t sequence) {
  nlohmann::json j;
  j["type"] = "position_update";
  j["seq"] = sequence;
  j["symbol"] = position.symbol;
  j["direction"] = domain::toString(position.direction);
  j["quantity"] = position.quantity;
  j["entry_price"] = position.entry_price;
  j["stop_price"] = position.stop_price;
  j["target_price"] = position.target_price;
  return j.dump();
}

}  // namespace bracket
