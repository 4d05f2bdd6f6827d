#include "ControlChannel.hpp"

#include "SessionCodec.hpp"

namespace scanlink {
ControlChannel::ControlChannel(shared_ptr<SocketHandler> _socketHandler,
                               shared_ptr<EventDispatcher> _dispatcher,
                               const ChannelOptions& _options)
    : socketHandler(_socketHandler),
      dispatcher(_dispatcher),
      options(_options),
      shuttingDown(false),
      connected(false),
      generation(0),
      framesSent(0),
      framesReceived(0),
      droppedSends(0),
      decodeErrors(0),
      reconnects(0),
      reconnectPolicy(_options.reconnectBaseDelay, _options.reconnectMaxDelay,
                      _options.reconnectFactor, _options.maxReconnectAttempts),
      socketFd(-1),
      discardedFramesSeen(0),
      attemptInFlight(false),
      reconnecting(false) {
  loopThread.reset(new std::thread(&ControlChannel::run, this));
}

ControlChannel::~ControlChannel() {
  {
    lock_guard<std::mutex> guard(loopMutex);
    shuttingDown = true;
  }
  loopCv.notify_all();
  if (loopThread) {
    loopThread->join();
    loopThread.reset();
  }
}

ConnectResult ControlChannel::connect(const SessionCredentials& target) {
  auto promise = make_shared<std::promise<ConnectResult>>();
  auto future = promise->get_future();
  Command command;
  command.type = CommandType::CONNECT;
  command.credentials = target;
  command.connectPromise = promise;
  enqueue(std::move(command));
  return future.get();
}

void ControlChannel::disconnect() {
  // Attempt threads watch the generation, so bumping it here stops an
  // in-flight handshake before the loop even sees the command.
  generation++;
  auto promise = make_shared<std::promise<void>>();
  auto future = promise->get_future();
  Command command;
  command.type = CommandType::DISCONNECT;
  command.disconnectPromise = promise;
  enqueue(std::move(command));
  future.get();
}

bool ControlChannel::send(const Message& message) {
  if (!connected) {
    droppedSends++;
    VLOG(1) << "Dropping " << SessionCodec::typeName(message.getType())
            << " while not connected";
    return false;
  }
  Command command;
  command.type = CommandType::SEND;
  command.message = message;
  command.generation = generation;
  enqueue(std::move(command));
  return true;
}

ConnectionState ControlChannel::getState() const {
  lock_guard<std::mutex> guard(stateMutex);
  return state;
}

ConnectionStatus ControlChannel::getStatus() const {
  lock_guard<std::mutex> guard(stateMutex);
  return state.getStatus();
}

optional<SessionCredentials> ControlChannel::getCredentials() const {
  lock_guard<std::mutex> guard(stateMutex);
  return credentials;
}

ChannelStats ControlChannel::getStats() const {
  ChannelStats stats;
  stats.framesSent = framesSent;
  stats.framesReceived = framesReceived;
  stats.droppedSends = droppedSends;
  stats.decodeErrors = decodeErrors;
  stats.reconnects = reconnects;
  return stats;
}

void ControlChannel::enqueue(Command command) {
  {
    lock_guard<std::mutex> guard(loopMutex);
    if (!shuttingDown) {
      commands.push_back(std::move(command));
      loopCv.notify_one();
      return;
    }
  }
  // The loop is gone, answer the caller directly
  switch (command.type) {
    case CommandType::CONNECT:
      command.connectPromise->set_value(
          ConnectResult::failure(FailureKind::CANCELLED, "Channel closed"));
      break;
    case CommandType::DISCONNECT:
      command.disconnectPromise->set_value();
      break;
    case CommandType::SEND:
      droppedSends++;
      break;
  }
}

void ControlChannel::run() {
  el::Helpers::setThreadName("channel");
  while (true) {
    deque<Command> pendingCommands;
    deque<AttemptResult> pendingResults;
    {
      std::unique_lock<std::mutex> lock(loopMutex);
      loopCv.wait_for(lock, std::chrono::milliseconds(10), [this] {
        return shuttingDown || !commands.empty() || !attemptResults.empty();
      });
      if (shuttingDown) {
        break;
      }
      pendingCommands.swap(commands);
      pendingResults.swap(attemptResults);
    }

    // Commands go first so that a disconnect() always wins over an attempt
    // that finished at the same time.
    for (auto& command : pendingCommands) {
      handleCommand(command);
    }
    for (const auto& result : pendingResults) {
      handleAttemptResult(result);
    }

    pollSocket();
    checkKeepalive();

    if (reconnectTime && std::chrono::steady_clock::now() >= *reconnectTime) {
      reconnectTime.reset();
      startAttempt();
    }
  }

  teardown("Channel closed");
  for (auto& it : attemptThreads) {
    it.second->join();
  }
  attemptThreads.clear();

  deque<Command> leftoverCommands;
  deque<AttemptResult> leftoverResults;
  {
    lock_guard<std::mutex> guard(loopMutex);
    leftoverCommands.swap(commands);
    leftoverResults.swap(attemptResults);
  }
  for (auto& command : leftoverCommands) {
    switch (command.type) {
      case CommandType::CONNECT:
        command.connectPromise->set_value(
            ConnectResult::failure(FailureKind::CANCELLED, "Channel closed"));
        break;
      case CommandType::DISCONNECT:
        command.disconnectPromise->set_value();
        break;
      case CommandType::SEND:
        droppedSends++;
        break;
    }
  }
  for (const auto& result : leftoverResults) {
    if (result.socketFd >= 0) {
      socketHandler->close(result.socketFd);
    }
  }
}

void ControlChannel::handleCommand(Command& command) {
  switch (command.type) {
    case CommandType::CONNECT: {
      const auto& target = *command.credentials;
      auto status = getStatus();
      if (credentials && *credentials == target) {
        if (status == ConnectionStatus::CONNECTED) {
          VLOG(1) << "Already connected to " << target;
          command.connectPromise->set_value(ConnectResult::success());
          return;
        }
        // A reconnect attempt has no caller to answer, so a connect()
        // arriving during one starts afresh instead of joining it
        if (status == ConnectionStatus::CONNECTING && !reconnecting) {
          LOG(INFO) << "Joining the connection attempt to " << target;
          connectWaiters.push_back(command.connectPromise);
          return;
        }
      }
      LOG(INFO) << "Connecting to " << target;
      teardown("Superseded by a newer connect");
      {
        lock_guard<std::mutex> guard(stateMutex);
        credentials = target;
      }
      framesSent = 0;
      framesReceived = 0;
      droppedSends = 0;
      decodeErrors = 0;
      reconnects = 0;
      reconnectPolicy.reset();
      connectWaiters.push_back(command.connectPromise);
      startAttempt();
      break;
    }
    case CommandType::DISCONNECT:
      LOG(INFO) << "Disconnect requested";
      teardown("Disconnected");
      command.disconnectPromise->set_value();
      break;
    case CommandType::SEND:
      if (command.generation != generation || socketFd < 0 ||
          getStatus() != ConnectionStatus::CONNECTED) {
        droppedSends++;
        VLOG(1) << "Dropping "
                << SessionCodec::typeName(command.message->getType())
                << " queued for an older connection";
        return;
      }
      writeMessage(*command.message);
      break;
  }
}

void ControlChannel::startAttempt() {
  int64_t attemptGeneration = ++generation;
  attemptInFlight = true;
  keepaliveSentTime.reset();
  setState(ConnectionState::connecting(reconnectPolicy.getAttempt()));
  SessionCredentials target = *credentials;
  attemptThreads[attemptGeneration] = shared_ptr<std::thread>(new std::thread(
      &ControlChannel::runAttempt, this, attemptGeneration, target));
}

void ControlChannel::runAttempt(int64_t attemptGeneration,
                                SessionCredentials target) {
  el::Helpers::setThreadName("channel-attempt");
  AttemptResult result;
  result.generation = attemptGeneration;

  VLOG(1) << "Opening transport to " << target;
  int fd = socketHandler->connect(target.getEndpoint());
  if (fd < 0) {
    result.failureKind = FailureKind::UNREACHABLE;
    result.reason = "Could not connect to " + target.getHost() + ":" +
                    to_string(target.getPort());
    postAttemptResult(result);
    return;
  }

  try {
    if (generation != attemptGeneration) {
      throw std::runtime_error("Attempt cancelled");
    }
    socketHandler->writeFrame(
        fd, SessionCodec::encode(Message::hello(target.getToken())));
    auto reader = make_shared<LineReader>(socketHandler, fd);
    auto deadline =
        std::chrono::steady_clock::now() + options.handshakeTimeout;
    while (result.socketFd < 0 && result.failureKind == FailureKind::NONE) {
      if (generation != attemptGeneration) {
        result.failureKind = FailureKind::CANCELLED;
        result.reason = "Attempt cancelled";
        break;
      }
      if (std::chrono::steady_clock::now() >= deadline) {
        result.failureKind = FailureKind::HANDSHAKE_TIMEOUT;
        result.reason = "No hello_ack within " +
                        to_string(options.handshakeTimeout.count()) + "ms";
        break;
      }
      if (!reader->hasData()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
        continue;
      }
      string frame;
      int rc = reader->read(&frame);
      if (rc < 0) {
        throw std::runtime_error(
            string("Connection closed during handshake: ") + strerror(errno));
      }
      if (rc == 0) {
        continue;
      }
      auto decoded = SessionCodec::decode(frame);
      if (!decoded.isOk()) {
        LOG(WARNING) << "Ignoring undecodable frame during handshake ("
                     << decodeErrorName(decoded.getError())
                     << "): " << decoded.getDetail();
        continue;
      }
      const Message& message = decoded.getMessage();
      switch (message.getType()) {
        case MessageType::HELLO_ACK:
          VLOG(1) << "Console accepted the hello";
          result.socketFd = fd;
          result.reader = reader;
          break;
        case MessageType::HELLO_REJECT:
          result.failureKind = FailureKind::HANDSHAKE_REJECTED;
          result.reason = message.getText().empty() ? "Invalid token"
                                                    : message.getText();
          break;
        default:
          VLOG(1) << "Ignoring " << SessionCodec::typeName(message.getType())
                  << " before hello_ack";
          break;
      }
    }
  } catch (const std::runtime_error& err) {
    LOG(INFO) << "Handshake with " << target.getHost() << " failed: "
              << err.what();
    if (generation != attemptGeneration) {
      result.failureKind = FailureKind::CANCELLED;
    } else {
      result.failureKind = FailureKind::CONNECTION_LOST;
    }
    result.reason = err.what();
  }

  if (result.failureKind != FailureKind::NONE) {
    socketHandler->close(fd);
  }
  postAttemptResult(result);
}

void ControlChannel::postAttemptResult(const AttemptResult& result) {
  {
    lock_guard<std::mutex> guard(loopMutex);
    attemptResults.push_back(result);
  }
  loopCv.notify_one();
}

void ControlChannel::handleAttemptResult(const AttemptResult& result) {
  auto threadIt = attemptThreads.find(result.generation);
  if (threadIt != attemptThreads.end()) {
    threadIt->second->join();
    attemptThreads.erase(threadIt);
  }

  if (!attemptInFlight || result.generation != generation) {
    VLOG(1) << "Discarding result of stale attempt " << result.generation;
    if (result.socketFd >= 0) {
      socketHandler->close(result.socketFd);
    }
    return;
  }
  attemptInFlight = false;

  switch (result.failureKind) {
    case FailureKind::NONE:
      socketFd = result.socketFd;
      reader = result.reader;
      discardedFramesSeen = reader->getDiscardedFrames();
      lastReceiveTime = std::chrono::steady_clock::now();
      keepaliveSentTime.reset();
      if (reconnecting) {
        reconnects++;
        LOG(INFO) << "Reconnected after " << reconnectPolicy.getAttempt()
                  << " attempts";
      }
      reconnecting = false;
      reconnectPolicy.reset();
      setState(ConnectionState::connected());
      resolveWaiters(ConnectResult::success());
      break;
    case FailureKind::HANDSHAKE_REJECTED:
      LOG(WARNING) << "Console rejected the session: " << result.reason;
      fail(result.failureKind, result.reason);
      break;
    case FailureKind::CANCELLED:
      fail(result.failureKind, result.reason);
      break;
    default:
      if (reconnecting) {
        scheduleReconnect(result.failureKind, result.reason);
      } else {
        fail(result.failureKind, result.reason);
      }
      break;
  }
}

void ControlChannel::pollSocket() {
  // Bounded so that a chatty console cannot starve the command queue
  for (int a = 0; a < 64 && socketFd >= 0 && reader; a++) {
    if (!reader->hasData()) {
      return;
    }
    string frame;
    int rc = reader->read(&frame);
    auto readErrno = errno;

    auto discarded = reader->getDiscardedFrames();
    if (discarded > discardedFramesSeen) {
      decodeErrors += discarded - discardedFramesSeen;
      discardedFramesSeen = discarded;
    }

    if (rc < 0) {
      handleTransportLoss(readErrno == EPIPE ? "Console closed the connection"
                                             : strerror(readErrno));
      return;
    }
    if (rc == 0) {
      continue;
    }

    lastReceiveTime = std::chrono::steady_clock::now();
    keepaliveSentTime.reset();

    auto decoded = SessionCodec::decode(frame);
    if (!decoded.isOk()) {
      decodeErrors++;
      LOG(WARNING) << "Dropping frame (" << decodeErrorName(decoded.getError())
                   << "): " << decoded.getDetail();
      continue;
    }
    framesReceived++;
    const Message& message = decoded.getMessage();
    switch (message.getType()) {
      case MessageType::KEEPALIVE:
        VLOG(2) << "Got a keepalive";
        break;
      case MessageType::HELLO_REJECT:
        LOG(WARNING) << "Console revoked the session: " << message.getText();
        generation++;
        fail(FailureKind::HANDSHAKE_REJECTED, message.getText().empty()
                                                  ? "Session revoked"
                                                  : message.getText());
        return;
      case MessageType::HELLO:
      case MessageType::HELLO_ACK:
        VLOG(1) << "Ignoring unexpected "
                << SessionCodec::typeName(message.getType());
        break;
      default:
        dispatcher->post(ChannelEvent::fromMessage(message));
        break;
    }
  }
}

void ControlChannel::checkKeepalive() {
  if (options.keepaliveInterval.count() <= 0 || socketFd < 0 ||
      getStatus() != ConnectionStatus::CONNECTED) {
    return;
  }
  auto now = std::chrono::steady_clock::now();
  if (keepaliveSentTime) {
    if (now - *keepaliveSentTime >= options.keepaliveInterval) {
      LOG(INFO) << "Missed a keepalive, killing connection.";
      handleTransportLoss("Keepalive timed out");
    }
    return;
  }
  if (now - lastReceiveTime >= options.keepaliveInterval) {
    VLOG(1) << "Writing keepalive";
    keepaliveSentTime = now;
    writeMessage(Message::keepalive());
  }
}

void ControlChannel::writeMessage(const Message& message) {
  string frame = SessionCodec::encode(message);
  if (frame.length() > MAX_FRAME_LENGTH) {
    droppedSends++;
    LOG(WARNING) << "Dropping " << SessionCodec::typeName(message.getType())
                 << " of " << frame.length() << " bytes";
    return;
  }
  try {
    socketHandler->writeFrame(socketFd, frame);
    framesSent++;
  } catch (const std::runtime_error& err) {
    handleTransportLoss(string("Write failed: ") + err.what());
  }
}

void ControlChannel::handleTransportLoss(const string& reason) {
  LOG(INFO) << "Lost connection to console: " << reason;
  // Sends queued for the dead connection must not reach the next one
  generation++;
  closeSocket();
  keepaliveSentTime.reset();
  reconnecting = true;
  scheduleReconnect(FailureKind::CONNECTION_LOST, reason);
}

void ControlChannel::scheduleReconnect(FailureKind kind,
                                       const string& reason) {
  if (!options.autoReconnect) {
    fail(FailureKind::CONNECTION_LOST, reason);
    return;
  }
  if (reconnectPolicy.exhausted()) {
    fail(FailureKind::CONNECTION_LOST,
         "Gave up after " + to_string(reconnectPolicy.getAttempt()) +
             " reconnect attempts: " + reason);
    return;
  }
  auto delay = reconnectPolicy.advance();
  reconnecting = true;
  reconnectTime = std::chrono::steady_clock::now() + delay;
  VLOG(1) << "Retrying after " << failureKindName(kind) << " in "
          << delay.count() << "ms";
  setState(ConnectionState::reconnecting(reconnectPolicy.getAttempt(), delay));
}

void ControlChannel::teardown(const string& reason) {
  generation++;
  attemptInFlight = false;
  reconnecting = false;
  reconnectTime.reset();
  keepaliveSentTime.reset();
  closeSocket();
  resolveWaiters(ConnectResult::failure(FailureKind::CANCELLED, reason));
  {
    lock_guard<std::mutex> guard(stateMutex);
    credentials.reset();
  }
  if (getStatus() != ConnectionStatus::DISCONNECTED) {
    setState(ConnectionState::disconnected());
  }
}

void ControlChannel::closeSocket() {
  connected = false;
  reader.reset();
  if (socketFd >= 0) {
    socketHandler->close(socketFd);
    socketFd = -1;
  }
}

void ControlChannel::fail(FailureKind kind, const string& reason) {
  closeSocket();
  attemptInFlight = false;
  reconnecting = false;
  reconnectTime.reset();
  setState(ConnectionState::failed(kind, reason));
  resolveWaiters(ConnectResult::failure(kind, reason));
}

void ControlChannel::resolveWaiters(const ConnectResult& result) {
  for (auto& waiter : connectWaiters) {
    waiter->set_value(result);
  }
  connectWaiters.clear();
}

void ControlChannel::setState(const ConnectionState& newState) {
  {
    lock_guard<std::mutex> guard(stateMutex);
    state = newState;
  }
  connected = newState.getStatus() == ConnectionStatus::CONNECTED;
  LOG(INFO) << "Channel state: " << newState;
  dispatcher->post(ChannelEvent::fromState(newState));
}
}  // namespace scanlink
