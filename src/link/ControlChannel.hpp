#ifndef __SCANLINK_CONTROL_CHANNEL__
#define __SCANLINK_CONTROL_CHANNEL__

#include "ConnectionState.hpp"
#include "EventDispatcher.hpp"
#include "Headers.hpp"
#include "LineReader.hpp"
#include "Message.hpp"
#include "ReconnectPolicy.hpp"
#include "SessionCredentials.hpp"
#include "SocketHandler.hpp"

namespace scanlink {
struct ChannelOptions {
  bool autoReconnect = true;
  std::chrono::milliseconds reconnectBaseDelay =
      std::chrono::milliseconds(DEFAULT_RECONNECT_BASE_DELAY_MS);
  std::chrono::milliseconds reconnectMaxDelay =
      std::chrono::milliseconds(DEFAULT_RECONNECT_MAX_DELAY_MS);
  double reconnectFactor = DEFAULT_RECONNECT_FACTOR;
  // 0 retries forever
  int maxReconnectAttempts = 0;
  std::chrono::milliseconds handshakeTimeout =
      std::chrono::milliseconds(DEFAULT_HANDSHAKE_TIMEOUT_MS);
  // 0 disables keepalives
  std::chrono::milliseconds keepaliveInterval =
      std::chrono::seconds(DEFAULT_KEEPALIVE_SECONDS);
};

struct ChannelStats {
  int64_t framesSent = 0;
  int64_t framesReceived = 0;
  int64_t droppedSends = 0;
  int64_t decodeErrors = 0;
  int64_t reconnects = 0;
};

/**
 * @brief Owns the connection to one console: handshake, inbound dispatch,
 * keepalives and reconnects.
 *
 * All state lives on a loop thread. connect(), disconnect() and send() queue
 * commands for it. Transport establishment and the hello/hello_ack exchange
 * run on a short-lived attempt thread per attempt, tagged with a generation
 * so that an attempt that was cancelled can never install its socket.
 * Decoded messages and state transitions are posted to the EventDispatcher.
 */
class ControlChannel {
 public:
  ControlChannel(shared_ptr<SocketHandler> _socketHandler,
                 shared_ptr<EventDispatcher> _dispatcher,
                 const ChannelOptions& _options = ChannelOptions());
  ~ControlChannel();

  /**
   * @brief Connects and waits for the hello to be acknowledged or refused.
   *
   * Returns at once if already connected with the same credentials, and joins
   * the pending attempt if one with the same credentials is underway. Any
   * other prior connection is torn down first.
   */
  ConnectResult connect(const SessionCredentials& credentials);

  /** @brief Returns once the channel is Disconnected. Idempotent. */
  void disconnect();

  /**
   * @brief Queues a message for the current connection.
   * @return false if the message was dropped because the channel is not
   * connected.
   */
  bool send(const Message& message);

  Subscription subscribe(EventHandler handler) {
    return dispatcher->subscribe(handler);
  }

  bool isConnected() const { return connected; }
  ConnectionState getState() const;
  ChannelStats getStats() const;
  optional<SessionCredentials> getCredentials() const;

 protected:
  enum class CommandType {
    CONNECT,
    DISCONNECT,
    SEND,
  };

  struct Command {
    CommandType type;
    optional<SessionCredentials> credentials;
    shared_ptr<std::promise<ConnectResult>> connectPromise;
    shared_ptr<std::promise<void>> disconnectPromise;
    optional<Message> message;
    int64_t generation = 0;
  };

  struct AttemptResult {
    int64_t generation = 0;
    int socketFd = -1;
    shared_ptr<LineReader> reader;
    FailureKind failureKind = FailureKind::NONE;
    string reason;
  };

  shared_ptr<SocketHandler> socketHandler;
  shared_ptr<EventDispatcher> dispatcher;
  ChannelOptions options;

  // Shared with the caller threads
  std::mutex loopMutex;
  std::condition_variable loopCv;
  deque<Command> commands;
  deque<AttemptResult> attemptResults;
  bool shuttingDown;
  shared_ptr<std::thread> loopThread;

  mutable std::mutex stateMutex;
  ConnectionState state;
  optional<SessionCredentials> credentials;
  std::atomic<bool> connected;
  // Bumped whenever the current attempt or connection is abandoned
  std::atomic<int64_t> generation;

  std::atomic<int64_t> framesSent;
  std::atomic<int64_t> framesReceived;
  std::atomic<int64_t> droppedSends;
  std::atomic<int64_t> decodeErrors;
  std::atomic<int64_t> reconnects;

  // Owned by the loop thread
  ReconnectPolicy reconnectPolicy;
  int socketFd;
  shared_ptr<LineReader> reader;
  int64_t discardedFramesSeen;
  bool attemptInFlight;
  bool reconnecting;
  optional<std::chrono::steady_clock::time_point> reconnectTime;
  std::chrono::steady_clock::time_point lastReceiveTime;
  optional<std::chrono::steady_clock::time_point> keepaliveSentTime;
  vector<shared_ptr<std::promise<ConnectResult>>> connectWaiters;
  map<int64_t, shared_ptr<std::thread>> attemptThreads;

  void enqueue(Command command);
  void run();
  void handleCommand(Command& command);
  void handleAttemptResult(const AttemptResult& result);
  void startAttempt();
  void runAttempt(int64_t attemptGeneration, SessionCredentials target);
  void postAttemptResult(const AttemptResult& result);
  void pollSocket();
  void checkKeepalive();
  void writeMessage(const Message& message);
  void handleTransportLoss(const string& reason);
  void scheduleReconnect(FailureKind kind, const string& reason);
  void teardown(const string& reason);
  void closeSocket();
  void fail(FailureKind kind, const string& reason);
  void resolveWaiters(const ConnectResult& result);
  void setState(const ConnectionState& newState);
  ConnectionStatus getStatus() const;
};
}  // namespace scanlink

#endif  // __SCANLINK_CONTROL_CHANNEL__
