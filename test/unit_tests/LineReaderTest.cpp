#include "LineReader.hpp"

#include "SocketPairHandler.hpp"
#include "TestHeaders.hpp"

using namespace scanlink;

namespace {
void writeRaw(int fd, const string& s) {
  REQUIRE(::write(fd, s.data(), s.length()) == ssize_t(s.length()));
}

// Reads until a frame arrives or the socket goes quiet
int readFrame(LineReader* reader, string* frame) {
  for (int a = 0; a < 100; a++) {
    if (!reader->hasData()) {
      std::this_thread::sleep_for(std::chrono::milliseconds(5));
      continue;
    }
    int rc = reader->read(frame);
    if (rc != 0) {
      return rc;
    }
  }
  return 0;
}
}  // namespace

TEST_CASE("Splits the stream on newlines", "[LineReader]") {
  auto handler = make_shared<SocketPairHandler>();
  int remoteFd = handler->queueConnection();
  int fd = handler->connect(SocketEndpoint());
  LineReader reader(handler, fd);

  writeRaw(remoteFd, "first\nsecond\r\n\nthi");
  string frame;
  REQUIRE(readFrame(&reader, &frame) == 1);
  REQUIRE(frame == "first");
  REQUIRE(reader.hasData());
  REQUIRE(reader.read(&frame) == 1);
  REQUIRE(frame == "second");

  // A partial frame stays buffered until its newline shows up
  REQUIRE(readFrame(&reader, &frame) == 0);
  writeRaw(remoteFd, "rd\n");
  REQUIRE(readFrame(&reader, &frame) == 1);
  REQUIRE(frame == "third");

  ::close(remoteFd);
  handler->close(fd);
}

TEST_CASE("Reports EOF as EPIPE", "[LineReader]") {
  auto handler = make_shared<SocketPairHandler>();
  int remoteFd = handler->queueConnection();
  int fd = handler->connect(SocketEndpoint());
  LineReader reader(handler, fd);

  writeRaw(remoteFd, "last\n");
  ::close(remoteFd);
  string frame;
  REQUIRE(readFrame(&reader, &frame) == 1);
  REQUIRE(frame == "last");
  REQUIRE(readFrame(&reader, &frame) == -1);
  REQUIRE(errno == EPIPE);
  handler->close(fd);
}

TEST_CASE("Drops oversized frames", "[LineReader]") {
  auto handler = make_shared<SocketPairHandler>();
  int remoteFd = handler->queueConnection();
  int fd = handler->connect(SocketEndpoint());
  LineReader reader(handler, fd);

  std::thread writer([remoteFd]() {
    string big(MAX_FRAME_LENGTH + 4096, 'x');
    writeTestFrame(remoteFd, big);
    writeTestFrame(remoteFd, "after");
  });

  string frame;
  int rc = 0;
  for (int a = 0; a < 2000 && rc == 0; a++) {
    rc = readFrame(&reader, &frame);
  }
  writer.join();
  REQUIRE(rc == 1);
  REQUIRE(frame == "after");
  REQUIRE(reader.getDiscardedFrames() == 1);

  ::close(remoteFd);
  handler->close(fd);
}
