#include "test_framework.hpp"

#include <chrono>
#include <memory>
#include <string>
#include <thread>

#include "netconn/conn.hpp"
#include "netconn/tcp.hpp"

namespace {

// A connected loopback pair: client dialed, server accepted
struct TcpPair {
  std::unique_ptr<netconn::TcpListenSocket> listener;
  std::unique_ptr<netconn::TcpStream> client;
  std::unique_ptr<netconn::TcpStream> server;
};

TcpPair MakeTcpPair() {
  TcpPair pair;
  auto listener = netconn::TcpListenSocket::Listen("127.0.0.1", 0);
  ASSERT_OK(listener.error);
  pair.listener = std::move(listener.value);

  auto client = netconn::TcpStream::Dial(
      netconn::JoinHostPort("127.0.0.1", pair.listener->Port()));
  ASSERT_OK(client.error);
  pair.client = std::move(client.value);

  auto server = pair.listener->Accept();
  ASSERT_OK(server.error);
  pair.server = std::move(server.value);
  return pair;
}

}  // namespace

TEST(SplitHostPort) {
  std::string host;
  std::string port;

  ASSERT_TRUE(netconn::SplitHostPort("example.com:443", &host, &port));
  ASSERT_EQ(host, std::string("example.com"));
  ASSERT_EQ(port, std::string("443"));

  ASSERT_TRUE(netconn::SplitHostPort("[::1]:8080", &host, &port));
  ASSERT_EQ(host, std::string("::1"));
  ASSERT_EQ(port, std::string("8080"));

  ASSERT_TRUE(netconn::SplitHostPort(":80", &host, &port));
  ASSERT_EQ(host, std::string(""));

  ASSERT_FALSE(netconn::SplitHostPort("", &host, &port));
  ASSERT_FALSE(netconn::SplitHostPort("no-port", &host, &port));
  ASSERT_FALSE(netconn::SplitHostPort("host:", &host, &port));
  ASSERT_FALSE(netconn::SplitHostPort("::1:80", &host, &port));
  ASSERT_FALSE(netconn::SplitHostPort("[::1]80", &host, &port));
  ASSERT_FALSE(netconn::SplitHostPort("[::1", &host, &port));
}

TEST(JoinHostPort) {
  ASSERT_EQ(netconn::JoinHostPort("127.0.0.1", 80),
            std::string("127.0.0.1:80"));
  ASSERT_EQ(netconn::JoinHostPort("::1", 443), std::string("[::1]:443"));
}

TEST(TcpDialInvalidAddress) {
  auto result = netconn::TcpStream::Dial("missing-port");
  ASSERT_ERR(result.error, netconn::Error::InvalidAddress);
  ASSERT_TRUE(result.value == nullptr);
}

TEST(TcpDialRefused) {
  // Grab a free port, then stop listening on it
  uint16_t port = 0;
  {
    auto listener = netconn::TcpListenSocket::Listen("127.0.0.1", 0);
    ASSERT_OK(listener.error);
    port = listener.value->Port();
  }

  auto result =
      netconn::TcpStream::Dial(netconn::JoinHostPort("127.0.0.1", port));
  ASSERT_ERR(result.error, netconn::Error::ConnectError);
}

TEST(TcpListenEphemeralPort) {
  auto listener = netconn::TcpListenSocket::Listen("127.0.0.1", 0);
  ASSERT_OK(listener.error);
  ASSERT_NE(listener.value->Port(), 0);
  ASSERT_EQ(listener.value->LocalAddress(),
            netconn::JoinHostPort("127.0.0.1", listener.value->Port()));
}

TEST(TcpListenPortInUse) {
  auto first = netconn::TcpListenSocket::Listen("127.0.0.1", 0);
  ASSERT_OK(first.error);

  auto second =
      netconn::TcpListenSocket::Listen("127.0.0.1", first.value->Port());
  ASSERT_ERR(second.error, netconn::Error::ListenError);
}

TEST(TcpStreamReadWrite) {
  auto pair = MakeTcpPair();

  ASSERT_EQ(pair.client->LocalAddress(), pair.server->RemoteAddress());
  ASSERT_EQ(pair.client->RemoteAddress(), pair.server->LocalAddress());

  const std::string msg = "hello over tcp";
  auto written = pair.client->Write(
      reinterpret_cast<const uint8_t*>(msg.data()), msg.size());
  ASSERT_OK(written.error);
  ASSERT_EQ(written.value, msg.size());

  std::string got;
  uint8_t buf[64];
  while (got.size() < msg.size()) {
    auto result = pair.server->Read(buf, sizeof(buf));
    ASSERT_OK(result.error);
    got.append(reinterpret_cast<char*>(buf), result.value);
  }
  ASSERT_EQ(got, msg);
}

TEST(TcpStreamReadDeadline) {
  auto pair = MakeTcpPair();

  ASSERT_OK(pair.server->SetReadDeadline(netconn::Clock::now() +
                                         std::chrono::milliseconds(20)));
  uint8_t buf[8];
  auto result = pair.server->Read(buf, sizeof(buf));
  ASSERT_ERR(result.error, netconn::Error::Timeout);

  // Clearing the deadline makes reads block again until data arrives
  ASSERT_OK(pair.server->SetReadDeadline(netconn::kNoDeadline));
  const uint8_t byte = 'x';
  ASSERT_OK(pair.client->Write(&byte, 1).error);
  result = pair.server->Read(buf, sizeof(buf));
  ASSERT_OK(result.error);
  ASSERT_EQ(result.value, 1u);
}

TEST(TcpStreamPeerCloseReadsEOF) {
  auto pair = MakeTcpPair();
  ASSERT_OK(pair.client->Close());

  uint8_t buf[8];
  auto result = pair.server->Read(buf, sizeof(buf));
  ASSERT_ERR(result.error, netconn::Error::EOF_);
}

TEST(TcpStreamCloseUnblocksRead) {
  auto pair = MakeTcpPair();

  netconn::Error got = netconn::Error::OK;
  std::thread reader([&]() {
    uint8_t buf[8];
    got = pair.server->Read(buf, sizeof(buf)).error;
  });

  std::this_thread::sleep_for(std::chrono::milliseconds(20));
  ASSERT_OK(pair.server->Close());
  reader.join();
  ASSERT_ERR(got, netconn::Error::ConnectionClosed);
}

TEST(TcpStreamCloseTwice) {
  auto pair = MakeTcpPair();
  ASSERT_OK(pair.client->Close());
  ASSERT_ERR(pair.client->Close(), netconn::Error::ConnectionClosed);
  ASSERT_ERR(pair.client->SetReadDeadline(netconn::kNoDeadline),
             netconn::Error::DeadlineError);

  const uint8_t byte = 'x';
  ASSERT_ERR(pair.client->Write(&byte, 1).error,
             netconn::Error::ConnectionClosed);
}

TEST(TcpListenCloseUnblocksAccept) {
  auto listener = netconn::TcpListenSocket::Listen("127.0.0.1", 0);
  ASSERT_OK(listener.error);
  auto* socket = listener.value.get();

  netconn::Error got = netconn::Error::OK;
  std::thread acceptor([&]() { got = socket->Accept().error; });

  std::this_thread::sleep_for(std::chrono::milliseconds(20));
  ASSERT_OK(socket->Close());
  acceptor.join();
  ASSERT_ERR(got, netconn::Error::ConnectionClosed);
  ASSERT_TRUE(socket->IsClosed());
  ASSERT_OK(socket->Close());
}

TEST(TcpConnHalfCloseDetected) {
  auto pair = MakeTcpPair();
  auto conn = netconn::Conn::Wrap(std::move(pair.server));

  ASSERT_OK(pair.client->Close());
  // Give the FIN time to arrive
  std::this_thread::sleep_for(std::chrono::milliseconds(20));

  ASSERT_TRUE(conn->CheckHalfClosed());
  ASSERT_TRUE(conn->IsClosed());
}

TEST(TcpConnIdlePeerNotHalfClosed) {
  auto pair = MakeTcpPair();
  auto conn = netconn::Conn::Wrap(std::move(pair.server));

  ASSERT_FALSE(conn->CheckHalfClosed());
  ASSERT_FALSE(conn->IsClosed());

  // The probe's deadline is gone; a normal exchange still works
  ASSERT_OK(conn->WriteString("ping\n"));
  uint8_t buf[8];
  auto result = pair.client->Read(buf, sizeof(buf));
  ASSERT_OK(result.error);

  const std::string reply = "pong\n";
  ASSERT_OK(pair.client
                ->Write(reinterpret_cast<const uint8_t*>(reply.data()),
                        reply.size())
                .error);
  auto line = conn->ReadLine();
  ASSERT_OK(line.error);
  ASSERT_EQ(line.value, reply);
}

TEST(TcpConnReplaceStreamLeavesOldSocketOpen) {
  auto first = MakeTcpPair();
  auto second = MakeTcpPair();
  auto conn = netconn::Conn::Wrap(std::move(first.server));

  auto previous = conn->ReplaceStream(std::move(second.server));
  ASSERT_TRUE(previous != nullptr);

  // The old peer sees neither data nor FIN while the caller holds the stream
  ASSERT_OK(first.client->SetReadDeadline(netconn::Clock::now() +
                                          std::chrono::milliseconds(100)));
  uint8_t buf[1];
  ASSERT_ERR(first.client->Read(buf, 1).error, netconn::Error::Timeout);

  // Closing it is the caller's call
  ASSERT_OK(previous->Close());
  ASSERT_OK(first.client->SetReadDeadline(netconn::Clock::now() +
                                          std::chrono::seconds(2)));
  ASSERT_ERR(first.client->Read(buf, 1).error, netconn::Error::EOF_);

  // The connection now runs on the second socket
  ASSERT_EQ(conn->RemoteAddress(), second.client->LocalAddress());
}
