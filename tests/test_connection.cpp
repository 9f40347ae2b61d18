#include <gtest/gtest.h>
#include <ssh/connection.hpp>
#include <ssh/connection_factory.hpp>
#include "fake_transport.hpp"

using namespace std::chrono_literals;

template <typename T>
static bool is_ready(std::future<T>& f) {
    return f.wait_for(0ms) == std::future_status::ready;
}

class ConnectionTest : public ::testing::Test {
protected:
    std::shared_ptr<FakeTransport> transport = std::make_shared<FakeTransport>();
    std::unique_ptr<ConnectionFactory> factory = std::make_unique<ConnectionFactory>(transport);

    std::shared_ptr<Connection> connected() {
        auto conn = factory->create_connection();
        auto pending = conn->connect("example.com", 22, "bob", PasswordCredential{"pw"});
        transport->emit(conn->key(), events::CONNECTED, Ack{});
        EXPECT_TRUE(pending.get().is_ok());
        return conn;
    }
};

// ── Connecting ────────────────────────────────────────────────

TEST_F(ConnectionTest, ConnectSendsCredentialsAndResolvesOnAck) {
    auto conn = factory->create_connection();
    EXPECT_EQ(conn->state(), ConnectionState::Idle);

    auto pending = conn->connect("example.com", 2222, "bob", PasswordCredential{"pw"});
    EXPECT_EQ(conn->state(), ConnectionState::Connecting);
    EXPECT_FALSE(is_ready(pending));

    ASSERT_EQ(transport->count<ConnectCommand>(), 1u);
    auto cmd = transport->last<ConnectCommand>();
    EXPECT_EQ(cmd.host, "example.com");
    EXPECT_EQ(cmd.port, 2222);
    EXPECT_EQ(cmd.username, "bob");
    ASSERT_TRUE(std::holds_alternative<PasswordCredential>(cmd.credential));
    EXPECT_EQ(std::get<PasswordCredential>(cmd.credential).password, "pw");
    EXPECT_EQ(transport->sent().front().first, conn->key());

    transport->emit(conn->key(), events::CONNECTED, Ack{});
    ASSERT_TRUE(is_ready(pending));
    EXPECT_TRUE(pending.get().is_ok());
    EXPECT_EQ(conn->state(), ConnectionState::Connected);
}

TEST_F(ConnectionTest, FactoryAttachesBridgeOnce) {
    factory->create_connection();
    factory->create_connection();
    EXPECT_EQ(transport->attach_count, 1);
}

TEST_F(ConnectionTest, ReplyFromInsideSendCommandIsNotLost) {
    transport->on_send = [](FakeTransport& t, const ConnectionKey& key, const Command& cmd) {
        if (std::holds_alternative<ConnectCommand>(cmd)) t.emit(key, events::CONNECTED, Ack{});
    };

    auto pending = factory->connect_with_password("example.com", 22, "bob", "pw");
    ASSERT_TRUE(is_ready(pending));
    auto result = pending.get();
    ASSERT_TRUE(result.is_ok());
    EXPECT_EQ(result.value->state(), ConnectionState::Connected);
}

TEST_F(ConnectionTest, ConnectWithKeyPassesKeyPairThrough) {
    auto pending = factory->connect_with_key("example.com", 22, "bob", "PRIVATE", std::string("secret"));
    auto cmd = transport->last<ConnectCommand>();
    ASSERT_TRUE(std::holds_alternative<KeyPair>(cmd.credential));
    const auto& pair = std::get<KeyPair>(cmd.credential);
    EXPECT_EQ(pair.private_key, "PRIVATE");
    EXPECT_EQ(pair.passphrase, std::optional<std::string>("secret"));
    EXPECT_FALSE(pair.public_key.has_value());

    transport->emit(transport->sent().front().first, events::CONNECTED, Ack{});
    EXPECT_TRUE(pending.get().is_ok());
}

TEST_F(ConnectionTest, EveryConnectionGetsItsOwnKey) {
    auto a = factory->create_connection();
    auto b = factory->create_connection();
    EXPECT_NE(a->key(), b->key());
}

TEST_F(ConnectionTest, AuthFailureRejectsWithConnectionFailure) {
    auto pending = factory->connect_with_password("example.com", 22, "bob", "wrong");
    auto key = transport->sent().front().first;
    transport->emit(key, events::CONNECTED,
                    FailurePayload{Error{ErrorKind::ConnectionFailure, "Authentication failed"}});

    auto result = pending.get();
    ASSERT_TRUE(result.is_err());
    EXPECT_EQ(result.error.kind, ErrorKind::ConnectionFailure);
    EXPECT_NE(result.error.message.find("Authentication failed"), std::string::npos);
}

TEST_F(ConnectionTest, RemoteErrorDuringConnectIsReportedAsConnectionFailure) {
    auto conn = factory->create_connection();
    auto pending = conn->connect("example.com", 22, "bob", PasswordCredential{"pw"});
    transport->emit(conn->key(), events::CONNECTED,
                    FailurePayload{Error{ErrorKind::RemoteError, "handshake", RemoteCode::ProtocolError}});

    auto result = pending.get();
    ASSERT_TRUE(result.is_err());
    EXPECT_EQ(result.error.kind, ErrorKind::ConnectionFailure);
    EXPECT_EQ(conn->state(), ConnectionState::Failed);
}

TEST_F(ConnectionTest, ConnectTimesOutAndAbandonsTheSession) {
    ConnectionOptions options;
    options.connect_timeout = 20ms;
    ConnectionFactory quick(transport, options);

    auto pending = quick.connect_with_password("example.com", 22, "bob", "pw");
    ASSERT_EQ(pending.wait_for(5s), std::future_status::ready);

    auto result = pending.get();
    ASSERT_TRUE(result.is_err());
    EXPECT_EQ(result.error.kind, ErrorKind::ConnectionFailure);
    EXPECT_EQ(transport->count<DisconnectCommand>(), 1u);
}

TEST_F(ConnectionTest, FailedConnectReleasesTheTransportSession) {
    auto conn = factory->create_connection();
    auto pending = conn->connect("example.com", 22, "bob", PasswordCredential{"wrong"});
    transport->emit(conn->key(), events::CONNECTED,
                    FailurePayload{Error{ErrorKind::ConnectionFailure, "Authentication failed"}});

    ASSERT_TRUE(pending.get().is_err());
    EXPECT_EQ(conn->state(), ConnectionState::Failed);
    EXPECT_EQ(transport->count<DisconnectCommand>(), 1u);
    EXPECT_EQ(transport->sent().back().first, conn->key());

    conn->disconnect();
    EXPECT_EQ(transport->count<DisconnectCommand>(), 1u);
}

TEST_F(ConnectionTest, SecondConnectIsRejected) {
    auto conn = connected();
    auto again = conn->connect("example.com", 22, "bob", PasswordCredential{"pw"});
    auto result = again.get();
    ASSERT_TRUE(result.is_err());
    EXPECT_EQ(result.error.kind, ErrorKind::OperationRejected);
    EXPECT_EQ(transport->count<ConnectCommand>(), 1u);
}

TEST_F(ConnectionTest, OperationsBeforeConnectFailWithChannelNotOpen) {
    auto conn = factory->create_connection();

    auto exec = conn->execute("uptime").get();
    ASSERT_TRUE(exec.is_err());
    EXPECT_EQ(exec.error.kind, ErrorKind::ChannelNotOpen);

    auto shell = conn->start_shell(PtyType::Vanilla).get();
    ASSERT_TRUE(shell.is_err());
    EXPECT_EQ(shell.error.kind, ErrorKind::ChannelNotOpen);

    auto list = conn->sftp_list("/").get();
    ASSERT_TRUE(list.is_err());
    EXPECT_EQ(list.error.kind, ErrorKind::ChannelNotOpen);

    EXPECT_TRUE(transport->sent().empty());
}

// ── Execute ───────────────────────────────────────────────────

TEST_F(ConnectionTest, ExecuteResolvesWithCommandOutput) {
    auto conn = connected();
    auto pending = conn->execute("echo hi");
    EXPECT_EQ(transport->last<ExecuteCommand>().command, "echo hi");

    transport->emit(conn->key(), events::EXECUTE, TextPayload{"hi\n"});
    auto result = pending.get();
    ASSERT_TRUE(result.is_ok());
    EXPECT_EQ(result.value, "hi\n");
}

TEST_F(ConnectionTest, ConcurrentExecutesAreSerialized) {
    auto conn = connected();
    auto first = conn->execute("one");
    auto second = conn->execute("two");
    EXPECT_EQ(transport->count<ExecuteCommand>(), 1u);

    transport->emit(conn->key(), events::EXECUTE, TextPayload{"1"});
    EXPECT_EQ(first.get().value, "1");
    EXPECT_EQ(transport->count<ExecuteCommand>(), 2u);
    EXPECT_EQ(transport->last<ExecuteCommand>().command, "two");

    transport->emit(conn->key(), events::EXECUTE, TextPayload{"2"});
    EXPECT_EQ(second.get().value, "2");
}

TEST_F(ConnectionTest, CancelledExecuteIsAnError) {
    auto conn = connected();
    auto pending = conn->execute("sleep 100");
    transport->emit(conn->key(), events::EXECUTE, CancelledPayload{});

    auto result = pending.get();
    ASSERT_TRUE(result.is_err());
    EXPECT_EQ(result.error.kind, ErrorKind::Cancelled);
}

TEST_F(ConnectionTest, RequestTimeoutAppliesToExecute) {
    ConnectionOptions options;
    options.request_timeout = 20ms;
    ConnectionFactory quick(transport, options);
    transport->on_send = [](FakeTransport& t, const ConnectionKey& key, const Command& cmd) {
        if (std::holds_alternative<ConnectCommand>(cmd)) t.emit(key, events::CONNECTED, Ack{});
    };
    auto conn = quick.connect_with_password("example.com", 22, "bob", "pw").get().value;
    ASSERT_TRUE(conn);

    auto pending = conn->execute("sleep 100");
    ASSERT_EQ(pending.wait_for(5s), std::future_status::ready);
    auto result = pending.get();
    ASSERT_TRUE(result.is_err());
    EXPECT_EQ(result.error.kind, ErrorKind::Timeout);
}

// ── Disconnect ────────────────────────────────────────────────

TEST_F(ConnectionTest, DisconnectTwiceSendsOneCommand) {
    auto conn = connected();
    conn->disconnect();
    conn->disconnect();
    EXPECT_EQ(conn->state(), ConnectionState::Disconnected);
    EXPECT_EQ(transport->count<DisconnectCommand>(), 1u);
}

TEST_F(ConnectionTest, DisconnectRejectsEveryPendingRequest) {
    auto conn = connected();
    auto running = conn->execute("one");
    auto queued = conn->execute("two");
    auto listing = conn->sftp_list("/tmp");   // waiting for the SFTP channel

    conn->disconnect();

    for (auto* f : {&running, &queued}) {
        ASSERT_TRUE(is_ready(*f));
        auto result = f->get();
        ASSERT_TRUE(result.is_err());
        EXPECT_EQ(result.error.kind, ErrorKind::ConnectionClosed);
    }
    ASSERT_TRUE(is_ready(listing));
    EXPECT_TRUE(listing.get().is_err());
    EXPECT_EQ(factory->bridge()->pending_waiters(conn->key()), 0u);

    // A stray reply after teardown reaches nobody.
    transport->emit(conn->key(), events::EXECUTE, TextPayload{"late"});
    EXPECT_EQ(transport->count<ExecuteCommand>(), 1u);
}

TEST_F(ConnectionTest, DisconnectWhileConnectingRejectsConnect) {
    auto conn = factory->create_connection();
    auto pending = conn->connect("example.com", 22, "bob", PasswordCredential{"pw"});
    conn->disconnect();

    ASSERT_TRUE(is_ready(pending));
    auto result = pending.get();
    ASSERT_TRUE(result.is_err());
    EXPECT_EQ(result.error.kind, ErrorKind::ConnectionClosed);
    EXPECT_EQ(conn->state(), ConnectionState::Disconnected);
    EXPECT_EQ(transport->count<DisconnectCommand>(), 1u);
}

TEST_F(ConnectionTest, DisconnectBeforeConnectSendsNothing) {
    auto conn = factory->create_connection();
    conn->disconnect();
    EXPECT_TRUE(transport->sent().empty());
    EXPECT_EQ(conn->state(), ConnectionState::Disconnected);
}

TEST_F(ConnectionTest, OperationsAfterDisconnectFailWithConnectionClosed) {
    auto conn = connected();
    conn->disconnect();

    auto exec = conn->execute("uptime").get();
    ASSERT_TRUE(exec.is_err());
    EXPECT_EQ(exec.error.kind, ErrorKind::ConnectionClosed);

    auto write = conn->write_to_shell("ls\n").get();
    ASSERT_TRUE(write.is_err());
}

TEST_F(ConnectionTest, DisconnectClosesOpenChannelsFirst) {
    auto conn = connected();
    auto shell = conn->start_shell(PtyType::Vanilla);
    transport->emit(conn->key(), events::SHELL_STARTED, TextPayload{"$ "});
    auto sftp = conn->connect_sftp();
    transport->emit(conn->key(), events::SFTP_CONNECTED, Ack{});
    ASSERT_TRUE(shell.get().is_ok());
    ASSERT_TRUE(sftp.get().is_ok());

    conn->disconnect();

    auto names = transport->command_names();
    ASSERT_GE(names.size(), 3u);
    EXPECT_EQ(names[names.size() - 3], "CloseShell");
    EXPECT_EQ(names[names.size() - 2], "DisconnectSftp");
    EXPECT_EQ(names.back(), "Disconnect");
    EXPECT_EQ(conn->shell_state(), ChannelState::Closed);
    EXPECT_EQ(conn->sftp_state(), ChannelState::Closed);
}

TEST_F(ConnectionTest, DisconnectCancelsRunningTransfers) {
    auto conn = connected();
    auto upload = conn->sftp_upload("/home/bob/a.tar", "/srv/a.tar");
    transport->emit(conn->key(), events::SFTP_CONNECTED, Ack{});
    ASSERT_EQ(transport->count<SftpUploadCommand>(), 1u);

    conn->disconnect();

    auto names = transport->command_names();
    ASSERT_GE(names.size(), 3u);
    EXPECT_EQ(names[names.size() - 3], "SftpCancelUpload");
    EXPECT_EQ(names[names.size() - 2], "DisconnectSftp");
    EXPECT_EQ(names.back(), "Disconnect");

    ASSERT_TRUE(is_ready(upload));
    auto result = upload.get();
    ASSERT_TRUE(result.is_ok());
    EXPECT_EQ(result.value.outcome, TransferOutcome::Cancelled);
}

TEST_F(ConnectionTest, FinishedConnectionsLeaveNoBridgeState) {
    for (int i = 0; i < 10; ++i) {
        auto conn = connected();
        conn->start_shell(PtyType::Vanilla);
    }
    auto failed = factory->create_connection();
    auto pending = failed->connect("example.com", 22, "bob", PasswordCredential{"x"});
    transport->emit(failed->key(), events::CONNECTED, FailurePayload{Error{ErrorKind::ConnectionFailure, "no"}});
    ASSERT_TRUE(pending.get().is_err());
    failed.reset();

    EXPECT_EQ(factory->bridge()->tracked_keys(), 0u);
}

TEST_F(ConnectionTest, DroppingTheLastReferenceDisconnects) {
    {
        auto conn = connected();
    }
    EXPECT_EQ(transport->count<DisconnectCommand>(), 1u);
}

// ── Shell scenario ────────────────────────────────────────────

TEST_F(ConnectionTest, ShellSessionEndToEnd) {
    auto conn = connected();

    auto started = conn->start_shell(PtyType::Vanilla);
    EXPECT_EQ(transport->last<StartShellCommand>().pty, PtyType::Vanilla);
    transport->emit(conn->key(), events::SHELL_STARTED, TextPayload{"bob@host:~$ "});
    auto prompt = started.get();
    ASSERT_TRUE(prompt.is_ok());
    EXPECT_EQ(prompt.value, "bob@host:~$ ");
    EXPECT_EQ(conn->shell_state(), ChannelState::Open);

    std::string output;
    auto sub = conn->on(events::SHELL, [&](const Payload& p) {
        output += std::get<TextPayload>(p).text;
    });
    ASSERT_TRUE(sub.is_ok());

    auto written = conn->write_to_shell("ls\n");
    EXPECT_EQ(transport->last<WriteShellCommand>().input, "ls\n");
    transport->emit(conn->key(), events::SHELL_WRITTEN, Ack{});
    auto ack = written.get();
    ASSERT_TRUE(ack.is_ok());
    EXPECT_EQ(ack.value, "");

    transport->emit(conn->key(), events::SHELL, TextPayload{"file1\nfile2\n"});
    EXPECT_EQ(output, "file1\nfile2\n");

    EXPECT_TRUE(conn->close_shell().get().is_ok());
    EXPECT_TRUE(conn->close_shell().get().is_ok());
    EXPECT_EQ(transport->count<CloseShellCommand>(), 1u);

    // Output after close is dropped.
    transport->emit(conn->key(), events::SHELL, TextPayload{"stale"});
    EXPECT_EQ(output, "file1\nfile2\n");
}

TEST_F(ConnectionTest, ShellSubscriptionCanBeRemoved) {
    auto conn = connected();
    auto started = conn->start_shell(PtyType::Xterm);
    transport->emit(conn->key(), events::SHELL_STARTED, TextPayload{""});
    ASSERT_TRUE(started.get().is_ok());

    int chunks = 0;
    auto sub = conn->on(events::SHELL, [&](const Payload&) { ++chunks; });
    ASSERT_TRUE(sub.is_ok());
    transport->emit(conn->key(), events::SHELL, TextPayload{"a"});
    EXPECT_TRUE(conn->off(events::SHELL, sub.value));
    transport->emit(conn->key(), events::SHELL, TextPayload{"b"});
    EXPECT_EQ(chunks, 1);
}

TEST_F(ConnectionTest, ProgressEventsReachSubscribers) {
    auto conn = connected();
    std::vector<int> seen;
    auto sub = conn->on(events::DOWNLOAD_PROGRESS, [&](const Payload& p) {
        seen.push_back(std::get<ProgressPayload>(p).percent);
    });
    ASSERT_TRUE(sub.is_ok());

    transport->emit(conn->key(), events::DOWNLOAD_PROGRESS, ProgressPayload{40});
    transport->emit(conn->key(), events::DOWNLOAD_PROGRESS, ProgressPayload{100});
    EXPECT_EQ(seen, (std::vector<int>{40, 100}));

    EXPECT_TRUE(conn->off(events::DOWNLOAD_PROGRESS, sub.value));
}

TEST_F(ConnectionTest, SubscribingToUnknownEventFails) {
    auto conn = connected();
    auto sub = conn->on("Nope", [](const Payload&) {});
    ASSERT_TRUE(sub.is_err());
    EXPECT_EQ(sub.error.kind, ErrorKind::OperationRejected);
}
