#include <gtest/gtest.h>
#include <ssh/sftp_channel.hpp>
#include <ssh/event_bridge.hpp>
#include <thread>
#include "fake_transport.hpp"

using namespace std::chrono_literals;

template <typename F>
static bool is_ready(F& f) {
    return f.wait_for(0ms) == std::future_status::ready;
}

static DirEntry entry(const std::string& name, bool dir, uint64_t size) {
    DirEntry e;
    e.filename = name;
    e.is_directory = dir;
    e.file_size = size;
    e.modification_date = "2024-05-01T12:00:00Z";
    e.flags = dir ? 040755 : 0100644;
    return e;
}

class SftpChannelTest : public ::testing::Test {
protected:
    void SetUp() override {
        bridge->attach(*transport);
        sftp = std::make_shared<SftpChannel>(key, transport, bridge, ConnectionOptions{}, nullptr);
    }

    void opened() {
        transport->emit(key, events::SFTP_CONNECTED, Ack{});
    }

    std::shared_ptr<FakeTransport> transport = std::make_shared<FakeTransport>();
    std::shared_ptr<EventBridge> bridge = std::make_shared<EventBridge>();
    ConnectionKey key = ConnectionKey::generate();
    std::shared_ptr<SftpChannel> sftp;
};

TEST_F(SftpChannelTest, ConcurrentOpensShareOneCommand) {
    auto a = sftp->open();
    auto b = sftp->open();
    EXPECT_EQ(transport->count<ConnectSftpCommand>(), 1u);
    EXPECT_EQ(sftp->state(), ChannelState::Opening);

    opened();
    EXPECT_TRUE(a.get().is_ok());
    EXPECT_TRUE(b.get().is_ok());
    EXPECT_EQ(sftp->state(), ChannelState::Open);

    EXPECT_TRUE(sftp->open().get().is_ok());
    EXPECT_EQ(transport->count<ConnectSftpCommand>(), 1u);
}

TEST_F(SftpChannelTest, ListAutoOpensTheChannel) {
    auto listing = sftp->list("/home/bob");
    EXPECT_EQ(transport->count<ConnectSftpCommand>(), 1u);
    EXPECT_EQ(transport->count<SftpListCommand>(), 0u);

    opened();
    ASSERT_EQ(transport->count<SftpListCommand>(), 1u);
    EXPECT_EQ(transport->last<SftpListCommand>().path, "/home/bob");

    transport->emit(key, events::SFTP_LIST,
                    ListingPayload{{entry("src", true, 4096), entry("notes.txt", false, 12)}});
    auto result = listing.get();
    ASSERT_TRUE(result.is_ok());
    ASSERT_EQ(result.value.size(), 2u);
    EXPECT_EQ(result.value[0].filename, "src");
    EXPECT_TRUE(result.value[0].is_directory);
    EXPECT_EQ(result.value[1].file_size, 12u);
    EXPECT_EQ(result.value[1].modification_date, "2024-05-01T12:00:00Z");
}

TEST_F(SftpChannelTest, RequestsAreSerializedInSubmissionOrder) {
    sftp->open();
    opened();

    auto mk = sftp->mkdir("/tmp/a");
    auto mv = sftp->rename("/tmp/a", "/tmp/b");
    auto rm = sftp->remove_directory("/tmp/b");

    EXPECT_EQ(transport->command_names().back(), "SftpMkdir");
    EXPECT_EQ(transport->count<SftpRenameCommand>(), 0u);

    transport->emit(key, events::SFTP_MKDIR, Ack{});
    EXPECT_TRUE(mk.get().is_ok());
    EXPECT_EQ(transport->command_names().back(), "SftpRename");
    auto rename = transport->last<SftpRenameCommand>();
    EXPECT_EQ(rename.old_path, "/tmp/a");
    EXPECT_EQ(rename.new_path, "/tmp/b");
    EXPECT_EQ(transport->count<SftpRemoveDirectoryCommand>(), 0u);

    transport->emit(key, events::SFTP_RENAME, Ack{});
    EXPECT_TRUE(mv.get().is_ok());
    EXPECT_EQ(transport->last<SftpRemoveDirectoryCommand>().path, "/tmp/b");

    transport->emit(key, events::SFTP_REMOVE_DIRECTORY, Ack{});
    EXPECT_TRUE(rm.get().is_ok());

    EXPECT_EQ(transport->command_names(),
              (std::vector<std::string>{"ConnectSftp", "SftpMkdir", "SftpRename",
                                        "SftpRemoveDirectory"}));
}

TEST_F(SftpChannelTest, RemoteFailureCarriesItsCode) {
    auto removed = sftp->remove("/nope");
    opened();
    EXPECT_EQ(transport->last<SftpRemoveCommand>().path, "/nope");

    transport->emit(key, events::SFTP_REMOVE, FailurePayload{
        Error{ErrorKind::RemoteError, "No such file", RemoteCode::NotFound}});
    auto result = removed.get();
    ASSERT_TRUE(result.is_err());
    EXPECT_EQ(result.error.kind, ErrorKind::RemoteError);
    EXPECT_EQ(result.error.code, RemoteCode::NotFound);
}

TEST_F(SftpChannelTest, FailureDoesNotBlockTheNextRequest) {
    sftp->open();
    opened();

    auto first = sftp->remove("/a");
    auto second = sftp->remove("/b");
    transport->emit(key, events::SFTP_REMOVE, FailurePayload{
        Error{ErrorKind::RemoteError, "denied", RemoteCode::PermissionDenied}});
    EXPECT_TRUE(first.get().is_err());

    EXPECT_EQ(transport->last<SftpRemoveCommand>().path, "/b");
    transport->emit(key, events::SFTP_REMOVE, Ack{});
    EXPECT_TRUE(second.get().is_ok());
}

TEST_F(SftpChannelTest, UnexpectedPayloadIsAProtocolError) {
    auto listing = sftp->list("/");
    opened();
    transport->emit(key, events::SFTP_LIST, Ack{});

    auto result = listing.get();
    ASSERT_TRUE(result.is_err());
    EXPECT_EQ(result.error.code, RemoteCode::ProtocolError);
}

TEST_F(SftpChannelTest, ChmodSendsTheMode) {
    auto changed = sftp->chmod("/srv/run.sh", 0755);
    opened();
    auto cmd = transport->last<SftpChmodCommand>();
    EXPECT_EQ(cmd.path, "/srv/run.sh");
    EXPECT_EQ(cmd.mode, 0755);

    transport->emit(key, events::SFTP_CHMOD, Ack{});
    EXPECT_TRUE(changed.get().is_ok());
}

TEST_F(SftpChannelTest, ChmodWithoutCapabilityIsUnsupported) {
    transport->chmod_supported = false;
    auto result = sftp->chmod("/srv/run.sh", 0755).get();
    ASSERT_TRUE(result.is_err());
    EXPECT_EQ(result.error.kind, ErrorKind::UnsupportedOperation);
    EXPECT_TRUE(transport->sent().empty());
}

TEST_F(SftpChannelTest, OpenFailureRejectsQueuedRequests) {
    auto a = sftp->list("/");
    auto b = sftp->mkdir("/x");
    transport->emit(key, events::SFTP_CONNECTED, FailurePayload{
        Error{ErrorKind::RemoteError, "subsystem request failed", RemoteCode::Failure}});

    for (auto result : {a.get().error, b.get().error}) {
        EXPECT_EQ(result.kind, ErrorKind::ChannelNotOpen);
    }
    EXPECT_EQ(sftp->state(), ChannelState::Closed);
    EXPECT_EQ(transport->count<SftpListCommand>(), 0u);
}

TEST_F(SftpChannelTest, ReadyCheckGuardsTheAutoOpen) {
    auto guarded = std::make_shared<SftpChannel>(key, transport, bridge, ConnectionOptions{},
        []() { return Result<void>::Err(ErrorKind::ChannelNotOpen, "not connected"); });

    auto result = guarded->list("/").get();
    ASSERT_TRUE(result.is_err());
    EXPECT_EQ(result.error.kind, ErrorKind::ChannelNotOpen);
    EXPECT_TRUE(transport->sent().empty());
}

TEST_F(SftpChannelTest, CloseIsIdempotent) {
    sftp->open();
    opened();

    EXPECT_TRUE(sftp->close().get().is_ok());
    EXPECT_TRUE(sftp->close().get().is_ok());
    EXPECT_EQ(transport->count<DisconnectSftpCommand>(), 1u);
    EXPECT_EQ(sftp->state(), ChannelState::Closed);
}

TEST_F(SftpChannelTest, CloseFailsRequestsStillQueued) {
    sftp->open();
    opened();

    auto running = sftp->list("/a");
    auto queued = sftp->list("/b");
    sftp->close();

    ASSERT_TRUE(is_ready(queued));
    auto result = queued.get();
    ASSERT_TRUE(result.is_err());
    EXPECT_EQ(result.error.kind, ErrorKind::ChannelNotOpen);
}

TEST_F(SftpChannelTest, CloseWhileOpeningIsDeferred) {
    auto open = sftp->open();
    auto closed = sftp->close();
    EXPECT_FALSE(is_ready(closed));

    opened();
    EXPECT_TRUE(is_ready(closed));
    EXPECT_EQ(transport->count<DisconnectSftpCommand>(), 1u);
    EXPECT_EQ(sftp->state(), ChannelState::Closed);

    // Listeners see the channel as closed, not open.
    auto result = open.get();
    ASSERT_TRUE(result.is_err());
    EXPECT_EQ(result.error.kind, ErrorKind::ChannelNotOpen);
}

TEST_F(SftpChannelTest, CloseWaitsForTheRequestInFlight) {
    sftp->open();
    opened();

    auto running = sftp->list("/a");
    auto closed = sftp->close();
    EXPECT_FALSE(is_ready(closed));
    EXPECT_EQ(transport->count<DisconnectSftpCommand>(), 0u);

    auto made = sftp->mkdir("/b");   // reopens behind the close
    EXPECT_EQ(transport->count<ConnectSftpCommand>(), 1u);

    transport->emit(key, events::SFTP_LIST, ListingPayload{{entry("x", false, 1)}});
    ASSERT_TRUE(running.get().is_ok());
    ASSERT_TRUE(is_ready(closed));
    EXPECT_EQ(transport->command_names(),
              (std::vector<std::string>{"ConnectSftp", "SftpList", "DisconnectSftp", "ConnectSftp"}));

    opened();
    ASSERT_EQ(transport->count<SftpMkdirCommand>(), 1u);
    transport->emit(key, events::SFTP_MKDIR, Ack{});
    ASSERT_TRUE(is_ready(made));
    EXPECT_TRUE(made.get().is_ok());
}

TEST_F(SftpChannelTest, OpensFromManyThreadsShareOneCommand) {
    std::mutex mutex;
    std::vector<std::future<Result<void>>> futures;
    std::vector<std::thread> threads;
    for (int i = 0; i < 8; ++i) {
        threads.emplace_back([&]() {
            auto f = sftp->open();
            std::lock_guard<std::mutex> lock(mutex);
            futures.push_back(std::move(f));
        });
    }
    for (auto& t : threads) t.join();

    EXPECT_EQ(transport->count<ConnectSftpCommand>(), 1u);
    opened();
    for (auto& f : futures) {
        ASSERT_TRUE(is_ready(f));
        EXPECT_TRUE(f.get().is_ok());
    }
}

TEST_F(SftpChannelTest, RequestRacingCloseNeverReachesAClosedChannel) {
    transport->on_send = [](FakeTransport& t, const ConnectionKey& k, const Command& cmd) {
        if (std::holds_alternative<ConnectSftpCommand>(cmd)) t.emit(k, events::SFTP_CONNECTED, Ack{});
        if (std::holds_alternative<SftpRemoveCommand>(cmd)) t.emit(k, events::SFTP_REMOVE, Ack{});
    };

    for (int round = 0; round < 100; ++round) {
        ConnectionKey k = ConnectionKey::generate();
        auto channel = std::make_shared<SftpChannel>(k, transport, bridge, ConnectionOptions{}, nullptr);
        ASSERT_TRUE(channel->open().get().is_ok());

        std::future<Result<void>> removed;
        std::shared_future<Result<void>> closed;
        std::thread requester([&]() { removed = channel->remove("/tmp/x"); });
        std::thread closer([&]() { closed = channel->close(); });
        requester.join();
        closer.join();

        ASSERT_EQ(removed.wait_for(5s), std::future_status::ready);
        ASSERT_EQ(closed.wait_for(5s), std::future_status::ready);
        auto result = removed.get();
        if (result.is_err()) EXPECT_EQ(result.error.kind, ErrorKind::ChannelNotOpen);

        bool open = false;
        for (const auto& [sent_key, cmd] : transport->sent()) {
            if (sent_key != k) continue;
            if (std::holds_alternative<ConnectSftpCommand>(cmd)) open = true;
            if (std::holds_alternative<DisconnectSftpCommand>(cmd)) open = false;
            if (std::holds_alternative<SftpRemoveCommand>(cmd)) {
                EXPECT_TRUE(open) << "request sent to a closed channel in round " << round;
            }
        }
    }
}
