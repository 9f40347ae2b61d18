#include <gtest/gtest.h>
#include <core/types.hpp>
#include <transport/command.hpp>
#include <transport/events.hpp>
#include <ssh/connection_key.hpp>
#include <ssh/replies.hpp>
#include <platform/platform.hpp>
#include <set>

// ── PtyType ─────────────────────────────────────────────────

TEST(PtyType, ParsesEveryKnownName) {
    EXPECT_EQ(parse_pty_type("vanilla").value, PtyType::Vanilla);
    EXPECT_EQ(parse_pty_type("vt100").value, PtyType::Vt100);
    EXPECT_EQ(parse_pty_type("vt102").value, PtyType::Vt102);
    EXPECT_EQ(parse_pty_type("vt220").value, PtyType::Vt220);
    EXPECT_EQ(parse_pty_type("ansi").value, PtyType::Ansi);
    EXPECT_EQ(parse_pty_type("xterm").value, PtyType::Xterm);
}

TEST(PtyType, ParsingIgnoresCase) {
    auto result = parse_pty_type("XTerm");
    ASSERT_TRUE(result.is_ok());
    EXPECT_EQ(result.value, PtyType::Xterm);
}

TEST(PtyType, UnknownNameIsRejected) {
    auto result = parse_pty_type("linux");
    ASSERT_TRUE(result.is_err());
    EXPECT_EQ(result.error.kind, ErrorKind::OperationRejected);
    EXPECT_NE(result.error.message.find("linux"), std::string::npos);
}

TEST(PtyType, NamesRoundTrip) {
    for (auto type : {PtyType::Vanilla, PtyType::Vt100, PtyType::Vt102,
                      PtyType::Vt220, PtyType::Ansi, PtyType::Xterm}) {
        EXPECT_EQ(parse_pty_type(pty_type_name(type)).value, type);
    }
}

// ── Errors ──────────────────────────────────────────────────

TEST(Errors, DescribeIncludesKindAndCode) {
    EXPECT_EQ(describe(Error{ErrorKind::RemoteError, "no such file", RemoteCode::NotFound}),
              "RemoteError(NotFound): no such file");
    EXPECT_EQ(describe(Error{ErrorKind::Timeout, "gave up"}), "Timeout: gave up");
}

TEST(Errors, FailureBecomesItsError) {
    Result<Payload> reply = Result<Payload>::Ok(FailurePayload{
        Error{ErrorKind::RemoteError, "denied", RemoteCode::PermissionDenied}});
    auto result = reply_to_void(reply);
    ASSERT_TRUE(result.is_err());
    EXPECT_EQ(result.error.code, RemoteCode::PermissionDenied);
}

TEST(Errors, CancelledPayloadOnPlainRequestIsCancelled) {
    auto result = reply_to_text(Result<Payload>::Ok(CancelledPayload{}));
    ASSERT_TRUE(result.is_err());
    EXPECT_EQ(result.error.kind, ErrorKind::Cancelled);
}

TEST(Errors, AckReadsAsEmptyText) {
    auto result = reply_to_text(Result<Payload>::Ok(Ack{}));
    ASSERT_TRUE(result.is_ok());
    EXPECT_EQ(result.value, "");
}

TEST(Errors, ListingFromWrongPayloadIsProtocolError) {
    auto result = reply_to_listing(Result<Payload>::Ok(TextPayload{"x"}));
    ASSERT_TRUE(result.is_err());
    EXPECT_EQ(result.error.code, RemoteCode::ProtocolError);
}

// ── Event table ─────────────────────────────────────────────

TEST(Events, KnownNamesResolve) {
    ASSERT_NE(find_event(events::SHELL), nullptr);
    EXPECT_EQ(find_event(events::SHELL)->mode, EventMode::Streaming);
    ASSERT_NE(find_event(events::EXECUTE), nullptr);
    EXPECT_EQ(find_event(events::EXECUTE)->mode, EventMode::OneShot);
    ASSERT_NE(find_event(events::SHELL_CLOSED), nullptr);
    EXPECT_TRUE(payload_allowed(*find_event(events::SHELL_CLOSED), Ack{}));
    EXPECT_EQ(find_event("shell"), nullptr);
}

TEST(Events, PayloadKindsAreChecked) {
    const EventSpec* list = find_event(events::SFTP_LIST);
    ASSERT_NE(list, nullptr);
    EXPECT_TRUE(payload_allowed(*list, ListingPayload{}));
    EXPECT_TRUE(payload_allowed(*list, FailurePayload{}));
    EXPECT_FALSE(payload_allowed(*list, TextPayload{}));

    const EventSpec* upload = find_event(events::UPLOAD_COMPLETE);
    ASSERT_NE(upload, nullptr);
    EXPECT_TRUE(payload_allowed(*upload, CancelledPayload{}));
    EXPECT_FALSE(payload_allowed(*upload, ProgressPayload{}));
}

TEST(Events, CommandNames) {
    EXPECT_STREQ(command_name(ConnectCommand{}), "Connect");
    EXPECT_STREQ(command_name(SftpRemoveDirectoryCommand{}), "SftpRemoveDirectory");
    EXPECT_STREQ(command_name(DisconnectSftpCommand{}), "DisconnectSftp");
}

// ── Keys and platform helpers ───────────────────────────────

TEST(ConnectionKey, GeneratedKeysAreUnique) {
    std::set<std::string> seen;
    for (int i = 0; i < 1000; ++i) {
        auto key = ConnectionKey::generate();
        EXPECT_FALSE(key.empty());
        EXPECT_TRUE(seen.insert(key.str()).second);
    }
}

TEST(Platform, FormatsUtcIso) {
    EXPECT_EQ(platform::format_utc_iso(0), "1970-01-01T00:00:00Z");
    EXPECT_EQ(platform::format_utc_iso(1714564800), "2024-05-01T12:00:00Z");
}
