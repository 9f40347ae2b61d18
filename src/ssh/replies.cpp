#include "replies.hpp"
#include <fmt/format.h>

template <typename T>
static Result<T> reply_error(const Result<Payload>& reply) {
    if (reply.is_err()) return Result<T>::Err(reply.error);

    if (auto* failure = std::get_if<FailurePayload>(&reply.value))
        return Result<T>::Err(failure->error);
    if (std::holds_alternative<CancelledPayload>(reply.value))
        return Result<T>::Err(ErrorKind::Cancelled, "Request was cancelled by the transport");

    return Result<T>::Err(ErrorKind::RemoteError,
        fmt::format("Unexpected {} reply", payload_kind_name(reply.value)),
        RemoteCode::ProtocolError);
}

Result<void> reply_to_void(const Result<Payload>& reply) {
    if (reply.is_ok() && (std::holds_alternative<Ack>(reply.value) ||
                          std::holds_alternative<TextPayload>(reply.value))) {
        return Result<void>::Ok();
    }
    return reply_error<void>(reply);
}

Result<std::string> reply_to_text(const Result<Payload>& reply) {
    if (reply.is_ok()) {
        if (auto* text = std::get_if<TextPayload>(&reply.value))
            return Result<std::string>::Ok(text->text);
        if (std::holds_alternative<Ack>(reply.value))
            return Result<std::string>::Ok("");
    }
    return reply_error<std::string>(reply);
}

Result<std::vector<DirEntry>> reply_to_listing(const Result<Payload>& reply) {
    if (reply.is_ok()) {
        if (auto* listing = std::get_if<ListingPayload>(&reply.value))
            return Result<std::vector<DirEntry>>::Ok(listing->entries);
    }
    return reply_error<std::vector<DirEntry>>(reply);
}
