#pragma once

#include <string>
#include <vector>
#include <core/types.hpp>
#include <transport/events.hpp>

// Conversions from a settled waiter to the typed result an operation returns.
// A FailurePayload becomes its carried Error, a CancelledPayload becomes
// ErrorKind::Cancelled, and any other unexpected alternative is a
// ProtocolError.

Result<void> reply_to_void(const Result<Payload>& reply);
Result<std::string> reply_to_text(const Result<Payload>& reply);
Result<std::vector<DirEntry>> reply_to_listing(const Result<Payload>& reply);
