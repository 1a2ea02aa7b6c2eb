#pragma once

#include "msgpack_codec.hpp"

#include <optional>
#include <string>

namespace rpcgate {

struct Request {
    std::string id;
    std::string action;
    codec::Payload payload; // nil when absent
    double timestamp = 0.0; // sender-local seconds, only used for staleness checks
    std::string sender_id;
};

struct Response {
    std::string id;
    bool success = false;
    codec::Payload data;    // meaningful only when success
    std::string error;      // meaningful only when !success
};

/// Server-initiated message, not correlated to any request.
struct Event {
    std::string name;
    codec::Payload payload;
};

enum class MessageType { request, response, event };

enum class ShapeError {
    ok,
    malformed,
    missing_id,
    invalid_id,
    missing_action,
    empty_action,
    invalid_timestamp,
    invalid_payload,
    invalid_sender,
};

const char* to_string(ShapeError error);

constexpr int kMaxPayloadDepth = 32;
constexpr uint32_t kMaxContainerSize = 4096;

double wall_clock_seconds();
std::string generate_request_id();
bool is_well_formed_id(const std::string& id);
bool is_allowed_payload(const msgpack::object& obj);

Request build_request(const std::string& action, codec::Payload payload, const std::string& sender_id);
Request build_request(const std::string& action, codec::Payload payload, const std::string& sender_id, double now);
Response build_response(bool success, codec::Payload data, const std::string& error, const std::string& request_id);

/// Structural check of a decoded request frame. Never throws.
ShapeError validate_request_shape(const msgpack::object& msg);
/// Re-check of an already decoded request.
ShapeError validate_request_shape(const Request& request);

namespace wire {

std::string encode(const Request& request);
std::string encode(const Response& response);
std::string encode(const Event& event);

/// Unpacks a frame with envelope size limits. Throws on malformed MessagePack.
codec::Payload decode_frame(const std::string& bytes);

std::optional<MessageType> message_type(const msgpack::object& root);

// The readers expect a root that already passed the matching shape check.
Request read_request(const codec::Payload& root);
std::optional<Response> read_response(const codec::Payload& root);
std::optional<Event> read_event(const codec::Payload& root);

} // namespace wire

} // namespace rpcgate
