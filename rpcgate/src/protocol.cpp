#include "protocol.hpp"

#include <chrono>
#include <cmath>
#include <cstdio>
#include <random>

namespace rpcgate {

namespace {

constexpr std::size_t kMaxIdLength = 64;
constexpr std::size_t kMaxFrameString = 1024 * 1024;

bool allowed_payload(const msgpack::object& obj, int depth) {
    if (depth > kMaxPayloadDepth) {
        return false;
    }
    switch (obj.type) {
        case msgpack::type::NIL:
        case msgpack::type::BOOLEAN:
        case msgpack::type::POSITIVE_INTEGER:
        case msgpack::type::NEGATIVE_INTEGER:
        case msgpack::type::FLOAT32:
        case msgpack::type::FLOAT64:
        case msgpack::type::STR:
        case msgpack::type::BIN:
            return true;
        case msgpack::type::ARRAY: {
            if (obj.via.array.size > kMaxContainerSize) {
                return false;
            }
            for (uint32_t i = 0; i < obj.via.array.size; ++i) {
                if (!allowed_payload(obj.via.array.ptr[i], depth + 1)) {
                    return false;
                }
            }
            return true;
        }
        case msgpack::type::MAP: {
            if (obj.via.map.size > kMaxContainerSize) {
                return false;
            }
            for (uint32_t i = 0; i < obj.via.map.size; ++i) {
                const auto& kv = obj.via.map.ptr[i];
                if (kv.key.type != msgpack::type::STR || !allowed_payload(kv.val, depth + 1)) {
                    return false;
                }
            }
            return true;
        }
        default:
            return false;
    }
}

void pack_payload(codec::Packer& pk, const codec::Payload& payload) {
    if (payload.empty()) {
        pk.pack_nil();
    } else {
        pk.pack(payload.get());
    }
}

} // namespace

const char* to_string(ShapeError error) {
    switch (error) {
        case ShapeError::ok: return "ok";
        case ShapeError::malformed: return "malformed";
        case ShapeError::missing_id: return "missing_id";
        case ShapeError::invalid_id: return "invalid_id";
        case ShapeError::missing_action: return "missing_action";
        case ShapeError::empty_action: return "empty_action";
        case ShapeError::invalid_timestamp: return "invalid_timestamp";
        case ShapeError::invalid_payload: return "invalid_payload";
        case ShapeError::invalid_sender: return "invalid_sender";
    }
    return "unknown";
}

double wall_clock_seconds() {
    auto now = std::chrono::system_clock::now().time_since_epoch();
    return std::chrono::duration<double>(now).count();
}

std::string generate_request_id() {
    thread_local std::mt19937_64 engine{std::random_device{}()};
    uint64_t hi = engine();
    uint64_t lo = engine();

    char buffer[40] = {0};
    std::snprintf(buffer, sizeof(buffer), "%08x-%04x-%04x-%04x-%012llx",
                  static_cast<unsigned>(hi >> 32),
                  static_cast<unsigned>((hi >> 16) & 0xffff),
                  static_cast<unsigned>(hi & 0xffff),
                  static_cast<unsigned>(lo >> 48),
                  static_cast<unsigned long long>(lo & 0xffffffffffffULL));
    return buffer;
}

bool is_well_formed_id(const std::string& id) {
    if (id.empty() || id.size() > kMaxIdLength) {
        return false;
    }
    for (char c : id) {
        bool ok = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') || c == '-' || c == '_';
        if (!ok) {
            return false;
        }
    }
    return true;
}

bool is_allowed_payload(const msgpack::object& obj) {
    return allowed_payload(obj, 0);
}

Request build_request(const std::string& action, codec::Payload payload, const std::string& sender_id) {
    return build_request(action, std::move(payload), sender_id, wall_clock_seconds());
}

Request build_request(const std::string& action, codec::Payload payload, const std::string& sender_id, double now) {
    Request request;
    request.id = generate_request_id();
    request.action = action;
    request.payload = std::move(payload);
    request.timestamp = now;
    request.sender_id = sender_id;
    return request;
}

Response build_response(bool success, codec::Payload data, const std::string& error, const std::string& request_id) {
    Response response;
    response.id = request_id;
    response.success = success;
    if (success) {
        response.data = std::move(data);
    } else {
        response.error = error;
    }
    return response;
}

ShapeError validate_request_shape(const msgpack::object& msg) {
    if (msg.type != msgpack::type::MAP) {
        return ShapeError::malformed;
    }

    if (auto type_obj = codec::find_key(msg, "type")) {
        if (codec::as_string(*type_obj) != "request") {
            return ShapeError::malformed;
        }
    }

    auto id_obj = codec::find_key(msg, "id");
    if (!id_obj) {
        return ShapeError::missing_id;
    }
    if (id_obj->type != msgpack::type::STR || !is_well_formed_id(codec::as_string(*id_obj))) {
        return ShapeError::invalid_id;
    }

    auto action_obj = codec::find_key(msg, "action");
    if (!action_obj || action_obj->type != msgpack::type::STR) {
        return ShapeError::missing_action;
    }
    if (action_obj->via.str.size == 0) {
        return ShapeError::empty_action;
    }

    auto ts_obj = codec::find_key(msg, "timestamp");
    if (!ts_obj || !codec::is_number(*ts_obj) || !std::isfinite(codec::as_double(*ts_obj))) {
        return ShapeError::invalid_timestamp;
    }

    if (auto payload_obj = codec::find_key(msg, "payload")) {
        if (!is_allowed_payload(*payload_obj)) {
            return ShapeError::invalid_payload;
        }
    }

    if (auto sender_obj = codec::find_key(msg, "sender_id")) {
        if (sender_obj->type != msgpack::type::STR && sender_obj->type != msgpack::type::NIL) {
            return ShapeError::invalid_sender;
        }
    }

    return ShapeError::ok;
}

ShapeError validate_request_shape(const Request& request) {
    if (!is_well_formed_id(request.id)) {
        return request.id.empty() ? ShapeError::missing_id : ShapeError::invalid_id;
    }
    if (request.action.empty()) {
        return ShapeError::empty_action;
    }
    if (!std::isfinite(request.timestamp)) {
        return ShapeError::invalid_timestamp;
    }
    if (!is_allowed_payload(request.payload.get())) {
        return ShapeError::invalid_payload;
    }
    return ShapeError::ok;
}

namespace wire {

std::string encode(const Request& request) {
    msgpack::sbuffer buffer;
    codec::Packer pk(&buffer);

    pk.pack_map(request.payload.empty() ? 5 : 6);
    pk.pack("type");
    pk.pack("request");
    pk.pack("id");
    pk.pack(request.id);
    pk.pack("action");
    pk.pack(request.action);
    if (!request.payload.empty()) {
        pk.pack("payload");
        pk.pack(request.payload.get());
    }
    pk.pack("timestamp");
    pk.pack(request.timestamp);
    pk.pack("sender_id");
    pk.pack(request.sender_id);

    return std::string(buffer.data(), buffer.size());
}

std::string encode(const Response& response) {
    msgpack::sbuffer buffer;
    codec::Packer pk(&buffer);

    pk.pack_map(4);
    pk.pack("type");
    pk.pack("response");
    pk.pack("id");
    pk.pack(response.id);
    pk.pack("success");
    pk.pack(response.success);
    if (response.success) {
        pk.pack("data");
        pack_payload(pk, response.data);
    } else {
        pk.pack("error");
        codec::pack_error(pk, response.error);
    }

    return std::string(buffer.data(), buffer.size());
}

std::string encode(const Event& event) {
    msgpack::sbuffer buffer;
    codec::Packer pk(&buffer);

    pk.pack_map(3);
    pk.pack("type");
    pk.pack("event");
    pk.pack("event");
    pk.pack(event.name);
    pk.pack("payload");
    pack_payload(pk, event.payload);

    return std::string(buffer.data(), buffer.size());
}

codec::Payload decode_frame(const std::string& bytes) {
    msgpack::unpack_limit limit(kMaxContainerSize, kMaxContainerSize, kMaxFrameString, kMaxFrameString,
                                kMaxFrameString, kMaxPayloadDepth + 2);
    return codec::Payload::unpack(bytes.data(), bytes.size(), limit);
}

std::optional<MessageType> message_type(const msgpack::object& root) {
    auto type_obj = codec::find_key(root, "type");
    if (!type_obj) {
        // Untagged frames are treated as requests, the original IPC shape.
        return root.type == msgpack::type::MAP ? std::optional<MessageType>(MessageType::request) : std::nullopt;
    }
    std::string type = codec::as_string(*type_obj);
    if (type == "request") {
        return MessageType::request;
    }
    if (type == "response") {
        return MessageType::response;
    }
    if (type == "event") {
        return MessageType::event;
    }
    return std::nullopt;
}

Request read_request(const codec::Payload& root) {
    const msgpack::object& obj = root.get();
    Request request;
    if (auto id_obj = codec::find_key(obj, "id")) {
        request.id = codec::as_string(*id_obj);
    }
    if (auto action_obj = codec::find_key(obj, "action")) {
        request.action = codec::as_string(*action_obj);
    }
    if (auto payload_obj = codec::find_key(obj, "payload")) {
        request.payload = root.view(*payload_obj);
    }
    if (auto ts_obj = codec::find_key(obj, "timestamp")) {
        request.timestamp = codec::as_double(*ts_obj);
    }
    if (auto sender_obj = codec::find_key(obj, "sender_id")) {
        request.sender_id = codec::as_string(*sender_obj);
    }
    return request;
}

std::optional<Response> read_response(const codec::Payload& root) {
    const msgpack::object& obj = root.get();
    auto id_obj = codec::find_key(obj, "id");
    auto success_obj = codec::find_key(obj, "success");
    if (!id_obj || id_obj->type != msgpack::type::STR || !success_obj ||
        success_obj->type != msgpack::type::BOOLEAN) {
        return std::nullopt;
    }

    Response response;
    response.id = codec::as_string(*id_obj);
    response.success = success_obj->via.boolean;
    if (response.success) {
        if (auto data_obj = codec::find_key(obj, "data")) {
            response.data = root.view(*data_obj);
        }
    } else if (auto error_obj = codec::find_key(obj, "error")) {
        if (auto message_obj = codec::find_key(*error_obj, "message")) {
            response.error = codec::as_string(*message_obj);
        } else {
            response.error = codec::as_string(*error_obj);
        }
    }
    return response;
}

std::optional<Event> read_event(const codec::Payload& root) {
    const msgpack::object& obj = root.get();
    auto name_obj = codec::find_key(obj, "event");
    if (!name_obj || name_obj->type != msgpack::type::STR || name_obj->via.str.size == 0) {
        return std::nullopt;
    }

    Event event;
    event.name = codec::as_string(*name_obj);
    if (auto payload_obj = codec::find_key(obj, "payload")) {
        event.payload = root.view(*payload_obj);
    }
    return event;
}

} // namespace wire

} // namespace rpcgate
