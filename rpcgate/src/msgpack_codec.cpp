#include "msgpack_codec.hpp"

namespace rpcgate::codec {

Payload Payload::build(const std::function<void(Packer&)>& pack_fn) {
    msgpack::sbuffer buffer;
    Packer pk(&buffer);
    pack_fn(pk);
    return unpack(buffer.data(), buffer.size());
}

Payload Payload::unpack(const char* data, std::size_t size) {
    auto handle = std::make_shared<msgpack::object_handle>(msgpack::unpack(data, size));
    msgpack::object root = handle->get();
    return Payload(std::move(handle), root);
}

Payload Payload::unpack(const char* data, std::size_t size, const msgpack::unpack_limit& limit) {
    auto handle = std::make_shared<msgpack::object_handle>(
        msgpack::unpack(data, size, nullptr, nullptr, limit));
    msgpack::object root = handle->get();
    return Payload(std::move(handle), root);
}

Payload Payload::copy_of(const msgpack::object& obj) {
    msgpack::sbuffer buffer;
    msgpack::pack(buffer, obj);
    return unpack(buffer.data(), buffer.size());
}

const msgpack::object* find_key(const msgpack::object& map_obj, const std::string& key) {
    if (map_obj.type != msgpack::type::MAP) {
        return nullptr;
    }

    const msgpack::object_kv* entry = map_obj.via.map.ptr;
    const msgpack::object_kv* last = entry + map_obj.via.map.size;
    for (; entry != last; ++entry) {
        const msgpack::object& k = entry->key;
        if (k.type == msgpack::type::STR && key.compare(0, std::string::npos, k.via.str.ptr, k.via.str.size) == 0) {
            return &entry->val;
        }
    }
    return nullptr;
}

std::string as_string(const msgpack::object& obj, const std::string& fallback) {
    return obj.type == msgpack::type::STR ? std::string(obj.via.str.ptr, obj.via.str.size) : fallback;
}

int64_t as_int64(const msgpack::object& obj, int64_t fallback) {
    switch (obj.type) {
        case msgpack::type::POSITIVE_INTEGER: return static_cast<int64_t>(obj.via.u64);
        case msgpack::type::NEGATIVE_INTEGER: return obj.via.i64;
        default: return fallback;
    }
}

bool as_bool(const msgpack::object& obj, bool fallback) {
    return obj.type == msgpack::type::BOOLEAN ? obj.via.boolean : fallback;
}

double as_double(const msgpack::object& obj, double fallback) {
    switch (obj.type) {
        case msgpack::type::FLOAT32:
        case msgpack::type::FLOAT64: return obj.via.f64;
        case msgpack::type::POSITIVE_INTEGER: return static_cast<double>(obj.via.u64);
        case msgpack::type::NEGATIVE_INTEGER: return static_cast<double>(obj.via.i64);
        default: return fallback;
    }
}

bool is_number(const msgpack::object& obj) {
    switch (obj.type) {
        case msgpack::type::POSITIVE_INTEGER:
        case msgpack::type::NEGATIVE_INTEGER:
        case msgpack::type::FLOAT32:
        case msgpack::type::FLOAT64:
            return true;
        default:
            return false;
    }
}

void pack_error(Packer& pk, const std::string& message) {
    pk.pack_map(1);
    pk.pack("message");
    pk.pack(message);
}

} // namespace rpcgate::codec
