#pragma once

#include <msgpack.hpp>

#include <cstddef>
#include <functional>
#include <memory>
#include <string>

namespace rpcgate::codec {

using Packer = msgpack::packer<msgpack::sbuffer>;

/**
 * Shared, immutable MessagePack value.
 * Copies share the underlying zone; an empty payload reads as nil.
 */
class Payload {
public:
    Payload() = default;

    template <typename T>
    static Payload from(const T& value) {
        msgpack::sbuffer buffer;
        msgpack::pack(buffer, value);
        return unpack(buffer.data(), buffer.size());
    }

    static Payload build(const std::function<void(Packer&)>& pack_fn);
    static Payload unpack(const char* data, std::size_t size);
    static Payload unpack(const char* data, std::size_t size, const msgpack::unpack_limit& limit);
    static Payload copy_of(const msgpack::object& obj);

    /// View into a sub-object of an already decoded frame; keeps the frame alive.
    Payload view(const msgpack::object& sub) const { return Payload(owner_, sub); }

    bool empty() const { return obj_.type == msgpack::type::NIL; }
    const msgpack::object& get() const { return obj_; }

    template <typename T>
    T as() const {
        return obj_.as<T>();
    }

    bool operator==(const Payload& other) const { return obj_ == other.obj_; }
    bool operator!=(const Payload& other) const { return !(*this == other); }

private:
    Payload(std::shared_ptr<const msgpack::object_handle> owner, const msgpack::object& obj)
        : owner_(std::move(owner)), obj_(obj) {}

    std::shared_ptr<const msgpack::object_handle> owner_;
    msgpack::object obj_;
};

const msgpack::object* find_key(const msgpack::object& map_obj, const std::string& key);
std::string as_string(const msgpack::object& obj, const std::string& fallback = "");
int64_t as_int64(const msgpack::object& obj, int64_t fallback = 0);
bool as_bool(const msgpack::object& obj, bool fallback = false);
double as_double(const msgpack::object& obj, double fallback = 0.0);
bool is_number(const msgpack::object& obj);

void pack_error(Packer& pk, const std::string& message);

} // namespace rpcgate::codec
