#include <gtest/gtest.h>

#include "errors.hpp"
#include "logger.hpp"
#include "protocol.hpp"
#include "test_helpers.hpp"

#include <msgpack.hpp>

#include <limits>
#include <set>
#include <string>

using rpcgate::ShapeError;
using rpcgate::codec::Packer;
using rpcgate::codec::Payload;

namespace {

class LoggingEnvironment final : public ::testing::Environment {
public:
    void SetUp() override { ensure_test_logging(); }
};

::testing::Environment* const kLoggingEnvironment = ::testing::AddGlobalTestEnvironment(new LoggingEnvironment());

ShapeError shape_of(const std::string& frame) {
    auto root = rpcgate::wire::decode_frame(frame);
    return rpcgate::validate_request_shape(root.get());
}

Payload nested_arrays(int depth) {
    return Payload::build([depth](Packer& pk) {
        for (int i = 0; i < depth; ++i) {
            pk.pack_array(1);
        }
        pk.pack(1);
    });
}

} // namespace

TEST(Protocol, GeneratedIdsAreWellFormedAndUnique) {
    std::set<std::string> seen;
    for (int i = 0; i < 1000; ++i) {
        std::string id = rpcgate::generate_request_id();
        EXPECT_EQ(id.size(), 36u);
        EXPECT_EQ(id[8], '-');
        EXPECT_EQ(id[13], '-');
        EXPECT_TRUE(rpcgate::is_well_formed_id(id));
        seen.insert(id);
    }
    EXPECT_EQ(seen.size(), 1000u);
}

TEST(Protocol, IdCharsetAndLength) {
    EXPECT_TRUE(rpcgate::is_well_formed_id("abc_DEF-123"));
    EXPECT_FALSE(rpcgate::is_well_formed_id(""));
    EXPECT_FALSE(rpcgate::is_well_formed_id("has space"));
    EXPECT_FALSE(rpcgate::is_well_formed_id("semi;colon"));
    EXPECT_TRUE(rpcgate::is_well_formed_id(std::string(64, 'a')));
    EXPECT_FALSE(rpcgate::is_well_formed_id(std::string(65, 'a')));
}

TEST(Protocol, BuildRequestStampsFields) {
    auto request = rpcgate::build_request("ping", Payload(), "alice", 1234.5);
    EXPECT_EQ(request.action, "ping");
    EXPECT_EQ(request.sender_id, "alice");
    EXPECT_DOUBLE_EQ(request.timestamp, 1234.5);
    EXPECT_TRUE(request.payload.empty());
    EXPECT_EQ(rpcgate::validate_request_shape(request), ShapeError::ok);
}

TEST(Protocol, BuildResponseKeepsOnlyRelevantField) {
    auto ok = rpcgate::build_response(true, Payload::from(7), "ignored", "id-1");
    EXPECT_TRUE(ok.success);
    EXPECT_EQ(ok.id, "id-1");
    EXPECT_EQ(ok.data.as<int>(), 7);
    EXPECT_TRUE(ok.error.empty());

    auto failed = rpcgate::build_response(false, Payload::from(7), "Unknown action", "id-2");
    EXPECT_FALSE(failed.success);
    EXPECT_TRUE(failed.data.empty());
    EXPECT_EQ(failed.error, "Unknown action");
}

TEST(Protocol, WellFormedRequestPassesShapeCheck) {
    EXPECT_EQ(shape_of(make_request_frame("req-1", "ping", 100.0)), ShapeError::ok);
}

TEST(Protocol, NonMapFrameIsMalformed) {
    std::string frame = pack_frame([](Packer& pk) { pk.pack(std::string("hello")); });
    EXPECT_EQ(shape_of(frame), ShapeError::malformed);
}

TEST(Protocol, MissingOrInvalidIdRejected) {
    std::string no_id = pack_frame([](Packer& pk) {
        pk.pack_map(2);
        pk.pack("action");
        pk.pack("ping");
        pk.pack("timestamp");
        pk.pack(1.0);
    });
    EXPECT_EQ(shape_of(no_id), ShapeError::missing_id);

    std::string numeric_id = pack_frame([](Packer& pk) {
        pk.pack_map(3);
        pk.pack("id");
        pk.pack(42);
        pk.pack("action");
        pk.pack("ping");
        pk.pack("timestamp");
        pk.pack(1.0);
    });
    EXPECT_EQ(shape_of(numeric_id), ShapeError::invalid_id);

    EXPECT_EQ(shape_of(make_request_frame("bad id!", "ping", 1.0)), ShapeError::invalid_id);
}

TEST(Protocol, EmptyActionRejected) {
    EXPECT_EQ(shape_of(make_request_frame("req-1", "", 1.0)), ShapeError::empty_action);
}

TEST(Protocol, NonNumericTimestampRejected) {
    std::string frame = pack_frame([](Packer& pk) {
        pk.pack_map(3);
        pk.pack("id");
        pk.pack("req-1");
        pk.pack("action");
        pk.pack("ping");
        pk.pack("timestamp");
        pk.pack("yesterday");
    });
    EXPECT_EQ(shape_of(frame), ShapeError::invalid_timestamp);
}

TEST(Protocol, NonFiniteTimestampRejected) {
    EXPECT_EQ(shape_of(make_request_frame("req-1", "ping", std::numeric_limits<double>::quiet_NaN())),
              ShapeError::invalid_timestamp);
    EXPECT_EQ(shape_of(make_request_frame("req-1", "ping", std::numeric_limits<double>::infinity())),
              ShapeError::invalid_timestamp);
    EXPECT_EQ(shape_of(make_request_frame("req-1", "ping", -std::numeric_limits<double>::infinity())),
              ShapeError::invalid_timestamp);
    EXPECT_EQ(shape_of(make_request_frame("req-1", "ping", 1.0e9)), ShapeError::ok);

    auto request = rpcgate::build_request("ping", Payload(), "", 1.0);
    request.timestamp = std::numeric_limits<double>::quiet_NaN();
    EXPECT_EQ(rpcgate::validate_request_shape(request), ShapeError::invalid_timestamp);
}

TEST(Protocol, NonRequestTypeRejected) {
    std::string frame = pack_frame([](Packer& pk) {
        pk.pack_map(4);
        pk.pack("type");
        pk.pack("response");
        pk.pack("id");
        pk.pack("req-1");
        pk.pack("action");
        pk.pack("ping");
        pk.pack("timestamp");
        pk.pack(1.0);
    });
    EXPECT_EQ(shape_of(frame), ShapeError::malformed);
}

TEST(Protocol, PayloadWithIntegerKeysRejected) {
    std::string frame = pack_frame([](Packer& pk) {
        pk.pack_map(4);
        pk.pack("id");
        pk.pack("req-1");
        pk.pack("action");
        pk.pack("ping");
        pk.pack("timestamp");
        pk.pack(1.0);
        pk.pack("payload");
        pk.pack_map(1);
        pk.pack(1);
        pk.pack("one");
    });
    EXPECT_EQ(shape_of(frame), ShapeError::invalid_payload);
}

TEST(Protocol, PayloadDepthIsBounded) {
    EXPECT_TRUE(rpcgate::is_allowed_payload(nested_arrays(rpcgate::kMaxPayloadDepth).get()));
    EXPECT_FALSE(rpcgate::is_allowed_payload(nested_arrays(rpcgate::kMaxPayloadDepth + 1).get()));
}

TEST(Protocol, NumericSenderRejected) {
    std::string frame = pack_frame([](Packer& pk) {
        pk.pack_map(4);
        pk.pack("id");
        pk.pack("req-1");
        pk.pack("action");
        pk.pack("ping");
        pk.pack("timestamp");
        pk.pack(1.0);
        pk.pack("sender_id");
        pk.pack(99);
    });
    EXPECT_EQ(shape_of(frame), ShapeError::invalid_sender);
}

TEST(Protocol, RequestSurvivesEncoding) {
    Payload payload = Payload::build([](Packer& pk) {
        pk.pack_map(2);
        pk.pack("text");
        pk.pack("hi");
        pk.pack("count");
        pk.pack(3);
    });
    auto request = rpcgate::build_request("echo", payload, "alice", 50.25);

    auto root = rpcgate::wire::decode_frame(rpcgate::wire::encode(request));
    ASSERT_TRUE(rpcgate::wire::message_type(root.get()) == rpcgate::MessageType::request);
    ASSERT_EQ(rpcgate::validate_request_shape(root.get()), ShapeError::ok);

    auto decoded = rpcgate::wire::read_request(root);
    EXPECT_EQ(decoded.id, request.id);
    EXPECT_EQ(decoded.action, "echo");
    EXPECT_EQ(decoded.sender_id, "alice");
    EXPECT_DOUBLE_EQ(decoded.timestamp, 50.25);
    EXPECT_EQ(decoded.payload, payload);
}

TEST(Protocol, FailedResponseCarriesErrorMessageObject) {
    auto response = rpcgate::build_response(false, Payload(), "Rate limit exceeded", "req-9");
    std::string bytes = rpcgate::wire::encode(response);

    auto root = rpcgate::wire::decode_frame(bytes);
    auto error_obj = rpcgate::codec::find_key(root.get(), "error");
    ASSERT_NE(error_obj, nullptr);
    auto message_obj = rpcgate::codec::find_key(*error_obj, "message");
    ASSERT_NE(message_obj, nullptr);
    EXPECT_EQ(rpcgate::codec::as_string(*message_obj), "Rate limit exceeded");
    EXPECT_EQ(rpcgate::codec::find_key(root.get(), "data"), nullptr);

    auto decoded = decode_response(bytes);
    EXPECT_FALSE(decoded.success);
    EXPECT_EQ(decoded.id, "req-9");
    EXPECT_EQ(decoded.error, "Rate limit exceeded");
}

TEST(Protocol, UntaggedMapIsTreatedAsRequest) {
    std::string frame = pack_frame([](Packer& pk) {
        pk.pack_map(2);
        pk.pack("id");
        pk.pack("req-1");
        pk.pack("action");
        pk.pack("ping");
    });
    auto root = rpcgate::wire::decode_frame(frame);
    EXPECT_TRUE(rpcgate::wire::message_type(root.get()) == rpcgate::MessageType::request);
}

TEST(Protocol, UnknownTypeHasNoMessageType) {
    std::string frame = pack_frame([](Packer& pk) {
        pk.pack_map(1);
        pk.pack("type");
        pk.pack("gossip");
    });
    auto root = rpcgate::wire::decode_frame(frame);
    EXPECT_FALSE(rpcgate::wire::message_type(root.get()).has_value());
}

TEST(Protocol, EventWithoutNameIsDiscarded) {
    std::string frame = pack_frame([](Packer& pk) {
        pk.pack_map(2);
        pk.pack("type");
        pk.pack("event");
        pk.pack("payload");
        pk.pack(1);
    });
    auto root = rpcgate::wire::decode_frame(frame);
    EXPECT_FALSE(rpcgate::wire::read_event(root).has_value());

    auto event = decode_event(rpcgate::wire::encode(rpcgate::Event{"tick", Payload::from(5)}));
    EXPECT_EQ(event.name, "tick");
    EXPECT_EQ(event.payload.as<int>(), 5);
}

TEST(Protocol, GarbageFrameThrowsOnDecode) {
    std::string garbage("\xc1\xc1\xc1", 3);
    EXPECT_ANY_THROW(rpcgate::wire::decode_frame(garbage));
}
