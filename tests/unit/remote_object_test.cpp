#include <tether/protocol/remote_object.h>
#include <gtest/gtest.h>
#include <cmath>
#include <limits>
#include <stdexcept>
#include <string>

using tether::protocol::DecodeError;
using tether::protocol::JsonValue;
using tether::protocol::RemoteObject;

// ------------------------------------------------------------------
// 1. Decoding descriptors
// ------------------------------------------------------------------

TEST(RemoteObjectTest, DecodesReference) {
    JsonValue json = JsonValue::object();
    json["type"] = "object";
    json["subtype"] = "array";
    json["className"] = "Array";
    json["description"] = "Array(3)";
    json["objectId"] = "1.7";

    RemoteObject remote = RemoteObject::from_json(json);

    EXPECT_EQ(remote.type, "object");
    EXPECT_EQ(remote.subtype.value_or(""), "array");
    EXPECT_EQ(remote.class_name.value_or(""), "Array");
    EXPECT_EQ(remote.description.value_or(""), "Array(3)");
    EXPECT_TRUE(remote.has_object_id());
    EXPECT_EQ(remote.object_id(), "1.7");
    EXPECT_EQ(remote.value(), nullptr);
}

TEST(RemoteObjectTest, DecodesUnserializableValue) {
    JsonValue json = JsonValue::object();
    json["type"] = "number";
    json["unserializableValue"] = "-Infinity";

    RemoteObject remote = RemoteObject::from_json(json);

    EXPECT_FALSE(remote.has_object_id());
    ASSERT_NE(remote.unserializable_value(), nullptr);
    EXPECT_EQ(*remote.unserializable_value(), "-Infinity");
}

TEST(RemoteObjectTest, DecodesPlainValue) {
    JsonValue json = JsonValue::object();
    json["type"] = "string";
    json["value"] = "hello";

    RemoteObject remote = RemoteObject::from_json(json);

    ASSERT_NE(remote.value(), nullptr);
    EXPECT_EQ(*remote.value(), JsonValue("hello"));
    EXPECT_EQ(remote.object_id(), "");
}

TEST(RemoteObjectTest, ObjectIdTakesPrecedence) {
    JsonValue json = JsonValue::object();
    json["type"] = "object";
    json["value"] = 1;
    json["objectId"] = "9";

    EXPECT_TRUE(RemoteObject::from_json(json).has_object_id());
}

TEST(RemoteObjectTest, RejectsMalformedDescriptors) {
    EXPECT_THROW(RemoteObject::from_json(JsonValue(3)), DecodeError);
    EXPECT_THROW(RemoteObject::from_json(JsonValue::object()), DecodeError);
}

TEST(RemoteObjectTest, EncodesBackToDescriptor) {
    RemoteObject remote = RemoteObject::from_reference("function", "2.1");
    JsonValue json = remote.to_json();

    EXPECT_EQ(json.get("type"), JsonValue("function"));
    EXPECT_EQ(json.get("objectId"), JsonValue("2.1"));
    EXPECT_FALSE(json.contains("value"));
    EXPECT_FALSE(json.contains("subtype"));
}

TEST(RemoteObjectTest, FromValueInfersType) {
    EXPECT_EQ(RemoteObject::from_value(JsonValue(true)).type, "boolean");
    EXPECT_EQ(RemoteObject::from_value(JsonValue("s")).type, "string");
    EXPECT_EQ(RemoteObject::from_value(JsonValue(nullptr)).subtype.value_or(""), "null");
    EXPECT_EQ(RemoteObject::from_value(JsonValue::array()).subtype.value_or(""), "array");
    EXPECT_EQ(RemoteObject::from_value(JsonValue()).type, "undefined");
}

// ------------------------------------------------------------------
// 2. Materializing values
// ------------------------------------------------------------------

TEST(RemoteObjectTest, SentinelsMapToDoubles) {
    EXPECT_EQ(tether::protocol::sentinel_to_number("Infinity"),
              std::numeric_limits<double>::infinity());
    EXPECT_EQ(tether::protocol::sentinel_to_number("-Infinity"),
              -std::numeric_limits<double>::infinity());
    EXPECT_TRUE(std::isnan(tether::protocol::sentinel_to_number("NaN")));
    EXPECT_TRUE(std::signbit(tether::protocol::sentinel_to_number("-0")));
    EXPECT_THROW(tether::protocol::sentinel_to_number("12n"), DecodeError);
}

TEST(RemoteObjectTest, ValueFromRemoteObject) {
    EXPECT_EQ(tether::protocol::value_from_remote_object(RemoteObject::from_value(JsonValue(4))),
              JsonValue(4));
    EXPECT_TRUE(tether::protocol::value_from_remote_object(RemoteObject{}).is_undefined());
    EXPECT_THROW(
        tether::protocol::value_from_remote_object(RemoteObject::from_reference("object", "1")),
        std::logic_error);
}

// ------------------------------------------------------------------
// 3. Exception messages and call arguments
// ------------------------------------------------------------------

TEST(RemoteObjectTest, ExceptionMessagePrefersDescription) {
    JsonValue details = JsonValue::object();
    details["text"] = "Uncaught";
    details["exception"]["type"] = "object";
    details["exception"]["description"] = "Error: boom\n    at <anonymous>";

    EXPECT_EQ(tether::protocol::exception_message(details), "Error: boom\n    at <anonymous>");
}

TEST(RemoteObjectTest, ExceptionMessageUsesThrownString) {
    JsonValue details = JsonValue::object();
    details["exception"]["type"] = "string";
    details["exception"]["value"] = "plain";

    EXPECT_EQ(tether::protocol::exception_message(details), "plain");
}

TEST(RemoteObjectTest, ExceptionMessageFormatsStackTrace) {
    JsonValue frame = JsonValue::object();
    frame["functionName"] = "inner";
    frame["url"] = "page.js";
    frame["lineNumber"] = 3;
    frame["columnNumber"] = 9;

    JsonValue details = JsonValue::object();
    details["text"] = "Uncaught ReferenceError";
    details["stackTrace"]["callFrames"].push_back(frame);

    EXPECT_EQ(tether::protocol::exception_message(details),
              "Uncaught ReferenceError\n    at inner (page.js:3:9)");
    EXPECT_EQ(tether::protocol::exception_message(JsonValue::object()), "Uncaught");
}

TEST(RemoteObjectTest, ArgumentForms) {
    EXPECT_EQ(tether::protocol::make_value_argument(JsonValue(1)).get("value"), JsonValue(1));
    EXPECT_EQ(tether::protocol::make_unserializable_argument("NaN").get("unserializableValue"),
              JsonValue("NaN"));
    EXPECT_EQ(tether::protocol::make_object_argument("3.4").get("objectId"), JsonValue("3.4"));
}
