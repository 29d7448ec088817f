#include <tether/runtime/runtime_agent.h>
#include <tether/runtime/local_session.h>
#include <tether/handle/execution_context.h>
#include <tether/handle/js_handle.h>
#include <tether/rpc/message_pipe.h>
#include <tether/rpc/pipe_session.h>
#include <tether/core/config.h>
#include <tether/core/errors.h>
#include <gtest/gtest.h>
#include <cmath>
#include <cstdint>
#include <limits>
#include <string>
#include <thread>

using tether::core::ErrorKind;
using tether::core::HandleError;
using tether::core::ProtocolError;
using tether::handle::ExecutionContext;
using tether::protocol::JsonValue;
using tether::runtime::LocalSession;
using tether::runtime::RuntimeAgent;

namespace {

// One QuickJS context driven through the handle layer.
class RuntimeAgentTest : public ::testing::Test {
protected:
    RuntimeAgentTest()
        : session_(agent_),
          context_id_(agent_.create_context()),
          context_(session_, context_id_, nullptr) {}

    RuntimeAgent agent_;
    LocalSession session_;
    int64_t context_id_;
    ExecutionContext context_;
};

} // namespace

// ============================================================================
// 1. Evaluation
// ============================================================================

TEST_F(RuntimeAgentTest, EvaluateAddsArguments) {
    EXPECT_EQ(context_.evaluate("(a, b) => a + b", {1, 2}), JsonValue(3));
    EXPECT_EQ(agent_.live_object_count(), 0u);
}

TEST_F(RuntimeAgentTest, EvaluateReturnsStructuredValue) {
    JsonValue expected = JsonValue::object();
    JsonValue list = JsonValue::array();
    list.push_back(1);
    list.push_back("two");
    list.push_back(nullptr);
    expected["a"] = list;
    expected["b"]["c"] = true;

    EXPECT_EQ(context_.evaluate("() => ({a: [1, 'two', null], b: {c: true}, f() {}})"), expected);
    EXPECT_EQ(agent_.live_object_count(), 0u);
}

TEST_F(RuntimeAgentTest, EvaluateAwaitsPromises) {
    EXPECT_EQ(context_.evaluate("async (x) => x * 2", {21}), JsonValue(42));
}

TEST_F(RuntimeAgentTest, ThrowingFunctionRaisesEvaluationFailed) {
    try {
        context_.evaluate("() => { throw new Error('boom'); }");
        FAIL() << "expected HandleError";
    } catch (const HandleError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::EvaluationFailed);
        EXPECT_NE(std::string(e.what()).find("boom"), std::string::npos);
    }
}

TEST_F(RuntimeAgentTest, RejectedPromiseRaisesEvaluationFailed) {
    try {
        context_.evaluate("async () => { throw new TypeError('late'); }");
        FAIL() << "expected HandleError";
    } catch (const HandleError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::EvaluationFailed);
        EXPECT_NE(std::string(e.what()).find("late"), std::string::npos);
    }
}

TEST_F(RuntimeAgentTest, SyntaxErrorRaisesEvaluationFailed) {
    EXPECT_THROW(context_.evaluate("(a, b => "), HandleError);
}

TEST_F(RuntimeAgentTest, UnknownContextIsAProtocolError) {
    ExecutionContext missing(session_, 99, nullptr);
    EXPECT_THROW(missing.evaluate("() => 1"), ProtocolError);
}

TEST_F(RuntimeAgentTest, ScriptGlobalsAreVisibleToFunctions) {
    agent_.run_script(context_id_, "globalThis.base = 40;");
    EXPECT_EQ(context_.evaluate("(n) => base + n", {2}), JsonValue(42));
}

// ============================================================================
// 2. Numeric sentinels
// ============================================================================

TEST_F(RuntimeAgentTest, InfinityRoundTrips) {
    const double inf = std::numeric_limits<double>::infinity();
    EXPECT_EQ(context_.evaluate("(x) => x", {inf}).as_number(), inf);
    EXPECT_EQ(context_.evaluate("(x) => x", {-inf}).as_number(), -inf);
    EXPECT_EQ(context_.evaluate("(x) => x === -Infinity", {-inf}), JsonValue(true));
}

TEST_F(RuntimeAgentTest, SentinelResultsComeBackWithoutObjectIds) {
    auto nan = context_.evaluate_handle("() => NaN");
    auto negative_zero = context_.evaluate_handle("() => -0");

    EXPECT_FALSE(nan->remote_object().has_object_id());
    EXPECT_TRUE(std::isnan(nan->json_value().as_number()));
    EXPECT_EQ(nan->to_string(), "JSHandle:NaN");

    const double zero = negative_zero->json_value().as_number();
    EXPECT_TRUE(std::signbit(zero));
    EXPECT_EQ(agent_.live_object_count(), 0u);
}

TEST_F(RuntimeAgentTest, NanArgumentIsPassedAsPlainValue) {
    EXPECT_EQ(context_.evaluate("(x) => Number.isNaN(x)", {std::nan("")}), JsonValue(true));
}

// ============================================================================
// 3. Handles
// ============================================================================

TEST_F(RuntimeAgentTest, GetPropertyReleasesCarrier) {
    auto object = context_.evaluate_handle("() => ({x: 5, y: 6})");
    ASSERT_EQ(agent_.live_object_count(), 1u);

    auto x = object->get_property("x");

    EXPECT_EQ(x->json_value(), JsonValue(5));
    EXPECT_EQ(agent_.live_object_count(), 1u);
    EXPECT_TRUE(agent_.has_object(object->remote_object().object_id()));
}

TEST_F(RuntimeAgentTest, GetPropertyOfObjectValueIsReference) {
    auto object = context_.evaluate_handle("() => ({inner: {deep: [1, 2]}})");
    auto inner = object->get_property("inner");

    ASSERT_TRUE(inner->remote_object().has_object_id());
    JsonValue expected = JsonValue::object();
    JsonValue deep = JsonValue::array();
    deep.push_back(1);
    deep.push_back(2);
    expected["deep"] = deep;
    EXPECT_EQ(inner->json_value(), expected);
}

TEST_F(RuntimeAgentTest, GetPropertiesSkipsNonEnumerable) {
    auto object = context_.evaluate_handle(
        "() => { const o = {a: 1, get g() { return 2; }};"
        " Object.defineProperty(o, 'hidden', {value: 3, enumerable: false}); return o; }");

    auto properties = object->get_properties();

    ASSERT_EQ(properties.size(), 2u);
    EXPECT_EQ(properties.at("a")->json_value(), JsonValue(1));
    EXPECT_EQ(properties.at("g")->remote_object().type, "undefined");
    EXPECT_EQ(properties.count("hidden"), 0u);
}

TEST_F(RuntimeAgentTest, HandleArgumentIsPassedByReference) {
    auto object = context_.evaluate_handle("() => ({v: 41})");
    EXPECT_EQ(context_.evaluate("(o) => o.v + 1", {*object}), JsonValue(42));
    EXPECT_EQ(context_.evaluate("(o) => { o.v = 1; return o.v; }", {*object}), JsonValue(1));
    EXPECT_EQ(object->json_value().get("v"), JsonValue(1));
}

TEST_F(RuntimeAgentTest, ForeignHandleIsRejectedWithoutRequest) {
    auto object = context_.evaluate_handle("() => ({})");
    const int64_t other_id = agent_.create_context();
    ExecutionContext other(session_, other_id, nullptr);
    const auto before = session_.request_count();

    try {
        other.evaluate("(o) => o", {*object});
        FAIL() << "expected HandleError";
    } catch (const HandleError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::CrossContextHandle);
    }
    EXPECT_EQ(session_.request_count(), before);
}

TEST_F(RuntimeAgentTest, DisposeReleasesRemoteObject) {
    auto object = context_.evaluate_handle("() => [1, 2, 3]");
    const std::string id = object->remote_object().object_id();
    ASSERT_TRUE(agent_.has_object(id));
    EXPECT_EQ(object->to_string(), "JSHandle@array");

    object->dispose();
    object->dispose();

    EXPECT_FALSE(agent_.has_object(id));
    EXPECT_EQ(agent_.live_object_count(), 0u);
    EXPECT_THROW(context_.evaluate("(a) => a.length", {*object}), HandleError);
}

TEST_F(RuntimeAgentTest, DisposeAfterContextDestroyedIsTolerated) {
    auto object = context_.evaluate_handle("() => ({})");
    ASSERT_TRUE(agent_.destroy_context(context_id_));

    EXPECT_NO_THROW(object->dispose());
    EXPECT_TRUE(object->is_disposed());
}

TEST_F(RuntimeAgentTest, CyclicValueCannotBeReturnedByValue) {
    EXPECT_THROW(context_.evaluate("() => { const o = {}; o.self = o; return o; }"),
                 ProtocolError);
    EXPECT_EQ(agent_.live_object_count(), 0u);
}

TEST_F(RuntimeAgentTest, NodeLikeObjectsBecomeElements) {
    auto node = context_.evaluate_handle("() => ({nodeType: 1, nodeName: 'DIV'})");
    auto plain = context_.evaluate_handle("() => ({})");

    EXPECT_NE(node->as_element(), nullptr);
    EXPECT_EQ(node->to_string(), "JSHandle@node");
    EXPECT_EQ(plain->as_element(), nullptr);
}

// ============================================================================
// 4. queryObjects
// ============================================================================

TEST_F(RuntimeAgentTest, QueryObjectFindsReachableInstances) {
    agent_.run_script(context_id_,
                      "globalThis.Foo = class Foo {};"
                      "globalThis.foos = [new Foo(), new Foo()];"
                      "globalThis.other = {};");
    auto prototype = context_.evaluate_handle("() => Foo.prototype");

    auto objects = context_.query_object(*prototype);

    EXPECT_EQ(objects->to_string(), "JSHandle@array");
    EXPECT_EQ(context_.evaluate("(list) => list.length", {*objects}), JsonValue(2));
    EXPECT_EQ(context_.evaluate("(list, F) => list.every((o) => o instanceof F)",
                                {*objects, *context_.evaluate_handle("() => Foo")}),
              JsonValue(true));
}

TEST_F(RuntimeAgentTest, QueryObjectRejectsPrimitivePrototype) {
    auto primitive = context_.evaluate_handle("() => 5");
    try {
        context_.query_object(*primitive);
        FAIL() << "expected HandleError";
    } catch (const HandleError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::PrototypeNotObject);
    }
}

// ============================================================================
// 5. Dispatch
// ============================================================================

TEST_F(RuntimeAgentTest, UnknownMethodIsRejected) {
    try {
        agent_.dispatch("Runtime.evaluate", JsonValue::object());
        FAIL() << "expected ProtocolError";
    } catch (const ProtocolError& e) {
        EXPECT_EQ(e.code(), tether::core::config::kMethodNotFoundCode);
    }
}

TEST_F(RuntimeAgentTest, ReleaseOfUnknownObjectIsRejected) {
    JsonValue params = JsonValue::object();
    params["objectId"] = "1.999";
    EXPECT_THROW(agent_.dispatch(tether::core::config::kReleaseObject, params), ProtocolError);
}

TEST_F(RuntimeAgentTest, ContextsAreIsolated) {
    const int64_t other_id = agent_.create_context();
    ExecutionContext other(session_, other_id, nullptr);

    agent_.run_script(context_id_, "globalThis.marker = 'first';");
    EXPECT_EQ(context_.evaluate("() => typeof marker"), JsonValue("string"));
    EXPECT_EQ(other.evaluate("() => typeof marker"), JsonValue("undefined"));
}

// ============================================================================
// 6. Over a message pipe
// ============================================================================

TEST(RuntimeAgentPipeTest, ServesRequestsOverPipe) {
    auto [client_end, server_end] = tether::rpc::MessagePipe::create_pair();
    RuntimeAgent agent;
    const int64_t context_id = agent.create_context();

    std::thread server([&agent, pipe = std::move(server_end)]() mutable { agent.serve(pipe); });

    {
        tether::rpc::PipeSession session(std::move(client_end));
        ExecutionContext context(session, context_id, nullptr);

        EXPECT_EQ(context.evaluate("(a, b) => a + b", {1, 2}), JsonValue(3));
        const double inf = std::numeric_limits<double>::infinity();
        EXPECT_EQ(context.evaluate("(x) => x", {-inf}).as_number(), -inf);
        EXPECT_THROW(context.evaluate("() => { throw new Error('wire'); }"), HandleError);

        ExecutionContext missing(session, 404, nullptr);
        EXPECT_THROW(missing.evaluate("() => 1"), ProtocolError);
        session.close();
    }

    server.join();
    EXPECT_EQ(agent.live_object_count(), 0u);
}
