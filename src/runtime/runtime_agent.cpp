#include <tether/runtime/runtime_agent.h>
#include <tether/core/config.h>
#include <tether/core/diagnostics.h>
#include <tether/core/errors.h>
#include <tether/protocol/remote_object.h>
#include <tether/rpc/message_pipe.h>

extern "C" {
#include <quickjs.h>
}

#include <cmath>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>

namespace tether::runtime {

using protocol::JsonValue;

namespace {

constexpr const char kScriptName[] = "<tether>";
constexpr int kMaxValueDepth = 1000;

// Classifies a value as [type, subtype, className, description]. Runs inside
// the target context so instanceof checks see that context's intrinsics.
constexpr const char kDescribeSource[] = R"JS((function (v) {
    const type = typeof v;
    try {
        if (v === null) return ['object', 'null', undefined, 'null'];
        if (type === 'object' || type === 'function') {
            let subtype;
            if (Array.isArray(v)) subtype = 'array';
            else if (v instanceof Error) subtype = 'error';
            else if (v instanceof Promise) subtype = 'promise';
            else if (v instanceof RegExp) subtype = 'regexp';
            else if (v instanceof Date) subtype = 'date';
            else if (v instanceof Map) subtype = 'map';
            else if (v instanceof Set) subtype = 'set';
            else if (type === 'object' && typeof v.nodeType === 'number') subtype = 'node';
            const proto = Object.getPrototypeOf(v);
            const ctor = proto && proto.constructor;
            const className = type === 'function' ? 'Function'
                : (ctor && typeof ctor.name === 'string' && ctor.name) || 'Object';
            let description = className;
            if (subtype === 'array') description = 'Array(' + v.length + ')';
            else if (subtype === 'error') description = String(v) + (v.stack ? '\n' + String(v.stack).replace(/\n+$/, '') : '');
            else if (type === 'function') description = Function.prototype.toString.call(v);
            else if (subtype === 'regexp' || subtype === 'date') description = String(v);
            return [type, subtype, className, description];
        }
        if (type === 'bigint') return [type, undefined, undefined, String(v) + 'n'];
        if (type === 'symbol') return [type, undefined, undefined, v.toString()];
        return [type, undefined, undefined, String(v)];
    } catch (e) {
        return [type, undefined, 'Object', 'Object'];
    }
}))JS";

// Objects reachable from the global object through data properties whose
// prototype chain contains `proto`.
constexpr const char kQuerySource[] = R"JS((() => {
    const names = Object.getOwnPropertyNames;
    const descriptor = Object.getOwnPropertyDescriptor;
    const isPrototypeOf = Object.prototype.isPrototypeOf;
    const root = globalThis;
    return function (proto) {
        const seen = new Set();
        const queue = [root];
        const found = [];
        while (queue.length > 0) {
            const object = queue.pop();
            if (seen.has(object)) continue;
            seen.add(object);
            if (object !== proto && isPrototypeOf.call(proto, object)) found.push(object);
            let keys;
            try { keys = names(object); } catch (e) { continue; }
            for (const key of keys) {
                let d;
                try { d = descriptor(object, key); } catch (e) { continue; }
                if (!d || !('value' in d)) continue;
                const value = d.value;
                if (value !== null && (typeof value === 'object' || typeof value === 'function')) {
                    queue.push(value);
                }
            }
        }
        return found;
    };
})())JS";

[[noreturn]] void fail(const std::string& message,
                       int32_t code = core::config::kServerErrorCode) {
    throw core::ProtocolError(code, message);
}

// Owns one JSValue reference for the lifetime of the scope.
class ScopedValue {
public:
    ScopedValue(JSContext* ctx, JSValue value) : ctx_(ctx), value_(value) {}
    ~ScopedValue() { JS_FreeValue(ctx_, value_); }

    ScopedValue(const ScopedValue&) = delete;
    ScopedValue& operator=(const ScopedValue&) = delete;

    JSValue get() const { return value_; }

    void reset(JSValue value) {
        JS_FreeValue(ctx_, value_);
        value_ = value;
    }

private:
    JSContext* ctx_;
    JSValue value_;
};

// Frees the arguments of one call.
struct ArgumentList {
    JSContext* ctx;
    std::vector<JSValue> values;

    explicit ArgumentList(JSContext* c) : ctx(c) {}
    ~ArgumentList() {
        for (auto& value : values) JS_FreeValue(ctx, value);
    }
    ArgumentList(const ArgumentList&) = delete;
    ArgumentList& operator=(const ArgumentList&) = delete;
};

// Own string keys of one object; the atoms stay alive for the scope.
class PropertyKeys {
public:
    PropertyKeys(JSContext* ctx, JSValueConst object, int flags) : ctx_(ctx) {
        JSPropertyEnum* tab = nullptr;
        uint32_t len = 0;
        if (JS_GetOwnPropertyNames(ctx, &tab, &len, object, flags) < 0) {
            return;
        }
        ok_ = true;
        atoms_.reserve(len);
        for (uint32_t i = 0; i < len; ++i) {
            atoms_.push_back(JS_DupAtom(ctx, tab[i].atom));
        }
        JS_FreePropertyEnum(ctx, tab, len);
    }
    ~PropertyKeys() {
        for (JSAtom atom : atoms_) JS_FreeAtom(ctx_, atom);
    }

    PropertyKeys(const PropertyKeys&) = delete;
    PropertyKeys& operator=(const PropertyKeys&) = delete;

    bool ok() const { return ok_; }
    const std::vector<JSAtom>& atoms() const { return atoms_; }

private:
    JSContext* ctx_;
    std::vector<JSAtom> atoms_;
    bool ok_ = false;
};

std::string atom_name(JSContext* ctx, JSAtom atom) {
    const char* name = JS_AtomToCString(ctx, atom);
    if (!name) {
        JS_FreeValue(ctx, JS_GetException(ctx));
        return std::string();
    }
    std::string result(name);
    JS_FreeCString(ctx, name);
    return result;
}

std::string to_std_string(JSContext* ctx, JSValueConst value) {
    size_t len = 0;
    const char* str = JS_ToCStringLen(ctx, &len, value);
    if (!str) {
        JS_FreeValue(ctx, JS_GetException(ctx));
        return std::string();
    }
    std::string result(str, len);
    JS_FreeCString(ctx, str);
    return result;
}

std::string pending_exception_text(JSContext* ctx) {
    ScopedValue exception(ctx, JS_GetException(ctx));
    return to_std_string(ctx, exception.get());
}

JSValue json_to_js(JSContext* ctx, const JsonValue& value) {
    switch (value.type()) {
        case protocol::JsonType::Undefined:
            return JS_UNDEFINED;
        case protocol::JsonType::Null:
            return JS_NULL;
        case protocol::JsonType::Bool:
            return JS_NewBool(ctx, value.as_bool());
        case protocol::JsonType::Number:
            return JS_NewFloat64(ctx, value.as_number());
        case protocol::JsonType::String:
            return JS_NewStringLen(ctx, value.as_string().data(), value.as_string().size());
        case protocol::JsonType::Array: {
            JSValue array = JS_NewArray(ctx);
            uint32_t index = 0;
            for (const auto& item : value.as_array()) {
                JS_SetPropertyUint32(ctx, array, index++, json_to_js(ctx, item));
            }
            return array;
        }
        case protocol::JsonType::Object: {
            JSValue object = JS_NewObject(ctx);
            for (const auto& [key, member] : value.as_object()) {
                // Define rather than assign so "__proto__" stays an own key.
                JS_DefinePropertyValueStr(ctx, object, key.c_str(), json_to_js(ctx, member),
                                          JS_PROP_C_W_E);
            }
            return object;
        }
    }
    return JS_UNDEFINED;
}

bool is_bigint_literal(const std::string& text) {
    if (text.size() < 2 || text.back() != 'n') return false;
    size_t start = text[0] == '-' ? 1 : 0;
    if (start + 1 >= text.size()) return false;
    for (size_t i = start; i + 1 < text.size(); ++i) {
        if (text[i] < '0' || text[i] > '9') return false;
    }
    return true;
}

struct ContextEntry {
    JSContext* ctx = nullptr;
    JSValue describe = JS_UNDEFINED;
    JSValue query = JS_UNDEFINED;
};

struct ObjectEntry {
    int64_t context_id = 0;
    JSValue value = JS_UNDEFINED;
};

struct Traits {
    std::string type = "object";
    std::optional<std::string> subtype;
    std::optional<std::string> class_name;
    std::optional<std::string> description;
};

enum class DescribeMode {
    Reference,  // objects are registered and returned by id
    ByValue,    // objects are serialized to JSON
    Preview,    // objects are described only
};

} // anonymous namespace

struct RuntimeAgent::State {
    JSRuntime* rt = nullptr;
    std::map<int64_t, ContextEntry> contexts;
    std::unordered_map<std::string, ObjectEntry> objects;
    int64_t next_context_id = 1;
    uint64_t next_object_seq = 1;
    int64_t next_exception_id = 1;

    ~State() {
        for (auto& [id, object] : objects) {
            JS_FreeValue(contexts.at(object.context_id).ctx, object.value);
        }
        objects.clear();
        for (auto& [id, entry] : contexts) {
            JS_FreeValue(entry.ctx, entry.describe);
            JS_FreeValue(entry.ctx, entry.query);
            JS_FreeContext(entry.ctx);
        }
        contexts.clear();
        if (rt) JS_FreeRuntime(rt);
    }

    ContextEntry& context(int64_t context_id) {
        auto it = contexts.find(context_id);
        if (it == contexts.end()) fail("Cannot find context with specified id");
        return it->second;
    }

    ObjectEntry& object(const std::string& object_id) {
        auto it = objects.find(object_id);
        if (it == objects.end()) fail("Could not find object with given id");
        return it->second;
    }

    std::string register_object(int64_t context_id, JSContext* ctx, JSValueConst value) {
        std::string id = std::to_string(context_id) + "." + std::to_string(next_object_seq++);
        objects[id] = ObjectEntry{context_id, JS_DupValue(ctx, value)};
        return id;
    }

    void drain_jobs() {
        JSContext* job_ctx = nullptr;
        int status;
        while ((status = JS_ExecutePendingJob(rt, &job_ctx)) != 0) {
            if (status < 0 && job_ctx) {
                // A failing job surfaces through the promise it settles.
                JS_FreeValue(job_ctx, JS_GetException(job_ctx));
            }
        }
    }

    Traits traits_of(const ContextEntry& entry, JSValueConst value) {
        JSContext* ctx = entry.ctx;
        Traits traits;
        JSValueConst argv[1] = {value};
        ScopedValue result(ctx, JS_Call(ctx, entry.describe, JS_UNDEFINED, 1, argv));
        if (JS_IsException(result.get())) {
            JS_FreeValue(ctx, JS_GetException(ctx));
            traits.type = JS_IsFunction(ctx, value) ? "function" : "object";
            return traits;
        }

        auto field = [&](uint32_t index) -> std::optional<std::string> {
            ScopedValue item(ctx, JS_GetPropertyUint32(ctx, result.get(), index));
            if (!JS_IsString(item.get())) return std::nullopt;
            return to_std_string(ctx, item.get());
        };
        traits.type = field(0).value_or("object");
        traits.subtype = field(1);
        traits.class_name = field(2);
        traits.description = field(3);
        return traits;
    }

    JsonValue serialize(const ContextEntry& entry, JSValueConst value, int depth,
                        std::unordered_set<void*>& path) {
        JSContext* ctx = entry.ctx;
        if (JS_IsNull(value)) return JsonValue(nullptr);
        if (JS_IsUndefined(value)) return JsonValue();
        if (JS_IsBool(value)) return JsonValue(JS_ToBool(ctx, value) != 0);
        if (JS_IsString(value)) return JsonValue(to_std_string(ctx, value));
        if (JS_IsNumber(value)) {
            double number = 0;
            JS_ToFloat64(ctx, &number, value);
            if (!std::isfinite(number)) return JsonValue(nullptr);
            return JsonValue(number == 0.0 ? 0.0 : number);
        }
        if (JS_IsFunction(ctx, value)) return JsonValue();
        if (!JS_IsObject(value)) {
            if (traits_of(entry, value).type == "bigint") {
                fail("Object couldn't be returned by value: BigInt value can't be serialized");
            }
            return JsonValue();
        }

        if (depth > kMaxValueDepth) fail("Object reference chain is too long");
        void* identity = JS_VALUE_GET_PTR(value);
        if (!path.insert(identity).second) {
            fail("Object couldn't be returned by value: circular reference");
        }

        JsonValue result;
        ScopedValue to_json(ctx, JS_GetPropertyStr(ctx, value, "toJSON"));
        if (JS_IsException(to_json.get())) {
            fail("Object couldn't be returned by value: " + pending_exception_text(ctx));
        }
        if (JS_IsFunction(ctx, to_json.get())) {
            ScopedValue replaced(ctx, JS_Call(ctx, to_json.get(), value, 0, nullptr));
            if (JS_IsException(replaced.get())) {
                fail("Object couldn't be returned by value: " + pending_exception_text(ctx));
            }
            result = serialize(entry, replaced.get(), depth + 1, path);
        } else if (JS_IsArray(ctx, value) > 0) {
            ScopedValue length_value(ctx, JS_GetPropertyStr(ctx, value, "length"));
            uint32_t length = 0;
            JS_ToUint32(ctx, &length, length_value.get());
            result = JsonValue::array();
            for (uint32_t i = 0; i < length; ++i) {
                ScopedValue item(ctx, JS_GetPropertyUint32(ctx, value, i));
                if (JS_IsException(item.get())) {
                    fail("Object couldn't be returned by value: " + pending_exception_text(ctx));
                }
                JsonValue converted = serialize(entry, item.get(), depth + 1, path);
                result.push_back(converted.is_undefined() ? JsonValue(nullptr) : std::move(converted));
            }
        } else {
            result = JsonValue::object();
            PropertyKeys keys(ctx, value, JS_GPN_STRING_MASK | JS_GPN_ENUM_ONLY);
            if (!keys.ok()) {
                fail("Object couldn't be returned by value: " + pending_exception_text(ctx));
            }
            for (JSAtom atom : keys.atoms()) {
                ScopedValue member(ctx, JS_GetProperty(ctx, value, atom));
                if (JS_IsException(member.get())) {
                    fail("Object couldn't be returned by value: " + pending_exception_text(ctx));
                }
                JsonValue converted = serialize(entry, member.get(), depth + 1, path);
                if (!converted.is_undefined()) {
                    result.set(atom_name(ctx, atom), std::move(converted));
                }
            }
        }

        path.erase(identity);
        return result;
    }

    JsonValue describe(int64_t context_id, const ContextEntry& entry, JSValueConst value,
                       DescribeMode mode) {
        JSContext* ctx = entry.ctx;
        Traits traits = traits_of(entry, value);

        JsonValue descriptor = JsonValue::object();
        descriptor["type"] = traits.type;
        if (traits.subtype) descriptor["subtype"] = *traits.subtype;
        if (traits.class_name) descriptor["className"] = *traits.class_name;
        if (traits.description) descriptor["description"] = *traits.description;

        if (traits.type == "undefined") {
            return descriptor;
        }
        if (traits.type == "number") {
            double number = 0;
            JS_ToFloat64(ctx, &number, value);
            if (std::isnan(number)) {
                descriptor["unserializableValue"] = "NaN";
            } else if (std::isinf(number)) {
                descriptor["unserializableValue"] = number > 0 ? "Infinity" : "-Infinity";
            } else if (number == 0.0 && std::signbit(number)) {
                descriptor["unserializableValue"] = "-0";
            } else {
                descriptor["value"] = number;
            }
            return descriptor;
        }
        if (traits.type == "bigint") {
            descriptor["unserializableValue"] = traits.description.value_or("0n");
            return descriptor;
        }
        if (traits.type == "boolean") {
            descriptor["value"] = JS_ToBool(ctx, value) != 0;
            return descriptor;
        }
        if (traits.type == "string") {
            descriptor["value"] = to_std_string(ctx, value);
            return descriptor;
        }
        if (traits.subtype && *traits.subtype == "null") {
            descriptor["value"] = nullptr;
            return descriptor;
        }

        switch (mode) {
            case DescribeMode::Reference:
                descriptor["objectId"] = register_object(context_id, ctx, value);
                break;
            case DescribeMode::ByValue: {
                std::unordered_set<void*> path;
                JsonValue serialized = serialize(entry, value, 0, path);
                if (!serialized.is_undefined()) descriptor["value"] = std::move(serialized);
                break;
            }
            case DescribeMode::Preview:
                break;
        }
        return descriptor;
    }

    // Takes ownership of `exception`.
    JsonValue exception_details(const ContextEntry& entry, JSValue exception) {
        ScopedValue guard(entry.ctx, exception);
        JsonValue details = JsonValue::object();
        details["exceptionId"] = next_exception_id++;
        details["text"] = "Uncaught";
        details["lineNumber"] = 0;
        details["columnNumber"] = 0;
        details["exception"] = describe(0, entry, guard.get(), DescribeMode::Preview);
        return details;
    }

    JsonValue exception_response(const ContextEntry& entry, JSValue exception) {
        JsonValue response = JsonValue::object();
        JsonValue details = exception_details(entry, exception);
        response["result"] = details.get("exception");
        response["exceptionDetails"] = std::move(details);
        return response;
    }

    JSValue argument_to_js(int64_t context_id, JSContext* ctx, const JsonValue& arg) {
        if (!arg.is_object()) fail("Invalid call argument");

        if (const JsonValue* object_id = arg.find("objectId")) {
            if (!object_id->is_string()) fail("Invalid remote object id");
            ObjectEntry& target = object(object_id->as_string());
            if (target.context_id != context_id) {
                fail("Argument should belong to the same JavaScript world as target object");
            }
            return JS_DupValue(ctx, target.value);
        }

        if (const JsonValue* sentinel = arg.find("unserializableValue")) {
            if (!sentinel->is_string()) fail("Invalid unserializable value");
            const std::string& text = sentinel->as_string();
            if (is_bigint_literal(text)) {
                JSValue big = JS_Eval(ctx, text.data(), text.size(), kScriptName,
                                      JS_EVAL_TYPE_GLOBAL);
                if (JS_IsException(big)) fail("Invalid unserializable value: " + pending_exception_text(ctx));
                return big;
            }
            try {
                return JS_NewFloat64(ctx, protocol::sentinel_to_number(text));
            } catch (const protocol::DecodeError&) {
                fail("Invalid unserializable value: " + text);
            }
        }

        return json_to_js(ctx, arg.get("value"));
    }
};

RuntimeAgent::RuntimeAgent(core::DiagnosticEmitter* emitter)
    : state_(std::make_unique<State>()), emitter_(emitter) {
    state_->rt = JS_NewRuntime();
    if (!state_->rt) {
        throw std::runtime_error("RuntimeAgent: JS_NewRuntime failed");
    }
}

RuntimeAgent::~RuntimeAgent() = default;

int64_t RuntimeAgent::create_context() {
    JSContext* ctx = JS_NewContext(state_->rt);
    if (!ctx) {
        throw std::runtime_error("RuntimeAgent: JS_NewContext failed");
    }

    ContextEntry entry;
    entry.ctx = ctx;
    entry.describe = JS_Eval(ctx, kDescribeSource, sizeof(kDescribeSource) - 1, kScriptName,
                             JS_EVAL_TYPE_GLOBAL);
    entry.query = JS_Eval(ctx, kQuerySource, sizeof(kQuerySource) - 1, kScriptName,
                          JS_EVAL_TYPE_GLOBAL);
    if (JS_IsException(entry.describe) || JS_IsException(entry.query)) {
        std::string message = pending_exception_text(ctx);
        JS_FreeValue(ctx, entry.describe);
        JS_FreeValue(ctx, entry.query);
        JS_FreeContext(ctx);
        throw std::runtime_error("RuntimeAgent: helper setup failed: " + message);
    }

    const int64_t id = state_->next_context_id++;
    state_->contexts.emplace(id, entry);
    if (emitter_) {
        emitter_->emit(core::Severity::Debug, "runtime", "context",
                       "created context " + std::to_string(id));
    }
    return id;
}

bool RuntimeAgent::destroy_context(int64_t context_id) {
    auto it = state_->contexts.find(context_id);
    if (it == state_->contexts.end()) return false;

    JSContext* ctx = it->second.ctx;
    for (auto obj = state_->objects.begin(); obj != state_->objects.end();) {
        if (obj->second.context_id == context_id) {
            JS_FreeValue(ctx, obj->second.value);
            obj = state_->objects.erase(obj);
        } else {
            ++obj;
        }
    }
    JS_FreeValue(ctx, it->second.describe);
    JS_FreeValue(ctx, it->second.query);
    JS_FreeContext(ctx);
    state_->contexts.erase(it);

    if (emitter_) {
        emitter_->emit(core::Severity::Debug, "runtime", "context",
                       "destroyed context " + std::to_string(context_id));
    }
    return true;
}

bool RuntimeAgent::has_context(int64_t context_id) const {
    return state_->contexts.count(context_id) > 0;
}

void RuntimeAgent::run_script(int64_t context_id, const std::string& source) {
    ContextEntry& entry = state_->context(context_id);
    ScopedValue result(entry.ctx, JS_Eval(entry.ctx, source.data(), source.size(),
                                          kScriptName, JS_EVAL_TYPE_GLOBAL));
    if (JS_IsException(result.get())) {
        fail(pending_exception_text(entry.ctx));
    }
    state_->drain_jobs();
}

std::size_t RuntimeAgent::live_object_count() const {
    return state_->objects.size();
}

bool RuntimeAgent::has_object(const std::string& object_id) const {
    return state_->objects.count(object_id) > 0;
}

JsonValue RuntimeAgent::dispatch(const std::string& method, const JsonValue& params) {
    if (method == core::config::kCallFunctionOn) return call_function_on(params);
    if (method == core::config::kGetProperties) return get_properties(params);
    if (method == core::config::kQueryObjects) return query_objects(params);
    if (method == core::config::kReleaseObject) return release_object(params);

    if (emitter_) {
        emitter_->emit(core::Severity::Warning, "runtime", "dispatch",
                       "unknown method " + method);
    }
    fail("'" + method + "' wasn't found", core::config::kMethodNotFoundCode);
}

JsonValue RuntimeAgent::call_function_on(const JsonValue& params) {
    const JsonValue* declaration = params.find("functionDeclaration");
    if (!declaration || !declaration->is_string()) {
        fail("functionDeclaration must be a string");
    }

    int64_t context_id = 0;
    JSValue this_value = JS_UNDEFINED;
    const JsonValue* object_id = params.find("objectId");
    if (object_id && object_id->is_string() && !object_id->as_string().empty()) {
        ObjectEntry& target = state_->object(object_id->as_string());
        context_id = target.context_id;
        this_value = target.value;
    } else if (const JsonValue* ctx_id = params.find("executionContextId");
               ctx_id && ctx_id->is_number()) {
        context_id = static_cast<int64_t>(ctx_id->as_number());
    } else {
        fail("Either objectId or executionContextId must be specified");
    }

    ContextEntry& entry = state_->context(context_id);
    JSContext* ctx = entry.ctx;
    const JsonValue by_value = params.get("returnByValue");
    const JsonValue await_promise = params.get("awaitPromise");
    const DescribeMode mode = by_value.is_bool() && by_value.as_bool() ? DescribeMode::ByValue
                                                                        : DescribeMode::Reference;

    const std::string source = "(" + declaration->as_string() + "\n)";
    ScopedValue function(ctx, JS_Eval(ctx, source.data(), source.size(), kScriptName,
                                      JS_EVAL_TYPE_GLOBAL));
    if (JS_IsException(function.get())) {
        return state_->exception_response(entry, JS_GetException(ctx));
    }
    if (!JS_IsFunction(ctx, function.get())) {
        fail("Given expression does not evaluate to a function");
    }

    ArgumentList args(ctx);
    if (const JsonValue* arguments = params.find("arguments"); arguments && arguments->is_array()) {
        for (const auto& arg : arguments->as_array()) {
            args.values.push_back(state_->argument_to_js(context_id, ctx, arg));
        }
    }

    ScopedValue result(ctx, JS_Call(ctx, function.get(), this_value,
                                    static_cast<int>(args.values.size()), args.values.data()));
    if (JS_IsException(result.get())) {
        JSValue exception = JS_GetException(ctx);
        state_->drain_jobs();
        return state_->exception_response(entry, exception);
    }
    state_->drain_jobs();

    if (await_promise.is_bool() && await_promise.as_bool()) {
        const int promise_state = JS_PromiseState(ctx, result.get());
        if (promise_state == JS_PROMISE_PENDING) {
            fail("Promise was not settled");
        }
        if (promise_state == JS_PROMISE_REJECTED) {
            return state_->exception_response(entry, JS_PromiseResult(ctx, result.get()));
        }
        if (promise_state == JS_PROMISE_FULFILLED) {
            result.reset(JS_PromiseResult(ctx, result.get()));
        }
    }

    JsonValue response = JsonValue::object();
    response["result"] = state_->describe(context_id, entry, result.get(), mode);
    return response;
}

JsonValue RuntimeAgent::get_properties(const JsonValue& params) {
    const JsonValue* object_id = params.find("objectId");
    if (!object_id || !object_id->is_string()) {
        fail("objectId must be a string");
    }
    // Copied out: registering property values may rehash the registry.
    const ObjectEntry target = state_->object(object_id->as_string());
    ContextEntry& entry = state_->context(target.context_id);
    JSContext* ctx = entry.ctx;

    PropertyKeys keys(ctx, target.value, JS_GPN_STRING_MASK);
    if (!keys.ok()) {
        fail(pending_exception_text(ctx));
    }

    JsonValue list = JsonValue::array();
    for (JSAtom atom : keys.atoms()) {
        JSPropertyDescriptor desc;
        const int found = JS_GetOwnProperty(ctx, &desc, target.value, atom);
        if (found < 0) {
            JS_FreeValue(ctx, JS_GetException(ctx));
            continue;
        }
        if (found == 0) {
            continue;
        }
        ScopedValue value(ctx, desc.value);
        ScopedValue getter(ctx, desc.getter);
        ScopedValue setter(ctx, desc.setter);

        JsonValue property = JsonValue::object();
        property["name"] = atom_name(ctx, atom);
        property["enumerable"] = (desc.flags & JS_PROP_ENUMERABLE) != 0;
        property["configurable"] = (desc.flags & JS_PROP_CONFIGURABLE) != 0;
        if (desc.flags & JS_PROP_GETSET) {
            property["isAccessor"] = true;
        } else {
            property["writable"] = (desc.flags & JS_PROP_WRITABLE) != 0;
            property["value"] = state_->describe(target.context_id, entry, value.get(),
                                                 DescribeMode::Reference);
        }
        list.push_back(std::move(property));
    }

    JsonValue response = JsonValue::object();
    response["result"] = std::move(list);
    return response;
}

JsonValue RuntimeAgent::query_objects(const JsonValue& params) {
    const JsonValue* prototype_id = params.find("prototypeObjectId");
    if (!prototype_id || !prototype_id->is_string()) {
        fail("prototypeObjectId must be a string");
    }
    const ObjectEntry prototype = state_->object(prototype_id->as_string());
    ContextEntry& entry = state_->context(prototype.context_id);
    JSContext* ctx = entry.ctx;

    JSValueConst argv[1] = {prototype.value};
    ScopedValue found(ctx, JS_Call(ctx, entry.query, JS_UNDEFINED, 1, argv));
    if (JS_IsException(found.get())) {
        fail(pending_exception_text(ctx));
    }

    JsonValue response = JsonValue::object();
    response["objects"] = state_->describe(prototype.context_id, entry, found.get(),
                                           DescribeMode::Reference);
    return response;
}

JsonValue RuntimeAgent::release_object(const JsonValue& params) {
    const JsonValue* object_id = params.find("objectId");
    if (!object_id || !object_id->is_string()) {
        fail("objectId must be a string");
    }
    auto it = state_->objects.find(object_id->as_string());
    if (it == state_->objects.end()) {
        fail("Could not find object with given id");
    }
    JS_FreeValue(state_->context(it->second.context_id).ctx, it->second.value);
    state_->objects.erase(it);
    return JsonValue::object();
}

void RuntimeAgent::serve(rpc::MessagePipe& pipe) {
    while (true) {
        std::optional<rpc::Message> request;
        try {
            request = pipe.receive();
        } catch (const protocol::DecodeError& e) {
            if (emitter_) {
                emitter_->emit(core::Severity::Error, "runtime", "serve",
                               std::string("dropping undecodable frame: ") + e.what());
            }
            continue;
        }
        if (!request) {
            return;
        }
        if (request->kind != rpc::MessageKind::Request) {
            if (emitter_) {
                emitter_->emit(core::Severity::Warning, "runtime", "serve",
                               "ignoring non-request message " + std::to_string(request->id));
            }
            continue;
        }

        rpc::Message reply;
        try {
            reply = rpc::Message::response(request->id, dispatch(request->method, request->body));
        } catch (const core::ProtocolError& e) {
            reply = rpc::Message::error(request->id, e.code(), e.what());
        }
        if (!pipe.send(reply)) {
            return;
        }
    }
}

} // namespace tether::runtime
