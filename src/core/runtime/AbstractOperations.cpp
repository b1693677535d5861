/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */

#include "strand/core/runtime/AbstractOperations.h"
#include "strand/core/engine/Context.h"

namespace Strand {

namespace AbstractOperations {

bool is_callable(const Value& value) {
    return value.is_function();
}

Value get(Context& ctx, Object* object, const std::string& key) {
    if (!object) {
        ctx.throw_type_error("Cannot read properties of undefined (reading '" + key + "')");
        return Value();
    }
    return object->get(ctx, key, Value(object));
}

Value get_v(Context& ctx, const Value& value, const std::string& key) {
    if (value.is_nullish()) {
        ctx.throw_type_error("Cannot read properties of " + value.to_string() + " (reading '" + key + "')");
        return Value();
    }

    if (!value.is_object()) {
        // Primitive wrappers are not modelled, primitives expose no properties
        return Value();
    }

    return value.as_object()->get(ctx, key, value);
}

Value get_method(Context& ctx, const Value& value, const std::string& key) {
    Value func = get_v(ctx, value, key);
    if (ctx.has_exception()) {
        return Value();
    }

    if (func.is_nullish()) {
        return Value();
    }

    if (!is_callable(func)) {
        ctx.throw_type_error("Property '" + key + "' is not a function (" + func.typeof_string() + ")");
        return Value();
    }

    return func;
}

Value call(Context& ctx, const Value& callable, const Value& this_value, const std::vector<Value>& args) {
    if (!is_callable(callable)) {
        ctx.throw_type_error(callable.to_string() + " is not a function");
        return Value();
    }
    return callable.as_function()->call(ctx, args, this_value);
}

Value invoke(Context& ctx, const Value& value, const std::string& key, const std::vector<Value>& args) {
    Value func = get_v(ctx, value, key);
    if (ctx.has_exception()) {
        return Value();
    }

    if (!is_callable(func)) {
        ctx.throw_type_error("Property '" + key + "' is not a function (" + func.typeof_string() + ")");
        return Value();
    }

    return func.as_function()->call(ctx, args, value);
}

bool same_value(const Value& a, const Value& b) {
    return a.same_value(b);
}

bool to_boolean(const Value& value) {
    return value.to_boolean();
}

Object* object_create(Context& ctx, Object* prototype, const std::vector<std::string>& internal_slots) {
    Object* obj = ctx.track(ObjectFactory::create_object(prototype));
    for (const auto& slot : internal_slots) {
        obj->set_internal_property(slot, Value());
    }
    return obj;
}

Object* create_iter_result_object(Context& ctx, const Value& value, bool done) {
    Object* result = object_create(ctx, ctx.get_built_in_object("ObjectPrototype"));
    result->set_property("value", value);
    result->set_property("done", Value(done));
    return result;
}

void create_method_property(Object* object, const std::string& key, const Value& value) {
    object->set_property(key, value,
        static_cast<PropertyAttributes>(PropertyAttributes::Writable | PropertyAttributes::Configurable));
}

}

}
