/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */

#include "strand/core/runtime/Object.h"
#include "strand/core/engine/Context.h"

namespace Strand {


PropertyDescriptor::PropertyDescriptor()
    : type_(Data), getter_(nullptr), setter_(nullptr), attributes_(PropertyAttributes::Default) {
}

PropertyDescriptor::PropertyDescriptor(const Value& value, PropertyAttributes attrs)
    : type_(Data), value_(value), getter_(nullptr), setter_(nullptr), attributes_(attrs) {
}

PropertyDescriptor::PropertyDescriptor(Object* getter, Object* setter, PropertyAttributes attrs)
    : type_(Accessor), getter_(getter), setter_(setter), attributes_(attrs) {
}


Object::Object(ObjectType type)
    : type_(type), prototype_(nullptr) {
}

Object::Object(Object* prototype, ObjectType type)
    : type_(type), prototype_(prototype) {
}

bool Object::has_property(const std::string& key) const {
    return find_property(key) != nullptr;
}

bool Object::has_own_property(const std::string& key) const {
    return properties_.find(key) != properties_.end();
}

const PropertyDescriptor* Object::find_property(const std::string& key) const {
    for (const Object* obj = this; obj; obj = obj->get_prototype()) {
        auto it = obj->properties_.find(key);
        if (it != obj->properties_.end()) {
            return &it->second;
        }
    }
    return nullptr;
}

Value Object::get(Context& ctx, const std::string& key, const Value& receiver) const {
    const PropertyDescriptor* desc = find_property(key);
    if (!desc) {
        return Value();
    }

    if (desc->is_data_descriptor()) {
        return desc->get_value();
    }

    Object* getter = desc->get_getter();
    if (!getter || !getter->is_function()) {
        return Value();
    }
    return static_cast<Function*>(getter)->call(ctx, {}, receiver);
}

Value Object::get(Context& ctx, const std::string& key) const {
    return get(ctx, key, Value(const_cast<Object*>(this)));
}

Value Object::get_own_property(const std::string& key) const {
    auto it = properties_.find(key);
    if (it == properties_.end() || !it->second.is_data_descriptor()) {
        return Value();
    }
    return it->second.get_value();
}

bool Object::set_property(const std::string& key, const Value& value, PropertyAttributes attrs) {
    auto it = properties_.find(key);
    if (it != properties_.end()) {
        if (it->second.is_data_descriptor() && !it->second.is_writable()) {
            return false;
        }
        it->second = PropertyDescriptor(value, attrs);
        return true;
    }

    properties_.emplace(key, PropertyDescriptor(value, attrs));
    property_insertion_order_.push_back(key);
    return true;
}

bool Object::define_accessor_property(const std::string& key, Object* getter, Object* setter,
                                      PropertyAttributes attrs) {
    auto it = properties_.find(key);
    if (it != properties_.end()) {
        if (!it->second.is_configurable()) {
            return false;
        }
        it->second = PropertyDescriptor(getter, setter, attrs);
        return true;
    }

    properties_.emplace(key, PropertyDescriptor(getter, setter, attrs));
    property_insertion_order_.push_back(key);
    return true;
}

std::vector<std::string> Object::get_own_property_keys() const {
    return property_insertion_order_;
}

bool Object::has_internal_property(const std::string& key) const {
    return internal_slots_.find(key) != internal_slots_.end();
}

Value Object::get_internal_property(const std::string& key) const {
    auto it = internal_slots_.find(key);
    if (it == internal_slots_.end()) {
        return Value();
    }
    return it->second;
}

void Object::set_internal_property(const std::string& key, const Value& value) {
    internal_slots_[key] = value;
}

std::string Object::to_string() const {
    return "[object Object]";
}


Function::Function(const std::string& name, NativeFunction native_fn, uint32_t arity)
    : Object(ObjectType::Function), name_(name), arity_(arity), native_fn_(std::move(native_fn)) {
    set_property("name", Value(name_), PropertyAttributes::Configurable);
    set_property("length", Value(static_cast<double>(arity_)), PropertyAttributes::Configurable);
}

Value Function::call(Context& ctx, const std::vector<Value>& args, Value this_value) {
    if (!ctx.check_execution_depth()) {
        ctx.throw_range_error("Maximum call stack size exceeded");
        return Value();
    }

    Value actual_this = this_value;
    if (!ctx.is_strict_mode() && this_value.is_nullish()) {
        Object* global = ctx.get_global_object();
        if (global) {
            actual_this = Value(global);
        }
    }

    Context::CallScope scope(ctx, this, actual_this);
    if (!native_fn_) {
        return Value();
    }
    return native_fn_(ctx, args);
}

std::string Function::to_string() const {
    return "function " + name_ + "() { [native code] }";
}


namespace ObjectFactory {

std::unique_ptr<Object> create_object(Object* prototype) {
    return std::make_unique<Object>(prototype);
}

std::unique_ptr<Function> create_native_function(const std::string& name,
                                                 Function::NativeFunction fn) {
    return std::make_unique<Function>(name, std::move(fn), 0);
}

std::unique_ptr<Function> create_native_function(const std::string& name,
                                                 Function::NativeFunction fn,
                                                 uint32_t arity) {
    return std::make_unique<Function>(name, std::move(fn), arity);
}

}

}
