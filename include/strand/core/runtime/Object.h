/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */

#ifndef STRAND_OBJECT_H
#define STRAND_OBJECT_H

#include "strand/core/runtime/Value.h"
#include <unordered_map>
#include <vector>
#include <string>
#include <memory>
#include <functional>

namespace Strand {

class Context;
class Function;

/**
 * Property descriptor for data and accessor properties
 */
class PropertyDescriptor {
public:
    enum Type {
        Data,
        Accessor
    };

private:
    Type type_;
    Value value_;
    Object* getter_;
    Object* setter_;
    PropertyAttributes attributes_;

public:
    PropertyDescriptor();
    explicit PropertyDescriptor(const Value& value, PropertyAttributes attrs = PropertyAttributes::Default);
    PropertyDescriptor(Object* getter, Object* setter, PropertyAttributes attrs = PropertyAttributes::Default);

    Type get_type() const { return type_; }
    bool is_data_descriptor() const { return type_ == Data; }
    bool is_accessor_descriptor() const { return type_ == Accessor; }

    const Value& get_value() const { return value_; }
    void set_value(const Value& value) { value_ = value; }

    Object* get_getter() const { return getter_; }
    Object* get_setter() const { return setter_; }

    PropertyAttributes get_attributes() const { return attributes_; }
    bool is_writable() const { return attributes_ & PropertyAttributes::Writable; }
    bool is_enumerable() const { return attributes_ & PropertyAttributes::Enumerable; }
    bool is_configurable() const { return attributes_ & PropertyAttributes::Configurable; }
};

/**
 * Guest object
 * Ordinary properties follow the prototype chain. Internal slots are a
 * separate string-keyed bag that ordinary property lookup never sees.
 */
class Object {
public:
    enum class ObjectType : uint8_t {
        Ordinary,
        Function,
        Error,
        Map,
        Set,
        Iterator
    };

private:
    ObjectType type_;
    Object* prototype_;

    std::unordered_map<std::string, PropertyDescriptor> properties_;
    std::vector<std::string> property_insertion_order_;

    std::unordered_map<std::string, Value> internal_slots_;

public:
    Object(ObjectType type = ObjectType::Ordinary);
    explicit Object(Object* prototype, ObjectType type = ObjectType::Ordinary);
    virtual ~Object() = default;

    Object(const Object& other) = delete;
    Object& operator=(const Object& other) = delete;

    ObjectType get_type() const { return type_; }
    bool is_function() const { return type_ == ObjectType::Function; }

    Object* get_prototype() const { return prototype_; }
    void set_prototype(Object* prototype) { prototype_ = prototype; }

    bool has_property(const std::string& key) const;
    bool has_own_property(const std::string& key) const;

    // Looks up a property along the prototype chain, nullptr if absent
    const PropertyDescriptor* find_property(const std::string& key) const;

    // [[Get]]: data properties by value, accessors by calling the getter with receiver
    Value get(Context& ctx, const std::string& key, const Value& receiver) const;
    Value get(Context& ctx, const std::string& key) const;

    // Own data property by value, accessors yield undefined
    Value get_own_property(const std::string& key) const;

    bool set_property(const std::string& key, const Value& value, PropertyAttributes attrs = PropertyAttributes::Default);
    bool define_accessor_property(const std::string& key, Object* getter, Object* setter,
                                  PropertyAttributes attrs = static_cast<PropertyAttributes>(PropertyAttributes::Enumerable | PropertyAttributes::Configurable));

    std::vector<std::string> get_own_property_keys() const;
    size_t property_count() const { return properties_.size(); }

    bool has_internal_property(const std::string& key) const;
    Value get_internal_property(const std::string& key) const;
    void set_internal_property(const std::string& key, const Value& value);

    virtual std::string to_string() const;
};

/**
 * Native function object
 * The receiver is passed through the context, see Context::get_this_value
 */
class Function : public Object {
public:
    using NativeFunction = std::function<Value(Context&, const std::vector<Value>&)>;

private:
    std::string name_;
    uint32_t arity_;
    NativeFunction native_fn_;

public:
    Function(const std::string& name, NativeFunction native_fn, uint32_t arity = 0);
    virtual ~Function() = default;

    const std::string& get_name() const { return name_; }
    uint32_t get_arity() const { return arity_; }

    virtual Value call(Context& ctx, const std::vector<Value>& args, Value this_value = Value());

    std::string to_string() const override;
};

namespace ObjectFactory {
    std::unique_ptr<Object> create_object(Object* prototype = nullptr);
    std::unique_ptr<Function> create_native_function(const std::string& name,
                                                     Function::NativeFunction fn);
    std::unique_ptr<Function> create_native_function(const std::string& name,
                                                     Function::NativeFunction fn,
                                                     uint32_t arity);
}

}

#endif
