/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */

#ifndef STRAND_VALUE_H
#define STRAND_VALUE_H

#include "strand/core/runtime/Types.h"
#include <string>
#include <cstdint>

namespace Strand {

/**
 * Guest language value
 * Primitives are stored inline, objects as non-owning handles into the heap
 */
class Value {
public:
    enum class Type : uint8_t {
        Undefined,
        Null,
        Boolean,
        Number,
        String,
        Symbol,
        Object
    };

private:
    Type type_;
    union {
        bool boolean_;
        double number_;
        Object* object_;
        Symbol* symbol_;
    };
    std::string string_;

public:
    Value() : type_(Type::Undefined), number_(0.0) {}
    Value(bool b) : type_(Type::Boolean), number_(0.0) { boolean_ = b; }
    Value(double d) : type_(Type::Number), number_(d) {}
    Value(int i) : type_(Type::Number), number_(static_cast<double>(i)) {}
    Value(const std::string& str) : type_(Type::String), number_(0.0), string_(str) {}
    Value(const char* str) : type_(Type::String), number_(0.0), string_(str) {}
    Value(Object* obj);
    Value(Symbol* sym);

    static Value null();

    Type get_type() const { return type_; }

    bool is_undefined() const { return type_ == Type::Undefined; }
    bool is_null() const { return type_ == Type::Null; }
    bool is_nullish() const { return type_ == Type::Undefined || type_ == Type::Null; }
    bool is_boolean() const { return type_ == Type::Boolean; }
    bool is_number() const { return type_ == Type::Number; }
    bool is_nan() const { return type_ == Type::Number && number_ != number_; }
    bool is_string() const { return type_ == Type::String; }
    bool is_symbol() const { return type_ == Type::Symbol; }
    bool is_object() const { return type_ == Type::Object; }
    bool is_function() const;

    bool as_boolean() const { return boolean_; }
    double as_number() const { return number_; }
    const std::string& as_string() const { return string_; }
    Symbol* as_symbol() const { return symbol_; }
    Object* as_object() const { return object_; }
    Function* as_function() const;

    bool to_boolean() const;
    double to_number() const;
    std::string to_string() const;
    std::string to_property_key() const;
    std::string typeof_string() const;

    bool strict_equals(const Value& other) const;
    bool same_value(const Value& other) const;
    bool same_value_zero(const Value& other) const;
};

}

#endif
