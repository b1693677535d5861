/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */

#include "strand/core/runtime/Value.h"
#include "strand/core/runtime/Object.h"
#include "strand/core/runtime/Symbol.h"
#include <sstream>
#include <cmath>
#include <limits>

namespace Strand {


Value::Value(Object* obj) : number_(0.0) {
    if (!obj) {
        type_ = Type::Undefined;
        return;
    }
    type_ = Type::Object;
    object_ = obj;
}

Value::Value(Symbol* sym) : number_(0.0) {
    if (!sym) {
        type_ = Type::Undefined;
        return;
    }
    type_ = Type::Symbol;
    symbol_ = sym;
}

Value Value::null() {
    Value v;
    v.type_ = Type::Null;
    return v;
}

bool Value::is_function() const {
    return is_object() && object_->is_function();
}

Function* Value::as_function() const {
    return is_function() ? static_cast<Function*>(object_) : nullptr;
}

bool Value::to_boolean() const {
    switch (type_) {
        case Type::Undefined:
        case Type::Null:
            return false;
        case Type::Boolean:
            return boolean_;
        case Type::Number:
            return !std::isnan(number_) && number_ != 0.0;
        case Type::String:
            return !string_.empty();
        case Type::Symbol:
        case Type::Object:
            return true;
    }
    return false;
}

double Value::to_number() const {
    switch (type_) {
        case Type::Undefined:
            return std::numeric_limits<double>::quiet_NaN();
        case Type::Null:
            return 0.0;
        case Type::Boolean:
            return boolean_ ? 1.0 : 0.0;
        case Type::Number:
            return number_;
        case Type::String: {
            if (string_.empty()) return 0.0;
            std::istringstream iss(string_);
            double result = 0.0;
            iss >> result;
            if (iss.fail() || !iss.eof()) {
                return std::numeric_limits<double>::quiet_NaN();
            }
            return result;
        }
        case Type::Symbol:
        case Type::Object:
            return std::numeric_limits<double>::quiet_NaN();
    }
    return std::numeric_limits<double>::quiet_NaN();
}

std::string Value::to_string() const {
    switch (type_) {
        case Type::Undefined:
            return "undefined";
        case Type::Null:
            return "null";
        case Type::Boolean:
            return boolean_ ? "true" : "false";
        case Type::Number: {
            if (std::isnan(number_)) return "NaN";
            if (std::isinf(number_)) return number_ < 0 ? "-Infinity" : "Infinity";
            std::ostringstream oss;
            oss << number_;
            return oss.str();
        }
        case Type::String:
            return string_;
        case Type::Symbol:
            return symbol_->to_string();
        case Type::Object:
            return object_->to_string();
    }
    return "unknown";
}

std::string Value::to_property_key() const {
    if (is_symbol()) {
        return symbol_->to_property_key();
    }
    return to_string();
}

std::string Value::typeof_string() const {
    switch (type_) {
        case Type::Undefined: return "undefined";
        case Type::Null:      return "object";
        case Type::Boolean:   return "boolean";
        case Type::Number:    return "number";
        case Type::String:    return "string";
        case Type::Symbol:    return "symbol";
        case Type::Object:    return is_function() ? "function" : "object";
    }
    return "undefined";
}

bool Value::strict_equals(const Value& other) const {
    if (type_ != other.type_) return false;
    switch (type_) {
        case Type::Undefined:
        case Type::Null:
            return true;
        case Type::Boolean:
            return boolean_ == other.boolean_;
        case Type::Number:
            return number_ == other.number_;
        case Type::String:
            return string_ == other.string_;
        case Type::Symbol:
            return symbol_ == other.symbol_;
        case Type::Object:
            return object_ == other.object_;
    }
    return false;
}

bool Value::same_value(const Value& other) const {
    if (is_number() && other.is_number()) {
        if (is_nan() && other.is_nan()) return true;
        if (number_ == 0.0 && other.number_ == 0.0) {
            return std::signbit(number_) == std::signbit(other.number_);
        }
        return number_ == other.number_;
    }
    return strict_equals(other);
}

bool Value::same_value_zero(const Value& other) const {
    if (is_nan() && other.is_nan()) return true;
    return strict_equals(other);
}

}
