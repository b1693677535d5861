/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */

#include "strand/core/runtime/Error.h"

namespace Strand {

//=============================================================================
// Error Implementation
//=============================================================================

Error::Error(Type type, const std::string& message)
    : Object(Object::ObjectType::Error), error_type_(type), name_(type_to_name(type)), message_(message) {
    initialize_properties();
}

void Error::initialize_properties() {
    set_property("name", Value(name_), static_cast<PropertyAttributes>(PropertyAttributes::Writable | PropertyAttributes::Configurable));

    // message stays absent when empty, like a constructor called without one
    if (!message_.empty()) {
        set_property("message", Value(message_), static_cast<PropertyAttributes>(PropertyAttributes::Writable | PropertyAttributes::Configurable));
    }
}

std::string Error::to_string() const {
    if (message_.empty()) {
        return name_;
    }
    return name_ + ": " + message_;
}

std::string Error::type_to_name(Type type) {
    switch (type) {
        case Type::Error:           return "Error";
        case Type::TypeError:       return "TypeError";
        case Type::RangeError:      return "RangeError";
        case Type::ReferenceError:  return "ReferenceError";
        default:                    return "Error";
    }
}

//=============================================================================
// Static Factory Methods
//=============================================================================

std::unique_ptr<Error> Error::create_type_error(const std::string& message) {
    return std::make_unique<Error>(Type::TypeError, message);
}

std::unique_ptr<Error> Error::create_range_error(const std::string& message) {
    return std::make_unique<Error>(Type::RangeError, message);
}

std::unique_ptr<Error> Error::create_reference_error(const std::string& message) {
    return std::make_unique<Error>(Type::ReferenceError, message);
}

Error* Error::as_error(const Value& value) {
    if (!value.is_object()) {
        return nullptr;
    }
    Object* obj = value.as_object();
    if (obj->get_type() != Object::ObjectType::Error) {
        return nullptr;
    }
    return dynamic_cast<Error*>(obj);
}

bool Error::is_error_of_type(const Value& value, Type type) {
    Error* error = as_error(value);
    return error && error->get_error_type() == type;
}

}
