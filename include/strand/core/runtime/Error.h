/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */

#ifndef STRAND_ERROR_H
#define STRAND_ERROR_H

#include "strand/core/runtime/Object.h"
#include <string>
#include <memory>

namespace Strand {

/**
 * Guest error object (Error, TypeError, RangeError, ReferenceError)
 */
class Error : public Object {
public:
    enum class Type {
        Error,
        TypeError,
        RangeError,
        ReferenceError
    };

private:
    Type error_type_;
    std::string name_;
    std::string message_;

public:
    Error(Type type, const std::string& message);
    virtual ~Error() = default;

    Type get_error_type() const { return error_type_; }
    const std::string& get_name() const { return name_; }
    const std::string& get_message() const { return message_; }

    std::string to_string() const override;

    static std::string type_to_name(Type type);

    static std::unique_ptr<Error> create_type_error(const std::string& message);
    static std::unique_ptr<Error> create_range_error(const std::string& message);
    static std::unique_ptr<Error> create_reference_error(const std::string& message);

    // Returns the error if value is an Error object of the given type
    static Error* as_error(const Value& value);
    static bool is_error_of_type(const Value& value, Type type);

private:
    void initialize_properties();
};

}

#endif
