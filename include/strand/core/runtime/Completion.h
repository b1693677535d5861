/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */

#ifndef STRAND_COMPLETION_H
#define STRAND_COMPLETION_H

#include "strand/core/runtime/Value.h"
#include <string>

namespace Strand {

/**
 * Completion record
 * Carries the outcome of a statement or of protocol cleanup as plain data,
 * so that competing outcomes can be compared without nesting handlers.
 */
class Completion {
public:
    enum class Type : uint8_t {
        Normal,
        Return,
        Break,
        Continue,
        Throw
    };

private:
    Type type_;
    Value value_;
    std::string target_;

    Completion(Type type, const Value& value, const std::string& target)
        : type_(type), value_(value), target_(target) {}

public:
    Completion() : type_(Type::Normal) {}

    static Completion normal(const Value& value = Value()) { return Completion(Type::Normal, value, ""); }
    static Completion return_completion(const Value& value) { return Completion(Type::Return, value, ""); }
    static Completion break_completion(const std::string& target = "") { return Completion(Type::Break, Value(), target); }
    static Completion continue_completion(const std::string& target = "") { return Completion(Type::Continue, Value(), target); }
    static Completion throw_completion(const Value& value) { return Completion(Type::Throw, value, ""); }

    Type get_type() const { return type_; }
    const Value& get_value() const { return value_; }
    const std::string& get_target() const { return target_; }

    bool is_normal() const { return type_ == Type::Normal; }
    bool is_abrupt() const { return type_ != Type::Normal; }
    bool is_return() const { return type_ == Type::Return; }
    bool is_break() const { return type_ == Type::Break; }
    bool is_continue() const { return type_ == Type::Continue; }
    bool is_throw() const { return type_ == Type::Throw; }

    // Same kind, same target and SameValue payload
    bool equals(const Completion& other) const;

    std::string debug_string() const;

    static const char* type_to_name(Type type);
};

}

#endif
