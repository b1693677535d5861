/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */

#include "strand/core/engine/Context.h"
#include "strand/core/runtime/Error.h"
#include <sstream>

namespace Strand {


Context::CallScope::CallScope(Context& ctx, Function* function, const Value& this_value)
    : ctx_(ctx), saved_this_(ctx.this_value_), saved_function_(ctx.active_function_) {
    ctx_.this_value_ = this_value;
    ctx_.active_function_ = function;
    ctx_.execution_depth_++;
}

Context::CallScope::~CallScope() {
    ctx_.execution_depth_--;
    ctx_.active_function_ = saved_function_;
    ctx_.this_value_ = saved_this_;
}


Context::Context(Engine* engine, Heap* heap)
    : state_(State::Running), engine_(engine), heap_(heap),
      active_function_(nullptr), execution_depth_(0), max_execution_depth_(500),
      strict_mode_(false), global_object_(nullptr), has_exception_(false) {
}

void Context::throw_exception(const Value& exception) {
    current_exception_ = exception;
    has_exception_ = true;
    state_ = State::Thrown;
}

void Context::clear_exception() {
    current_exception_ = Value();
    has_exception_ = false;
    state_ = State::Running;
}

namespace {

template<typename T>
Value make_error(Context& ctx, std::unique_ptr<T> error, const char* prototype_name) {
    error->set_prototype(ctx.get_built_in_object(prototype_name));
    return Value(ctx.track(std::move(error)));
}

}

void Context::throw_type_error(const std::string& message) {
    throw_exception(make_error(*this, Error::create_type_error(message), "TypeErrorPrototype"));
}

void Context::throw_range_error(const std::string& message) {
    throw_exception(make_error(*this, Error::create_range_error(message), "RangeErrorPrototype"));
}

void Context::throw_reference_error(const std::string& message) {
    throw_exception(make_error(*this, Error::create_reference_error(message), "ReferenceErrorPrototype"));
}

Completion Context::take_exception() {
    Completion completion = Completion::throw_completion(current_exception_);
    clear_exception();
    return completion;
}

void Context::rethrow(const Completion& completion) {
    if (completion.is_throw()) {
        throw_exception(completion.get_value());
    }
}

void Context::register_built_in_object(const std::string& name, Object* object) {
    built_in_objects_[name] = object;
}

Object* Context::get_built_in_object(const std::string& name) const {
    auto it = built_in_objects_.find(name);
    return it != built_in_objects_.end() ? it->second : nullptr;
}

std::string Context::debug_string() const {
    std::ostringstream oss;
    oss << "Context{state=" << (state_ == State::Thrown ? "thrown" : "running")
        << ", depth=" << execution_depth_
        << ", strict=" << (strict_mode_ ? "true" : "false");
    if (has_exception_) {
        oss << ", exception=" << current_exception_.to_string();
    }
    oss << "}";
    return oss.str();
}

}
