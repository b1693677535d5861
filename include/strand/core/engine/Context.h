/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */

#ifndef STRAND_CONTEXT_H
#define STRAND_CONTEXT_H

#include "strand/core/runtime/Value.h"
#include "strand/core/runtime/Object.h"
#include "strand/core/runtime/Completion.h"
#include "strand/core/gc/Heap.h"
#include <unordered_map>
#include <string>
#include <memory>

namespace Strand {

class Engine;

/**
 * Execution context
 * Holds the pending exception, the receiver and active function of the
 * running native call, and the registry of intrinsic objects.
 */
class Context {
public:
    enum class State {
        Running,
        Thrown
    };

    /**
     * Installs receiver and active function for one native call and
     * restores the caller's on scope exit.
     */
    class CallScope {
    private:
        Context& ctx_;
        Value saved_this_;
        Function* saved_function_;

    public:
        CallScope(Context& ctx, Function* function, const Value& this_value);
        ~CallScope();

        CallScope(const CallScope&) = delete;
        CallScope& operator=(const CallScope&) = delete;
    };

private:
    State state_;
    Engine* engine_;
    Heap* heap_;

    Value this_value_;
    Function* active_function_;

    int execution_depth_;
    int max_execution_depth_;

    bool strict_mode_;

    Object* global_object_;
    std::unordered_map<std::string, Object*> built_in_objects_;

    Value current_exception_;
    bool has_exception_;

public:
    Context(Engine* engine, Heap* heap);
    ~Context() = default;

    Context(const Context&) = delete;
    Context& operator=(const Context&) = delete;

    State get_state() const { return state_; }
    Engine* get_engine() const { return engine_; }
    Heap* get_heap() const { return heap_; }

    bool is_strict_mode() const { return strict_mode_; }
    void set_strict_mode(bool strict) { strict_mode_ = strict; }

    Object* get_global_object() const { return global_object_; }
    void set_global_object(Object* global) { global_object_ = global; }

    const Value& get_this_value() const { return this_value_; }
    Object* get_this_binding() const { return this_value_.is_object() ? this_value_.as_object() : nullptr; }

    // The function object whose native code is currently running
    Function* get_active_function() const { return active_function_; }

    bool check_execution_depth() const { return execution_depth_ < max_execution_depth_; }
    int get_execution_depth() const { return execution_depth_; }
    void set_max_execution_depth(int depth) { max_execution_depth_ = depth; }

    bool has_exception() const { return has_exception_; }
    const Value& get_exception() const { return current_exception_; }
    void throw_exception(const Value& exception);
    void clear_exception();

    void throw_type_error(const std::string& message);
    void throw_range_error(const std::string& message);
    void throw_reference_error(const std::string& message);

    // Moves the pending exception into a throw completion
    Completion take_exception();
    // Raises the value of a throw completion, other kinds are ignored
    void rethrow(const Completion& completion);

    void register_built_in_object(const std::string& name, Object* object);
    Object* get_built_in_object(const std::string& name) const;

    std::string debug_string() const;

    template<typename T>
    T* track(std::unique_ptr<T> obj) {
        if (!obj) {
            return nullptr;
        }
        T* raw_ptr = obj.get();
        heap_->register_object(std::unique_ptr<Object>(obj.release()), sizeof(T));
        return raw_ptr;
    }
};

}

#endif
