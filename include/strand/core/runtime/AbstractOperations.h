/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */

#ifndef STRAND_ABSTRACT_OPERATIONS_H
#define STRAND_ABSTRACT_OPERATIONS_H

#include "strand/core/runtime/Value.h"
#include "strand/core/runtime/Object.h"
#include <string>
#include <vector>

namespace Strand {

class Context;

/**
 * Object model operations used by the runtime builtins.
 * On failure they raise on the context and return undefined / nullptr.
 */
namespace AbstractOperations {

    bool is_callable(const Value& value);

    // Get(O, P)
    Value get(Context& ctx, Object* object, const std::string& key);

    // GetV(V, P): undefined and null receivers are a TypeError
    Value get_v(Context& ctx, const Value& value, const std::string& key);

    // GetMethod(V, P): undefined for an absent method, TypeError when not callable
    Value get_method(Context& ctx, const Value& value, const std::string& key);

    // Call(F, V, args)
    Value call(Context& ctx, const Value& callable, const Value& this_value,
               const std::vector<Value>& args = {});

    // Invoke(V, P, args)
    Value invoke(Context& ctx, const Value& value, const std::string& key,
                 const std::vector<Value>& args = {});

    bool same_value(const Value& a, const Value& b);
    bool to_boolean(const Value& value);

    // ObjectCreate(proto, internalSlotsList): every listed slot starts undefined
    Object* object_create(Context& ctx, Object* prototype,
                          const std::vector<std::string>& internal_slots = {});

    Object* create_iter_result_object(Context& ctx, const Value& value, bool done);

    // Non-enumerable, writable, configurable own property
    void create_method_property(Object* object, const std::string& key, const Value& value);

}

}

#endif
