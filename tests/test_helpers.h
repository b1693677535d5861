/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */

#ifndef STRAND_TEST_HELPERS_H
#define STRAND_TEST_HELPERS_H

#include <gtest/gtest.h>

#include <memory>
#include <string>
#include <vector>

#include "strand/core/engine/Engine.h"
#include "strand/core/runtime/AbstractOperations.h"
#include "strand/core/runtime/Error.h"
#include "strand/core/runtime/Iterator.h"
#include "strand/core/runtime/Symbol.h"

using namespace Strand;

// Engine-backed fixture with builders for hand-written iterables
class RuntimeTest : public ::testing::Test {
   protected:
    void SetUp() override {
        ASSERT_TRUE(engine.initialize());
        ctx = &engine.get_global_context();
    }

    Engine engine;
    Context* ctx = nullptr;

    static std::string iterator_key() {
        return Symbol::get_well_known(Symbol::ITERATOR)->to_property_key();
    }

    Object* object() {
        return ctx->track(ObjectFactory::create_object(ctx->get_built_in_object("ObjectPrototype")));
    }

    Function* native(const std::string& name, Function::NativeFunction fn, uint32_t arity = 0) {
        return ctx->track(ObjectFactory::create_native_function(name, std::move(fn), arity));
    }

    // Object whose @@iterator hands out a fresh list iterator over values
    Object* list_iterable(const std::vector<Value>& values) {
        Object* iterable = object();
        iterable->set_property(iterator_key(), Value(native("[Symbol.iterator]",
            [values](Context& ctx, const std::vector<Value>&) -> Value {
                return Value(IteratorOperations::create_list_iterator(ctx, values));
            })));
        return iterable;
    }

    // Object whose @@iterator always returns the given iterator
    Object* iterable_of(Object* iterator) {
        Object* iterable = object();
        iterable->set_property(iterator_key(), Value(native("[Symbol.iterator]",
            [iterator](Context&, const std::vector<Value>&) -> Value {
                return Value(iterator);
            })));
        return iterable;
    }

    // Iterator with hand-written next and optional return
    Object* scripted_iterator(Function::NativeFunction next, Function::NativeFunction ret = nullptr) {
        Object* iterator = object();
        iterator->set_property("next", Value(native("next", std::move(next))));
        if (ret) {
            iterator->set_property("return", Value(native("return", std::move(ret))));
        }
        return iterator;
    }

    // Iterator yielding 0..count-1 and counting return() calls
    Object* counting_iterator(int count, int& return_calls) {
        auto index = std::make_shared<int>(0);
        return scripted_iterator(
            [index, count](Context& ctx, const std::vector<Value>&) -> Value {
                if (*index >= count) {
                    return Value(AbstractOperations::create_iter_result_object(ctx, Value(), true));
                }
                return Value(AbstractOperations::create_iter_result_object(ctx, Value((*index)++), false));
            },
            [&return_calls](Context& ctx, const std::vector<Value>&) -> Value {
                return_calls++;
                return Value(AbstractOperations::create_iter_result_object(ctx, Value(), true));
            });
    }

    Value error_value(const std::string& tag) {
        Object* error = object();
        error->set_property("tag", Value(tag));
        return Value(error);
    }

    bool pending_type_error() const {
        return ctx->has_exception() && Error::is_error_of_type(ctx->get_exception(), Error::Type::TypeError);
    }
};

#endif
