/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */

#include "strand/core/runtime/Iterator.h"
#include "strand/core/runtime/AbstractOperations.h"
#include "strand/core/runtime/MapSet.h"
#include "strand/core/runtime/Symbol.h"
#include "strand/core/engine/Context.h"

namespace Strand {

namespace {

std::string iterator_symbol_key() {
    return Symbol::get_well_known(Symbol::ITERATOR)->to_property_key();
}

}

const char* iteration_kind_to_string(IterationKind kind) {
    switch (kind) {
        case IterationKind::Keys:    return "keys";
        case IterationKind::Values:  return "values";
        case IterationKind::Entries: return "entries";
    }
    return "values";
}


Iterator::Iterator(Object* prototype, Kind kind)
    : Object(prototype, ObjectType::Iterator), iterator_kind_(kind) {
}

void Iterator::setup_iterator_prototype(Context& ctx) {
    Object* iterator_prototype = ctx.track(ObjectFactory::create_object(ctx.get_built_in_object("ObjectPrototype")));

    auto self_iterator_fn = ObjectFactory::create_native_function("[Symbol.iterator]",
        [](Context& ctx, const std::vector<Value>& args) -> Value {
            (void)args;
            return ctx.get_this_value();
        });
    AbstractOperations::create_method_property(iterator_prototype, iterator_symbol_key(),
                                               Value(ctx.track(std::move(self_iterator_fn))));
    ctx.register_built_in_object("IteratorPrototype", iterator_prototype);

    // next() of these two is supplied by the collection iterator implementation
    std::string tag_key = Symbol::get_well_known(Symbol::TO_STRING_TAG)->to_property_key();

    Object* map_iterator_prototype = ctx.track(ObjectFactory::create_object(iterator_prototype));
    map_iterator_prototype->set_property(tag_key, Value("Map Iterator"), PropertyAttributes::Configurable);
    ctx.register_built_in_object("MapIteratorPrototype", map_iterator_prototype);

    Object* set_iterator_prototype = ctx.track(ObjectFactory::create_object(iterator_prototype));
    set_iterator_prototype->set_property(tag_key, Value("Set Iterator"), PropertyAttributes::Configurable);
    ctx.register_built_in_object("SetIteratorPrototype", set_iterator_prototype);
}


ListIterator::ListIterator(Object* prototype, std::shared_ptr<const List> list)
    : Iterator(prototype, Kind::List), iterated_list_(std::move(list)), next_index_(0), iterator_next_(nullptr) {
}

Value ListIterator::next_method(Context& ctx, const std::vector<Value>& args) {
    (void)args;

    Object* this_obj = ctx.get_this_binding();
    ListIterator* iterator = nullptr;
    if (this_obj && this_obj->get_type() == ObjectType::Iterator) {
        iterator = dynamic_cast<ListIterator*>(this_obj);
    }

    if (!iterator || !iterator->iterator_next_) {
        ctx.throw_type_error("ListIterator next called on object without [[IteratorNext]]");
        return Value();
    }

    // Slot state alone does not prove ownership: the receiver must be the
    // iterator this very function object was created for.
    Function* active = ctx.get_active_function();
    if (!AbstractOperations::same_value(Value(active), Value(iterator->iterator_next_))) {
        ctx.throw_type_error("ListIterator next called on an iterator it does not belong to");
        return Value();
    }

    if (!iterator->iterated_list_) {
        ctx.throw_type_error("ListIterator next called on object without [[IteratedList]]");
        return Value();
    }

    const List& list = *iterator->iterated_list_;
    size_t index = iterator->next_index_;
    if (index >= list.size()) {
        return Value(AbstractOperations::create_iter_result_object(ctx, Value(), true));
    }

    iterator->next_index_ = index + 1;
    return Value(AbstractOperations::create_iter_result_object(ctx, list[index], false));
}


MapIterator::MapIterator(Object* prototype, Map* map, IterationKind kind)
    : Iterator(prototype, Kind::Map), map_(map), map_next_index_(0), map_iteration_kind_(kind) {
}

SetIterator::SetIterator(Object* prototype, Set* set, IterationKind kind)
    : Iterator(prototype, Kind::Set), iterated_set_(set), set_next_index_(0), set_iteration_kind_(kind) {
}


namespace IteratorOperations {

Object* get_iterator(Context& ctx, const Value& obj) {
    Value method = AbstractOperations::get_method(ctx, obj, iterator_symbol_key());
    if (ctx.has_exception()) {
        return nullptr;
    }

    if (method.is_undefined()) {
        ctx.throw_type_error(obj.to_string() + " is not iterable");
        return nullptr;
    }

    return get_iterator(ctx, obj, method);
}

Object* get_iterator(Context& ctx, const Value& obj, const Value& method) {
    Value iterator = AbstractOperations::call(ctx, method, obj);
    if (ctx.has_exception()) {
        return nullptr;
    }

    if (!iterator.is_object()) {
        ctx.throw_type_error("Result of the Symbol.iterator method is not an object");
        return nullptr;
    }

    return iterator.as_object();
}

namespace {

Object* require_result_object(Context& ctx, const Value& result) {
    if (ctx.has_exception()) {
        return nullptr;
    }

    if (!result.is_object()) {
        ctx.throw_type_error("Iterator result " + result.to_string() + " is not an object");
        return nullptr;
    }

    return result.as_object();
}

}

Object* iterator_next(Context& ctx, Object* iterator) {
    Value result = AbstractOperations::invoke(ctx, Value(iterator), "next");
    return require_result_object(ctx, result);
}

Object* iterator_next(Context& ctx, Object* iterator, const Value& value) {
    Value result = AbstractOperations::invoke(ctx, Value(iterator), "next", {value});
    return require_result_object(ctx, result);
}

bool iterator_complete(Context& ctx, Object& iter_result) {
    Value done = AbstractOperations::get(ctx, &iter_result, "done");
    if (ctx.has_exception()) {
        return false;
    }
    return AbstractOperations::to_boolean(done);
}

Value iterator_value(Context& ctx, Object& iter_result) {
    return AbstractOperations::get(ctx, &iter_result, "value");
}

StepResult iterator_step(Context& ctx, Object* iterator) {
    Object* result = iterator_next(ctx, iterator);
    if (!result) {
        return StepResult::exhausted();
    }

    bool done = iterator_complete(ctx, *result);
    if (ctx.has_exception() || done) {
        return StepResult::exhausted();
    }

    return StepResult::value_present(*result);
}

CloseDecision decide_close_outcome(const Completion& completion, const Completion& inner_result) {
    // An original throw is never masked by a failing cleanup
    if (completion.is_throw()) {
        return CloseDecision::KeepCompletion;
    }

    if (inner_result.is_throw()) {
        return CloseDecision::UseInnerResult;
    }

    if (!inner_result.get_value().is_object()) {
        return CloseDecision::ReturnResultNotObject;
    }

    return CloseDecision::KeepCompletion;
}

Completion iterator_close(Context& ctx, Object* iterator, const Completion& completion) {
    // A failure still pending from the consumer is the completion being closed with
    if (ctx.has_exception()) {
        return iterator_close(ctx, iterator, ctx.take_exception());
    }

    Value return_method = AbstractOperations::get_method(ctx, Value(iterator), "return");
    if (ctx.has_exception()) {
        return ctx.take_exception();
    }

    if (return_method.is_undefined()) {
        return completion;
    }

    Value inner_value = AbstractOperations::call(ctx, return_method, Value(iterator));
    Completion inner_result = ctx.has_exception() ? ctx.take_exception() : Completion::normal(inner_value);

    switch (decide_close_outcome(completion, inner_result)) {
        case CloseDecision::KeepCompletion:
            return completion;
        case CloseDecision::UseInnerResult:
            return inner_result;
        case CloseDecision::ReturnResultNotObject:
            ctx.throw_type_error("Iterator result " + inner_value.to_string() + " is not an object");
            return ctx.take_exception();
    }
    return completion;
}

Object* create_list_iterator(Context& ctx, std::vector<Value> list) {
    auto iterated_list = std::make_shared<const ListIterator::List>(std::move(list));
    ListIterator* iterator = ctx.track(std::make_unique<ListIterator>(
        ctx.get_built_in_object("IteratorPrototype"), std::move(iterated_list)));

    Function* next = ctx.track(ObjectFactory::create_native_function("next", ListIterator::next_method));
    iterator->bind_iterator_next(next);
    AbstractOperations::create_method_property(iterator, "next", Value(next));

    return iterator;
}

Object* create_map_iterator(Context& ctx, const Value& map, IterationKind kind) {
    if (!map.is_object()) {
        ctx.throw_type_error("Map Iterator source " + map.to_string() + " is not an object");
        return nullptr;
    }

    Object* source = map.as_object();
    Map* map_data = source->get_type() == Object::ObjectType::Map ? dynamic_cast<Map*>(source) : nullptr;
    if (!map_data) {
        ctx.throw_type_error("Map Iterator source " + source->to_string() + " has no [[MapData]]");
        return nullptr;
    }

    return ctx.track(std::make_unique<MapIterator>(ctx.get_built_in_object("MapIteratorPrototype"), map_data, kind));
}

Object* create_set_iterator(Context& ctx, const Value& set, IterationKind kind) {
    if (!set.is_object()) {
        ctx.throw_type_error("Set Iterator source " + set.to_string() + " is not an object");
        return nullptr;
    }

    Object* source = set.as_object();
    Set* set_data = source->get_type() == Object::ObjectType::Set ? dynamic_cast<Set*>(source) : nullptr;
    if (!set_data) {
        ctx.throw_type_error("Set Iterator source " + source->to_string() + " has no [[SetData]]");
        return nullptr;
    }

    return ctx.track(std::make_unique<SetIterator>(ctx.get_built_in_object("SetIteratorPrototype"), set_data, kind));
}

}


namespace IterableUtils {

bool is_iterable(Context& ctx, const Value& value) {
    if (!value.is_object()) {
        return false;
    }

    // A throwing @@iterator getter stays pending on the context
    Value method = AbstractOperations::get_v(ctx, value, iterator_symbol_key());
    if (ctx.has_exception()) {
        return false;
    }
    return AbstractOperations::is_callable(method);
}

namespace {

std::vector<Value> drain(Context& ctx, Object* iterator) {
    std::vector<Value> values;
    if (!iterator) {
        return values;
    }

    while (true) {
        StepResult next = IteratorOperations::iterator_step(ctx, iterator);
        if (ctx.has_exception()) {
            return {};
        }
        if (next.is_exhausted()) {
            break;
        }

        Value next_value = IteratorOperations::iterator_value(ctx, next.get_result());
        if (ctx.has_exception()) {
            return {};
        }
        values.push_back(next_value);
    }

    return values;
}

}

std::vector<Value> iterable_to_list(Context& ctx, const Value& items) {
    return drain(ctx, IteratorOperations::get_iterator(ctx, items));
}

std::vector<Value> iterable_to_list(Context& ctx, const Value& items, const Value& method) {
    return drain(ctx, IteratorOperations::get_iterator(ctx, items, method));
}

Completion for_of_loop(Context& ctx, const Value& iterable,
                       const std::function<Completion(const Value&)>& body) {
    Object* iterator = IteratorOperations::get_iterator(ctx, iterable);
    if (!iterator) {
        return ctx.take_exception();
    }

    Value last_value;
    while (true) {
        StepResult next = IteratorOperations::iterator_step(ctx, iterator);
        if (ctx.has_exception()) {
            return ctx.take_exception();
        }
        if (next.is_exhausted()) {
            return Completion::normal(last_value);
        }

        Value next_value = IteratorOperations::iterator_value(ctx, next.get_result());
        if (ctx.has_exception()) {
            return ctx.take_exception();
        }

        Completion result = body(next_value);
        if (ctx.has_exception()) {
            result = ctx.take_exception();
        }

        if (result.is_normal()) {
            last_value = result.get_value();
            continue;
        }
        if (result.is_continue() && result.get_target().empty()) {
            continue;
        }

        Completion closed = IteratorOperations::iterator_close(ctx, iterator, result);
        // An unlabelled break ends this loop only
        if (closed.is_break() && closed.get_target().empty()) {
            return Completion::normal(last_value);
        }
        return closed;
    }
}

}

}
