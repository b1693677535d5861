/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */

#include "strand/core/runtime/MapSet.h"
#include "strand/core/runtime/AbstractOperations.h"
#include "strand/core/runtime/Iterator.h"
#include "strand/core/runtime/Symbol.h"
#include "strand/core/engine/Context.h"
#include <algorithm>

namespace Strand {

namespace {

// -0 keys are stored as +0
Value normalize_key(const Value& key) {
    if (key.is_number() && key.as_number() == 0.0) {
        return Value(0.0);
    }
    return key;
}

// Closes the iterator with the pending exception and leaves the outcome pending
void close_with_pending_exception(Context& ctx, Object* iterator) {
    Completion thrown = ctx.take_exception();
    ctx.rethrow(IteratorOperations::iterator_close(ctx, iterator, thrown));
}

void define_builtin_method(Object* prototype, const std::string& key, Function* fn) {
    AbstractOperations::create_method_property(prototype, key, Value(fn));
}

}

//=============================================================================
// Map Implementation
//=============================================================================

Map::Map(Object* prototype) : Object(prototype, ObjectType::Map) {
}

bool Map::has(const Value& key) const {
    return find_entry(key) != entries_.end();
}

Value Map::get(const Value& key) const {
    auto it = find_entry(key);
    return it != entries_.end() ? it->value : Value();
}

void Map::set(const Value& key, const Value& value) {
    auto it = find_entry(key);
    if (it != entries_.end()) {
        it->value = value;
        return;
    }
    entries_.emplace_back(normalize_key(key), value);
}

bool Map::delete_key(const Value& key) {
    auto it = find_entry(key);
    if (it == entries_.end()) {
        return false;
    }
    entries_.erase(it);
    return true;
}

std::vector<Value> Map::keys() const {
    std::vector<Value> result;
    result.reserve(entries_.size());
    for (const auto& entry : entries_) {
        result.push_back(entry.key);
    }
    return result;
}

std::vector<Value> Map::values() const {
    std::vector<Value> result;
    result.reserve(entries_.size());
    for (const auto& entry : entries_) {
        result.push_back(entry.value);
    }
    return result;
}

std::vector<std::pair<Value, Value>> Map::entries() const {
    std::vector<std::pair<Value, Value>> result;
    result.reserve(entries_.size());
    for (const auto& entry : entries_) {
        result.emplace_back(entry.key, entry.value);
    }
    return result;
}

std::vector<Map::MapEntry>::iterator Map::find_entry(const Value& key) {
    return std::find_if(entries_.begin(), entries_.end(),
        [&key](const MapEntry& entry) { return entry.key.same_value_zero(key); });
}

std::vector<Map::MapEntry>::const_iterator Map::find_entry(const Value& key) const {
    return std::find_if(entries_.begin(), entries_.end(),
        [&key](const MapEntry& entry) { return entry.key.same_value_zero(key); });
}

Map* Map::from_iterable(Context& ctx, const Value& iterable) {
    Map* map = ctx.track(std::make_unique<Map>(ctx.get_built_in_object("MapPrototype")));
    if (iterable.is_nullish()) {
        return map;
    }

    Object* iterator = IteratorOperations::get_iterator(ctx, iterable);
    if (!iterator) {
        return nullptr;
    }

    while (true) {
        StepResult next = IteratorOperations::iterator_step(ctx, iterator);
        if (ctx.has_exception()) {
            return nullptr;
        }
        if (next.is_exhausted()) {
            return map;
        }

        Value item = IteratorOperations::iterator_value(ctx, next.get_result());
        if (ctx.has_exception()) {
            return nullptr;
        }

        if (!item.is_object()) {
            ctx.throw_type_error("Iterator value " + item.to_string() + " is not an entry object");
            close_with_pending_exception(ctx, iterator);
            return nullptr;
        }

        Value key = AbstractOperations::get(ctx, item.as_object(), "0");
        if (ctx.has_exception()) {
            close_with_pending_exception(ctx, iterator);
            return nullptr;
        }

        Value value = AbstractOperations::get(ctx, item.as_object(), "1");
        if (ctx.has_exception()) {
            close_with_pending_exception(ctx, iterator);
            return nullptr;
        }

        map->set(key, value);
    }
}

Value Map::map_keys(Context& ctx, const std::vector<Value>& args) {
    (void)args;
    return Value(IteratorOperations::create_map_iterator(ctx, ctx.get_this_value(), IterationKind::Keys));
}

Value Map::map_values(Context& ctx, const std::vector<Value>& args) {
    (void)args;
    return Value(IteratorOperations::create_map_iterator(ctx, ctx.get_this_value(), IterationKind::Values));
}

Value Map::map_entries(Context& ctx, const std::vector<Value>& args) {
    (void)args;
    return Value(IteratorOperations::create_map_iterator(ctx, ctx.get_this_value(), IterationKind::Entries));
}

void Map::setup_map_prototype(Context& ctx) {
    Object* map_prototype = ctx.track(ObjectFactory::create_object(ctx.get_built_in_object("ObjectPrototype")));

    Function* keys_fn = ctx.track(ObjectFactory::create_native_function("keys", map_keys));
    Function* values_fn = ctx.track(ObjectFactory::create_native_function("values", map_values));
    Function* entries_fn = ctx.track(ObjectFactory::create_native_function("entries", map_entries));

    define_builtin_method(map_prototype, "keys", keys_fn);
    define_builtin_method(map_prototype, "values", values_fn);
    define_builtin_method(map_prototype, "entries", entries_fn);
    // Map.prototype[@@iterator] is the entries function itself
    define_builtin_method(map_prototype, Symbol::get_well_known(Symbol::ITERATOR)->to_property_key(), entries_fn);

    map_prototype->set_property(Symbol::get_well_known(Symbol::TO_STRING_TAG)->to_property_key(),
                                Value("Map"), PropertyAttributes::Configurable);

    ctx.register_built_in_object("MapPrototype", map_prototype);
}

//=============================================================================
// Set Implementation
//=============================================================================

Set::Set(Object* prototype) : Object(prototype, ObjectType::Set) {
}

bool Set::has(const Value& value) const {
    return find_value(value) != values_.end();
}

void Set::add(const Value& value) {
    if (find_value(value) == values_.end()) {
        values_.push_back(normalize_key(value));
    }
}

std::vector<Value>::iterator Set::find_value(const Value& value) {
    return std::find_if(values_.begin(), values_.end(),
        [&value](const Value& v) { return v.same_value_zero(value); });
}

std::vector<Value>::const_iterator Set::find_value(const Value& value) const {
    return std::find_if(values_.begin(), values_.end(),
        [&value](const Value& v) { return v.same_value_zero(value); });
}

Set* Set::from_iterable(Context& ctx, const Value& iterable) {
    Set* set = ctx.track(std::make_unique<Set>(ctx.get_built_in_object("SetPrototype")));
    if (iterable.is_nullish()) {
        return set;
    }

    Object* iterator = IteratorOperations::get_iterator(ctx, iterable);
    if (!iterator) {
        return nullptr;
    }

    while (true) {
        StepResult next = IteratorOperations::iterator_step(ctx, iterator);
        if (ctx.has_exception()) {
            return nullptr;
        }
        if (next.is_exhausted()) {
            return set;
        }

        Value value = IteratorOperations::iterator_value(ctx, next.get_result());
        if (ctx.has_exception()) {
            return nullptr;
        }
        set->add(value);
    }
}

Value Set::set_values(Context& ctx, const std::vector<Value>& args) {
    (void)args;
    return Value(IteratorOperations::create_set_iterator(ctx, ctx.get_this_value(), IterationKind::Values));
}

Value Set::set_entries(Context& ctx, const std::vector<Value>& args) {
    (void)args;
    return Value(IteratorOperations::create_set_iterator(ctx, ctx.get_this_value(), IterationKind::Entries));
}

void Set::setup_set_prototype(Context& ctx) {
    Object* set_prototype = ctx.track(ObjectFactory::create_object(ctx.get_built_in_object("ObjectPrototype")));

    Function* values_fn = ctx.track(ObjectFactory::create_native_function("values", set_values));
    Function* entries_fn = ctx.track(ObjectFactory::create_native_function("entries", set_entries));

    define_builtin_method(set_prototype, "values", values_fn);
    // keys and @@iterator share the values function
    define_builtin_method(set_prototype, "keys", values_fn);
    define_builtin_method(set_prototype, "entries", entries_fn);
    define_builtin_method(set_prototype, Symbol::get_well_known(Symbol::ITERATOR)->to_property_key(), values_fn);

    set_prototype->set_property(Symbol::get_well_known(Symbol::TO_STRING_TAG)->to_property_key(),
                                Value("Set"), PropertyAttributes::Configurable);

    ctx.register_built_in_object("SetPrototype", set_prototype);
}

}
