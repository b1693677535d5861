/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */

#ifndef STRAND_ITERATOR_H
#define STRAND_ITERATOR_H

#include "strand/core/runtime/Value.h"
#include "strand/core/runtime/Object.h"
#include "strand/core/runtime/Completion.h"
#include <memory>
#include <vector>
#include <functional>

namespace Strand {

class Context;
class Map;
class Set;

enum class IterationKind : uint8_t {
    Keys,
    Values,
    Entries
};

const char* iteration_kind_to_string(IterationKind kind);

/**
 * Base of the built-in iterator objects
 * Each subclass carries the typed state a generic object would keep in
 * internal slots.
 */
class Iterator : public Object {
public:
    enum class Kind {
        List,
        Map,
        Set
    };

private:
    Kind iterator_kind_;

public:
    Iterator(Object* prototype, Kind kind);
    virtual ~Iterator() = default;

    Kind get_iterator_kind() const { return iterator_kind_; }

    // %IteratorPrototype% with @@iterator returning this
    static void setup_iterator_prototype(Context& ctx);
};

/**
 * List Iterator
 * Adapts an immutable list of values to the iteration protocol
 */
class ListIterator : public Iterator {
public:
    using List = std::vector<Value>;

private:
    std::shared_ptr<const List> iterated_list_;
    size_t next_index_;
    Function* iterator_next_;

public:
    ListIterator(Object* prototype, std::shared_ptr<const List> list);

    const std::shared_ptr<const List>& get_iterated_list() const { return iterated_list_; }
    size_t get_next_index() const { return next_index_; }
    Function* get_iterator_next() const { return iterator_next_; }

    // [[IteratorNext]] is bound once, by create_list_iterator
    void bind_iterator_next(Function* next) { iterator_next_ = next; }

    static Value next_method(Context& ctx, const std::vector<Value>& args);

    std::string to_string() const override { return "[object List Iterator]"; }
};

/**
 * Map Iterator
 * Only the state is built here, next() belongs to %MapIteratorPrototype%
 */
class MapIterator : public Iterator {
private:
    Map* map_;
    size_t map_next_index_;
    IterationKind map_iteration_kind_;

public:
    MapIterator(Object* prototype, Map* map, IterationKind kind);

    Map* get_map() const { return map_; }
    size_t get_map_next_index() const { return map_next_index_; }
    IterationKind get_map_iteration_kind() const { return map_iteration_kind_; }

    std::string to_string() const override { return "[object Map Iterator]"; }
};

/**
 * Set Iterator
 * Only the state is built here, next() belongs to %SetIteratorPrototype%
 */
class SetIterator : public Iterator {
private:
    Set* iterated_set_;
    size_t set_next_index_;
    IterationKind set_iteration_kind_;

public:
    SetIterator(Object* prototype, Set* set, IterationKind kind);

    Set* get_iterated_set() const { return iterated_set_; }
    size_t get_set_next_index() const { return set_next_index_; }
    IterationKind get_set_iteration_kind() const { return set_iteration_kind_; }

    std::string to_string() const override { return "[object Set Iterator]"; }
};

/**
 * Outcome of IteratorStep: either exhausted or a result object to read
 * the value from. Check the context for a pending exception first.
 */
class StepResult {
private:
    Object* result_;

    explicit StepResult(Object* result) : result_(result) {}

public:
    static StepResult exhausted() { return StepResult(nullptr); }
    static StepResult value_present(Object& result) { return StepResult(&result); }

    bool is_exhausted() const { return result_ == nullptr; }
    bool has_value() const { return result_ != nullptr; }

    // Only valid when has_value()
    Object& get_result() const { return *result_; }
};

/**
 * Which completion IteratorClose reports once "return" has been called
 */
enum class CloseDecision {
    KeepCompletion,
    UseInnerResult,
    ReturnResultNotObject
};

namespace IteratorOperations {

    Object* get_iterator(Context& ctx, const Value& obj = Value());
    Object* get_iterator(Context& ctx, const Value& obj, const Value& method);

    Object* iterator_next(Context& ctx, Object* iterator);
    Object* iterator_next(Context& ctx, Object* iterator, const Value& value);

    bool iterator_complete(Context& ctx, Object& iter_result);
    Value iterator_value(Context& ctx, Object& iter_result);

    StepResult iterator_step(Context& ctx, Object* iterator);

    CloseDecision decide_close_outcome(const Completion& completion, const Completion& inner_result);

    // The returned completion is the whole outcome, no exception is left pending.
    // An exception pending on entry replaces completion as a throw completion.
    Completion iterator_close(Context& ctx, Object* iterator, const Completion& completion);

    Object* create_list_iterator(Context& ctx, std::vector<Value> list);

    Object* create_map_iterator(Context& ctx, const Value& map, IterationKind kind);
    Object* create_set_iterator(Context& ctx, const Value& set, IterationKind kind);

}

namespace IterableUtils {

    bool is_iterable(Context& ctx, const Value& value);

    // Drains to exhaustion, never closes the iterator
    std::vector<Value> iterable_to_list(Context& ctx, const Value& items);
    std::vector<Value> iterable_to_list(Context& ctx, const Value& items, const Value& method);

    // Runs body per value, closing the iterator on any exit other than exhaustion
    Completion for_of_loop(Context& ctx, const Value& iterable,
                           const std::function<Completion(const Value&)>& body);

}

}

#endif
