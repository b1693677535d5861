/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */

#ifndef STRAND_MAPSET_H
#define STRAND_MAPSET_H

#include "strand/core/runtime/Value.h"
#include "strand/core/runtime/Object.h"
#include <vector>
#include <utility>

namespace Strand {

class Context;

/**
 * Guest Map
 * Insertion-ordered entries compared with SameValueZero. Being a Map is
 * what carries the [[MapData]] state.
 */
class Map : public Object {
private:
    struct MapEntry {
        Value key;
        Value value;

        MapEntry(const Value& k, const Value& v) : key(k), value(v) {}
    };

    std::vector<MapEntry> entries_;

public:
    explicit Map(Object* prototype = nullptr);
    virtual ~Map() = default;

    using Object::get;

    bool has(const Value& key) const;
    Value get(const Value& key) const;
    void set(const Value& key, const Value& value);
    bool delete_key(const Value& key);

    size_t size() const { return entries_.size(); }
    bool empty() const { return entries_.empty(); }

    std::vector<Value> keys() const;
    std::vector<Value> values() const;
    std::vector<std::pair<Value, Value>> entries() const;

    std::string to_string() const override { return "[object Map]"; }

    // AddEntriesFromIterable into a fresh Map, nullptr if an exception is pending
    static Map* from_iterable(Context& ctx, const Value& iterable);

    static Value map_keys(Context& ctx, const std::vector<Value>& args);
    static Value map_values(Context& ctx, const std::vector<Value>& args);
    static Value map_entries(Context& ctx, const std::vector<Value>& args);

    static void setup_map_prototype(Context& ctx);

private:
    std::vector<MapEntry>::iterator find_entry(const Value& key);
    std::vector<MapEntry>::const_iterator find_entry(const Value& key) const;
};

/**
 * Guest Set
 * Insertion-ordered values compared with SameValueZero
 */
class Set : public Object {
private:
    std::vector<Value> values_;

public:
    explicit Set(Object* prototype = nullptr);
    virtual ~Set() = default;

    bool has(const Value& value) const;
    void add(const Value& value);

    size_t size() const { return values_.size(); }
    bool empty() const { return values_.empty(); }

    std::vector<Value> values() const { return values_; }

    std::string to_string() const override { return "[object Set]"; }

    static Set* from_iterable(Context& ctx, const Value& iterable);

    static Value set_values(Context& ctx, const std::vector<Value>& args);
    static Value set_entries(Context& ctx, const std::vector<Value>& args);

    static void setup_set_prototype(Context& ctx);

private:
    std::vector<Value>::iterator find_value(const Value& value);
    std::vector<Value>::const_iterator find_value(const Value& value) const;
};

}

#endif
