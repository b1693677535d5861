/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */

#include "strand/core/runtime/Symbol.h"
#include <atomic>
#include <mutex>
#include <unordered_map>

namespace Strand {

const std::string Symbol::ITERATOR = "Symbol.iterator";
const std::string Symbol::TO_STRING_TAG = "Symbol.toStringTag";

namespace {

std::atomic<uint64_t> next_symbol_id{1};

}

Symbol::Symbol(const std::string& description, uint64_t id)
    : description_(description), id_(id) {
}

std::unique_ptr<Symbol> Symbol::create(const std::string& description) {
    return std::unique_ptr<Symbol>(new Symbol(description, next_symbol_id.fetch_add(1)));
}

Symbol* Symbol::get_well_known(const std::string& name) {
    static std::mutex registry_mutex;
    static std::unordered_map<std::string, std::unique_ptr<Symbol>> well_known_symbols;

    if (name != ITERATOR && name != TO_STRING_TAG) {
        return nullptr;
    }

    std::lock_guard<std::mutex> lock(registry_mutex);
    auto it = well_known_symbols.find(name);
    if (it != well_known_symbols.end()) {
        return it->second.get();
    }
    auto symbol = create(name);
    Symbol* raw = symbol.get();
    well_known_symbols.emplace(name, std::move(symbol));
    return raw;
}

std::string Symbol::to_string() const {
    return "Symbol(" + description_ + ")";
}

std::string Symbol::to_property_key() const {
    return "@@" + std::to_string(id_) + ":" + description_;
}

}
