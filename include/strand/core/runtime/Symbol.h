/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */

#ifndef STRAND_SYMBOL_H
#define STRAND_SYMBOL_H

#include <string>
#include <memory>
#include <cstdint>

namespace Strand {

/**
 * Guest Symbol
 * Symbols are unique identifiers that can be used as object keys
 */
class Symbol {
private:
    std::string description_;
    uint64_t id_;

    Symbol(const std::string& description, uint64_t id);

public:
    ~Symbol() = default;

    static std::unique_ptr<Symbol> create(const std::string& description = "");

    // Well-known symbols live for the whole process
    static Symbol* get_well_known(const std::string& name);

    const std::string& get_description() const { return description_; }
    std::string to_string() const;
    std::string to_property_key() const;


    static const std::string ITERATOR;
    static const std::string TO_STRING_TAG;
};

}

#endif
