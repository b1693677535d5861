/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */

#include "strand/core/runtime/Completion.h"
#include <sstream>

namespace Strand {

bool Completion::equals(const Completion& other) const {
    return type_ == other.type_ && target_ == other.target_ && value_.same_value(other.value_);
}

std::string Completion::debug_string() const {
    std::ostringstream oss;
    oss << "Completion{" << type_to_name(type_);
    if (type_ == Type::Break || type_ == Type::Continue) {
        if (!target_.empty()) {
            oss << " " << target_;
        }
    } else {
        oss << " " << value_.to_string();
    }
    oss << "}";
    return oss.str();
}

const char* Completion::type_to_name(Type type) {
    switch (type) {
        case Type::Normal:   return "normal";
        case Type::Return:   return "return";
        case Type::Break:    return "break";
        case Type::Continue: return "continue";
        case Type::Throw:    return "throw";
    }
    return "normal";
}

}
