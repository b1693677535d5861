/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */

#include "strand/core/gc/Heap.h"
#include <sstream>

namespace Strand {

Heap::~Heap() {
    release_all();
}

Object* Heap::register_object(std::unique_ptr<Object> obj, size_t size) {
    if (!obj) {
        return nullptr;
    }

    Object* raw_ptr = obj.get();
    objects_.push_back(std::move(obj));

    stats_.total_allocations++;
    stats_.bytes_allocated += size;
    if (objects_.size() > stats_.peak_object_count) {
        stats_.peak_object_count = objects_.size();
    }
    return raw_ptr;
}

std::string Heap::get_statistics_string() const {
    std::ostringstream oss;
    oss << "objects=" << objects_.size()
        << " allocations=" << stats_.total_allocations
        << " bytes=" << stats_.bytes_allocated
        << " peak=" << stats_.peak_object_count;
    return oss.str();
}

void Heap::release_all() {
    // Reverse allocation order so prototypes outlive their instances
    while (!objects_.empty()) {
        objects_.pop_back();
    }
}

}
