/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */

#ifndef STRAND_HEAP_H
#define STRAND_HEAP_H

#include "strand/core/runtime/Object.h"
#include <vector>
#include <memory>
#include <string>
#include <cstdint>

namespace Strand {

/**
 * Object heap
 * Owns every object handed to it and releases them together on teardown.
 * Values and internal slots refer to heap objects by raw pointer.
 *
 * Nothing is reclaimed before release_all(): every iterator result object
 * stays allocated, so memory grows with the number of steps taken in one
 * engine lifetime. Long-running hosts bound it by cycling the Engine.
 */
class Heap {
public:
    struct Statistics {
        uint64_t total_allocations;
        uint64_t bytes_allocated;
        uint64_t peak_object_count;

        Statistics() : total_allocations(0), bytes_allocated(0), peak_object_count(0) {}
    };

private:
    std::vector<std::unique_ptr<Object>> objects_;
    Statistics stats_;

public:
    Heap() = default;
    ~Heap();

    Heap(const Heap&) = delete;
    Heap& operator=(const Heap&) = delete;

    Object* register_object(std::unique_ptr<Object> obj, size_t size);

    size_t object_count() const { return objects_.size(); }
    const Statistics& get_statistics() const { return stats_; }
    std::string get_statistics_string() const;

    // Drops every object; outstanding handles become dangling
    void release_all();
};

}

#endif
