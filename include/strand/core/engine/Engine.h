/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */

#ifndef STRAND_ENGINE_H
#define STRAND_ENGINE_H

#include "strand/core/runtime/Value.h"
#include "strand/core/runtime/Object.h"
#include "strand/core/engine/Context.h"
#include "strand/core/gc/Heap.h"
#include <string>
#include <memory>

namespace Strand {

/**
 * Runtime engine
 * Owns the heap and the global context and installs the intrinsics the
 * iteration builtins rely on.
 */
class Engine {
public:
    struct Config {
        bool strict_mode = false;
        int max_execution_depth = 500;
        bool verbose = false;
    };

private:
    Config config_;
    std::unique_ptr<Heap> heap_;
    std::unique_ptr<Context> global_context_;
    bool initialized_;

public:
    Engine();
    explicit Engine(const Config& config);
    ~Engine();

    Engine(const Engine&) = delete;
    Engine& operator=(const Engine&) = delete;

    bool initialize();
    void shutdown();
    bool is_initialized() const { return initialized_; }

    // Throws std::logic_error before initialize()
    Context& get_global_context() const;

    Heap* get_heap() const { return heap_.get(); }

    const Config& get_config() const { return config_; }
    void update_config(const Config& config);

    std::string get_memory_stats() const;

private:
    void setup_global_object();
    void setup_error_types();
    void setup_iterator_prototypes();
    void setup_collection_prototypes();
};

}

#endif
