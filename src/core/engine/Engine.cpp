/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */

#include "strand/core/engine/Engine.h"
#include "strand/core/runtime/Error.h"
#include "strand/core/runtime/Iterator.h"
#include "strand/core/runtime/MapSet.h"
#include <iostream>
#include <sstream>
#include <stdexcept>

namespace Strand {


Engine::Engine() : heap_(std::make_unique<Heap>()), initialized_(false) {
}

Engine::Engine(const Config& config)
    : config_(config), heap_(std::make_unique<Heap>()), initialized_(false) {
}

Engine::~Engine() {
    shutdown();
}

bool Engine::initialize() {
    if (initialized_) {
        return true;
    }

    try {
        if (config_.max_execution_depth <= 0) {
            throw std::invalid_argument("max_execution_depth must be positive, got " +
                                        std::to_string(config_.max_execution_depth));
        }

        global_context_ = std::make_unique<Context>(this, heap_.get());
        global_context_->set_strict_mode(config_.strict_mode);
        global_context_->set_max_execution_depth(config_.max_execution_depth);

        setup_global_object();
        setup_error_types();
        setup_iterator_prototypes();
        setup_collection_prototypes();

        initialized_ = true;

        if (config_.verbose) {
            std::cerr << "[strand] engine initialized (" << heap_->get_statistics_string() << ")" << std::endl;
        }
        return true;
    } catch (const std::exception& e) {
        std::cerr << "[strand] Engine initialization failed: " << e.what() << std::endl;
        global_context_.reset();
        heap_->release_all();
        return false;
    }
}

void Engine::shutdown() {
    if (!initialized_) {
        return;
    }

    if (config_.verbose) {
        std::cerr << "[strand] engine shutdown (" << heap_->get_statistics_string() << ")" << std::endl;
    }

    global_context_.reset();
    heap_->release_all();

    initialized_ = false;
}

Context& Engine::get_global_context() const {
    if (!initialized_ || !global_context_) {
        throw std::logic_error("Engine used before initialize()");
    }
    return *global_context_;
}

void Engine::update_config(const Config& config) {
    if (initialized_) {
        throw std::logic_error("Engine configuration cannot change after initialize()");
    }
    config_ = config;
}

std::string Engine::get_memory_stats() const {
    std::ostringstream oss;
    oss << "Heap: " << heap_->get_statistics_string();
    return oss.str();
}

void Engine::setup_global_object() {
    Context& ctx = *global_context_;

    Object* object_prototype = ctx.track(ObjectFactory::create_object());
    ctx.register_built_in_object("ObjectPrototype", object_prototype);

    Object* global = ctx.track(ObjectFactory::create_object(object_prototype));
    ctx.set_global_object(global);
    ctx.register_built_in_object("GlobalObject", global);
}

void Engine::setup_error_types() {
    Context& ctx = *global_context_;

    Object* error_prototype = ctx.track(ObjectFactory::create_object(ctx.get_built_in_object("ObjectPrototype")));
    error_prototype->set_property("name", Value("Error"),
        static_cast<PropertyAttributes>(PropertyAttributes::Writable | PropertyAttributes::Configurable));
    error_prototype->set_property("message", Value(""),
        static_cast<PropertyAttributes>(PropertyAttributes::Writable | PropertyAttributes::Configurable));
    ctx.register_built_in_object("ErrorPrototype", error_prototype);

    const Error::Type native_errors[] = {
        Error::Type::TypeError,
        Error::Type::RangeError,
        Error::Type::ReferenceError
    };
    for (Error::Type type : native_errors) {
        std::string name = Error::type_to_name(type);
        Object* prototype = ctx.track(ObjectFactory::create_object(error_prototype));
        prototype->set_property("name", Value(name),
            static_cast<PropertyAttributes>(PropertyAttributes::Writable | PropertyAttributes::Configurable));
        ctx.register_built_in_object(name + "Prototype", prototype);
    }
}

void Engine::setup_iterator_prototypes() {
    Iterator::setup_iterator_prototype(*global_context_);
}

void Engine::setup_collection_prototypes() {
    Map::setup_map_prototype(*global_context_);
    Set::setup_set_prototype(*global_context_);
}

}
