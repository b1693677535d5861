/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */

#ifndef STRAND_TYPES_H
#define STRAND_TYPES_H

#include <cstdint>

namespace Strand {

class Value;
class Object;
class Function;
class Symbol;
class Error;
class Completion;
class Context;
class Engine;
class Heap;

enum PropertyAttributes : uint8_t {
    None = 0,
    Writable = 1 << 0,
    Enumerable = 1 << 1,
    Configurable = 1 << 2,
    Default = Writable | Enumerable | Configurable
};

}

#endif
