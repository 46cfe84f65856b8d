#ifndef SRC_INWASM_H_
#define SRC_INWASM_H_

// Public API of the runtime loader and the compile pipeline. The V8 binding
// is declared separately in inwasm_v8_host.h and inwasm_v8_engine.h.

#include "inwasm_capture.h"
#include "inwasm_codec.h"
#include "inwasm_compiler.h"
#include "inwasm_definition.h"
#include "inwasm_engine.h"
#include "inwasm_errors.h"
#include "inwasm_loader.h"
#include "inwasm_options.h"
#include "inwasm_typed.h"

#define INWASM_MAJOR_VERSION 0
#define INWASM_MINOR_VERSION 1
#define INWASM_PATCH_VERSION 0

#endif  // SRC_INWASM_H_
