#ifndef MODELDIFF_CORE_H
#define MODELDIFF_CORE_H

#include <modeldiff/core/dynamic.h>
#include <modeldiff/core/exception.h>
#include <modeldiff/core/type_definitions.h>
#include <modeldiff/core/utilities.h>

#endif
