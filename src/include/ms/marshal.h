#pragma once

#include <ms/datetime.h>
#include <ms/dictionary.h>
#include <ms/exceptions.h>
#include <ms/fields.h>
#include <ms/json.h>
#include <ms/lexical.h>
#include <ms/log.h>
#include <ms/marshalling.h>
#include <ms/options.h>
#include <ms/reflect.h>
#include <ms/schema.h>
