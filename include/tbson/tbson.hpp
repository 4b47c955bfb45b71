#pragma once

#include "./error.hpp"
#include "./extjson.hpp"
#include "./format.hpp"
#include "./raw.hpp"
#include "./result.hpp"
#include "./types.hpp"
#include "./value.hpp"

#include "./de/bson_visitor.hpp"
#include "./de/deserialize.hpp"
#include "./de/deserializer.hpp"
#include "./de/extjson_models.hpp"
#include "./de/options.hpp"
#include "./de/raw_deserializer.hpp"
#include "./de/visitor.hpp"
