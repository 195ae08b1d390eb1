#pragma once

// Version information
#define SFPP_VERSION_MAJOR 1
#define SFPP_VERSION_MINOR 0
#define SFPP_VERSION_PATCH 0

// Value model and metadata
#include "sfpp/core/exception.hpp"
#include "sfpp/core/wire_type.hpp"
#include "sfpp/core/field_metadata.hpp"
#include "sfpp/core/extended_types.hpp"
#include "sfpp/core/session_params.hpp"
#include "sfpp/core/value.hpp"
#include "sfpp/core/structured_value.hpp"

// Codecs
#include "sfpp/core/scalar_codec.hpp"
#include "sfpp/core/datetime_format.hpp"
#include "sfpp/core/structured_builder.hpp"
#include "sfpp/core/arrow_batch_adapter.hpp"
#include "sfpp/core/bind_encoder.hpp"
#include "sfpp/core/row_converter.hpp"

// Convenience namespace
namespace sfpp {
    using namespace sfpp::core;
}
