#pragma once

/**
 * @file bytesplit.hpp
 * @brief Declarative binary splitting: schemas, frames and kwargifiers
 *
 * Types provided:
 * - Splitter - ordered schema of fixed and self-describing fields
 * - FieldSpec / field<T>() - one schema slot and its constructor capability
 * - VariableLengthFrame - length-prefixed frame codec (encode, decode,
 *   bundle, dispense)
 * - Kwargifier<T> - named schema that builds T eagerly or via PartialResult<T>
 * - MappingDecoder / MsgpackMappingDecoder - structured decoding of remainders
 *
 * Every decode-time failure is reported as SplitResult<T>, i.e.
 * expected<T, SplitError>. Schema-definition mistakes throw
 * std::invalid_argument when the schema is built.
 */

#include "bytesplit/detail/split_error.hpp"
#include "bytesplit/detail/split_result.hpp"
#include "bytesplit/expected.hpp"
#include "bytesplit/field_spec.hpp"
#include "bytesplit/field_value.hpp"
#include "bytesplit/frame.hpp"
#include "bytesplit/kwargifier.hpp"
#include "bytesplit/mapping.hpp"
#include "bytesplit/msgpack_mapping_decoder.hpp"
#include "bytesplit/partial_result.hpp"
#include "bytesplit/splitter.hpp"
#include "bytesplit/types.hpp"
