#pragma once

/**
 * derkit - DER/BER ASN.1 decoding
 *
 * Schema-less inspection:
 *
 *      derkit::Cursor cursor(bytes);
 *      auto value = derkit::parse_one(cursor);
 *      if (value.ok) {
 *          auto seq = value.value.as_sequence();
 *          auto it = seq.value.iterator(value.value.payload_offset());
 *          while (auto next = it.next()) {
 *              if (!next.value) break;
 *              // *next.value is one element
 *          }
 *      }
 *
 * Typed decoding (see decode.hpp for the supported shapes):
 *
 *      auto key = derkit::decode<RsaPublicKey>(bytes);
 */

#include "derkit/cursor.hpp"
#include "derkit/decode.hpp"
#include "derkit/dump.hpp"
#include "derkit/error.hpp"
#include "derkit/header.hpp"
#include "derkit/options.hpp"
#include "derkit/tagging.hpp"
#include "derkit/value.hpp"
