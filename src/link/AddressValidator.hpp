#ifndef __SCANLINK_ADDRESS_VALIDATOR__
#define __SCANLINK_ADDRESS_VALIDATOR__

#include "Headers.hpp"

namespace scanlink {
/**
 * @brief Returns true iff the input is a dotted-quad IPv4 literal: four
 * groups of one to three decimal digits, each in [0,255].
 *
 * The input is not trimmed. Callers trim it once and then use the same value
 * both for validation and for the connection.
 */
bool validateAddress(const string& input);

/**
 * @brief Returns true iff the token is non-empty after trimming.
 */
bool validateToken(const string& input);
}  // namespace scanlink

#endif  // __SCANLINK_ADDRESS_VALIDATOR__
