#ifndef __SCANLINK_QR_PAYLOAD__
#define __SCANLINK_QR_PAYLOAD__

#include "Headers.hpp"

namespace scanlink {
/** @brief Decodes %XX escapes and '+' in a URL query component. */
string percentDecode(const string& s);

/**
 * @brief Extracts pairing fields from the text of a pairing QR code.
 *
 * Understands
 *   roomscan://pair?token=T&host=H[&port=P]
 *   http(s)://H[:P]/download/T/...
 *   http(s)://H[:P]/...?token=T[&host=H2]
 *
 * Fields the code does not carry are left unset.
 * @return nullopt with *error filled in if the text is not a pairing code.
 */
optional<QrScanResult> parseQrPayload(const string& text, string* error);
}  // namespace scanlink

#endif  // __SCANLINK_QR_PAYLOAD__
