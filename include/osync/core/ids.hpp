#pragma once

#include <string>

namespace osync {

/**
 * @brief Random (version 4) UUID in canonical 8-4-4-4-12 form
 *
 * Used for ChangeRecord idempotency keys, session ids and conflict ids.
 * Thread safe.
 */
std::string generate_uuid();

} // namespace osync
