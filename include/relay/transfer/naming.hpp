#pragma once

#include "relay/transfer/types.hpp"

#include <cstddef>
#include <string>

namespace relay::transfer {

/// Content type guessed from the file extension.
std::string guess_mime_type(const std::string& file_name);

/**
 * @brief Make a title safe for use as a file name
 *
 * Path separators, reserved characters and control bytes become '_'.
 * Titles longer than `max_length` bytes are cut on a UTF-8 boundary and
 * marked with "...".
 */
std::string sanitize_title(const std::string& title, std::size_t max_length);

/**
 * @brief Name of the uploaded object
 *
 * Direct transfers keep their original name. Remote resolutions use the
 * sanitized title, a " [<rung>]" suffix for video and the staged extension.
 */
std::string destination_name(const AcquiredMedia& media, std::size_t title_max_length);

} // namespace relay::transfer
