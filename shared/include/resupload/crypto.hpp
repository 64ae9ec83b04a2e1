/**
 * resupload - Random identifiers and sampling built on libsodium.
 */
#pragma once

#include <cstddef>
#include <span>
#include <string>

namespace resupload::crypto
{

    std::string to_hex(std::span<const unsigned char> data);

    // 128 random bits formatted as a version 4 UUID.
    std::string random_session_id();

    // Uniform sample in [0, 1].
    double random_unit();

} // namespace resupload::crypto
