#pragma once

#include <cstddef>
#include <string>

namespace anchordrop {

    inline constexpr std::size_t anchor_key_length = 8U;

    // Random version 4 UUID, lowercase 8-4-4-4-12.
    std::string generate_uuid();

    // Leading anchor_key_length characters of a fresh UUID. Not checked against existing entries.
    std::string generate_key();

}  // namespace anchordrop
