#include "anchordrop/key.hpp"

#include <array>
#include <cstdint>
#include <random>

namespace anchordrop {

    namespace detail {

        static std::mt19937_64& rng() {
            static std::mt19937_64 gen{[] {
                std::random_device rd{};
                std::seed_seq seq{rd(), rd(), rd(), rd(), rd(), rd(), rd(), rd()};
                return std::mt19937_64{seq};
            }()};
            return gen;
        }

        static std::array<uint8_t, 16> random_uuid_bytes() {
            std::array<uint8_t, 16> bytes{};
            auto& gen = rng();
            for (std::size_t i = 0U; i < bytes.size(); i += 8U) {
                auto word = gen();
                for (std::size_t j = 0U; j < 8U; ++j) {
                    bytes[i + j] = static_cast<uint8_t>(word >> (j * 8U));
                }
            }

            // version 4, RFC 4122 variant
            bytes[6] = static_cast<uint8_t>((bytes[6] & 0x0FU) | 0x40U);
            bytes[8] = static_cast<uint8_t>((bytes[8] & 0x3FU) | 0x80U);
            return bytes;
        }

    }  // namespace detail

    std::string generate_uuid() {
        static constexpr char hex_digits[] = "0123456789abcdef";

        auto bytes = detail::random_uuid_bytes();
        std::string text{};
        text.reserve(36U);
        for (std::size_t i = 0U; i < bytes.size(); ++i) {
            if (i == 4U || i == 6U || i == 8U || i == 10U) {
                text.push_back('-');
            }
            text.push_back(hex_digits[bytes[i] >> 4U]);
            text.push_back(hex_digits[bytes[i] & 0x0FU]);
        }
        return text;
    }

    std::string generate_key() {
        return generate_uuid().substr(0U, anchor_key_length);
    }

}  // namespace anchordrop
