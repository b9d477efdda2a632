#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace patchy {
namespace hash {

uint32_t
hash(const char* input, std::size_t len);

uint32_t
hash(const uint8_t* input, std::size_t len);

uint32_t
hash(const std::string& input);

}  // namespace hash
}  // namespace patchy
