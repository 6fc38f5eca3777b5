#pragma once
#include <explorer/schema/primitives.hpp>
#include <cstdint>
#include <span>
#include <string_view>

namespace explorer::blake3 {

explorer::schema::hash32_t hash(const std::string_view& str);
explorer::schema::hash32_t hash(const explorer::schema::bytes_view_t& bytes);

}  // namespace explorer::blake3
