#pragma once

#include <cstdint>
#include <string>
#include <vector>

uint16_t read_u16_le(const uint8_t* p);
uint32_t read_u32_le(const uint8_t* p);
void write_u16_le(std::vector<uint8_t>& out, uint16_t v);
void write_u32_le(std::vector<uint8_t>& out, uint32_t v);

float clampf(float x, float lo, float hi);

std::string to_lower(std::string s);
// case-insensitive substring match
bool contains_ci(const std::string& haystack, const std::string& needle);
