#pragma once
#include <cstdint>
#include <filesystem>
#include <string>

namespace stagehand {

// Fixed offsets of the PE/COFF fields touched by the patcher.
constexpr size_t PE_POINTER_OFFSET = 0x3C;        // e_lfanew, u32 LE
constexpr size_t PE_CHARACTERISTICS_DELTA = 4 + 18; // after "PE\0\0"
constexpr uint16_t IMAGE_FILE_LARGE_ADDRESS_AWARE = 0x0020;

enum class LaaResult { ALREADY_SET, NOW_SET };

// Sets the large-address-aware bit in the COFF characteristics of a Windows
// executable. ALREADY_SET means nothing was written. Bad signatures or a
// header cut short raise BinaryFormatError with the file name.
LaaResult set_large_address_aware(const std::filesystem::path& exe);

// Same check on an in-memory image; `label` names it in error messages.
LaaResult set_large_address_aware(std::string& image, const std::string& label);

// True if the bit is set. Same validation as above, never modifies.
bool is_large_address_aware(const std::string& image, const std::string& label);

} // namespace stagehand
