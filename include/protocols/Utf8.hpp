#pragma once
/** @file  Utf8.hpp
 *  @brief Strict UTF-8 check for subprocess output and socket records.
 *
 *  © 2025 HyprDock - MIT-licensed.
 */

// STL headers
#include <cstddef>
#include <cstdint>
#include <string_view>

namespace hyprdock {
  namespace protocols {

    /// Rejects truncated sequences, overlong forms, surrogates and code points > U+10FFFF.
    inline bool isValidUtf8(std::string_view bytes) {
      std::size_t i = 0;
      while (i < bytes.size()) {
        const auto c = static_cast<std::uint8_t>(bytes[i]);
        std::size_t len = 0;
        std::uint32_t cp = 0;
        if (c < 0x80) {
          ++i;
          continue;
        } else if ((c & 0xE0) == 0xC0) {
          len = 2;
          cp = c & 0x1F;
        } else if ((c & 0xF0) == 0xE0) {
          len = 3;
          cp = c & 0x0F;
        } else if ((c & 0xF8) == 0xF0) {
          len = 4;
          cp = c & 0x07;
        } else {
          return false;
        }

        if (i + len > bytes.size())
          return false;
        for (std::size_t k = 1; k < len; ++k) {
          const auto cc = static_cast<std::uint8_t>(bytes[i + k]);
          if ((cc & 0xC0) != 0x80)
            return false;
          cp = (cp << 6) | (cc & 0x3F);
        }

        if ((len == 2 && cp < 0x80) || (len == 3 && cp < 0x800) || (len == 4 && cp < 0x10000))
          return false; // overlong
        if (cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF))
          return false;
        i += len;
      }
      return true;
    }

  } // namespace protocols
} // namespace hyprdock
