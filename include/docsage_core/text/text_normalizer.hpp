#pragma once

#include <string>
#include <string_view>

namespace docsage_core {

class TextNormalizer {
 public:
  /**
   * @brief Canonicalizes whitespace in extracted page text.
   *
   * Tabs, vertical tabs, form feeds and NUL bytes become spaces, CR LF becomes
   * " \n", a lone CR becomes "\n" and a no-break space becomes two spaces.
   * None of these change the byte length, so offsets into the result line up
   * with offsets into the input. The one exception is invalid UTF-8, which is
   * replaced by U+FFFD before anything else runs.
   *
   * @param text Raw page text, any encoding garbage included.
   * @return The normalized text. Never throws.
   */
  static std::string normalize(std::string_view text);
};

}  // namespace docsage_core
