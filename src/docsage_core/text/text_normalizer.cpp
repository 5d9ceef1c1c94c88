#include "docsage_core/text/text_normalizer.hpp"

#include <utf8.h>

#include <iterator>

namespace docsage_core {

std::string TextNormalizer::normalize(std::string_view text) {
  std::string out;
  if (utf8::is_valid(text.begin(), text.end())) {
    out.assign(text.begin(), text.end());
  } else {
    out.reserve(text.size());
    utf8::replace_invalid(text.begin(), text.end(), std::back_inserter(out));
  }

  for (size_t i = 0; i < out.size(); ++i) {
    switch (out[i]) {
      case '\t':
      case '\v':
      case '\f':
      case '\0':
        out[i] = ' ';
        break;
      case '\r':
        out[i] = (i + 1 < out.size() && out[i + 1] == '\n') ? ' ' : '\n';
        break;
      case '\xC2':
        // U+00A0 NO-BREAK SPACE is encoded as C2 A0
        if (i + 1 < out.size() && out[i + 1] == '\xA0') {
          out[i] = ' ';
          out[i + 1] = ' ';
          ++i;
        }
        break;
      default:
        break;
    }
  }
  return out;
}

}  // namespace docsage_core
