#include "utils/utf8.hpp"
#include <boost/locale/utf.hpp>

namespace netcp {
namespace utils {

bool is_valid_utf8(std::string_view text) {
  using traits = boost::locale::utf::utf_traits<char>;

  const char* position = text.data();
  const char* end = text.data() + text.size();

  while (position != end) {
    boost::locale::utf::code_point cp = traits::decode(position, end);
    if (cp == boost::locale::utf::illegal || cp == boost::locale::utf::incomplete) {
      return false;
    }
  }
  return true;
}

} // namespace utils
} // namespace netcp
