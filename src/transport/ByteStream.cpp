#include "mercury-itc/transport/ByteStream.hpp"
#include <cctype>

namespace mercuryitc {
namespace transport {

std::string rstrip(const std::string &text) {
  size_t end = text.size();
  while (end > 0 && std::isspace(static_cast<unsigned char>(text[end - 1])))
    --end;
  return text.substr(0, end);
}

} // namespace transport
} // namespace mercuryitc
