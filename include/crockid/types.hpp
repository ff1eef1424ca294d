#pragma once

#include <string>
#include <string_view>

namespace crockid {

using ustring = std::basic_string<unsigned char>;
using ustring_view = std::basic_string_view<unsigned char>;

}  // namespace crockid
