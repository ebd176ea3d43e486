#pragma once

#include <string_view>

namespace tei_standoff {

bool lookup_html_entity(std::string_view name, char32_t& out_code);

}  // namespace tei_standoff
